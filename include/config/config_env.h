/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * PARLEY Configuration Environment - Environment variable overrides
 */

#ifndef CONFIG_ENV_H
#define CONFIG_ENV_H

#include <stdio.h>

#include "config/parley_config.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Apply environment variable overrides to configuration
 *
 * Environment variable format: PARLEY_<SECTION>_<KEY>
 * Examples:
 *   PARLEY_SERVER_URL=wss://example.com/v1/chat
 *   PARLEY_SERVER_ACCESS_TOKEN=pat_xxx
 *   PARLEY_AUDIO_CHUNK_BYTES=320
 *   PARLEY_SESSION_BARGE_IN=false
 *
 * Booleans accept true/false, yes/no, on/off and 1/0. A value that does not
 * parse is ignored with a warning and the previous value is kept.
 *
 * @param config Config struct to modify
 * @return Number of overrides applied
 */
int config_apply_env(parley_config_t *config);

/**
 * @brief Dump configuration as TOML
 *
 * Prints configuration in TOML format that can be saved to a file.
 * The access token is masked. Used by the --dump-config CLI option.
 *
 * @param config Configuration to dump
 * @param out Destination stream
 */
void config_dump_toml(const parley_config_t *config, FILE *out);

#ifdef __cplusplus
}
#endif

#endif /* CONFIG_ENV_H */
