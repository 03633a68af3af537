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
 * Logging Bridge - Connects the common logging callback to stderr
 *
 * Call logging_bridge_init() early in main() so the engine, the config
 * loader and the host adapters all log through one place.
 */

#ifndef LOGGING_BRIDGE_H
#define LOGGING_BRIDGE_H

#include "logging_common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Initialize the logging bridge
 *
 * Registers a stderr logger with the common library. Each line carries a
 * local timestamp, the level, file:line and function.
 *
 * Thread Safety: This function is NOT thread-safe. Call it once at
 * initialization before starting any other threads. The registered logger
 * itself is thread-safe.
 *
 * @param min_level Messages below this level are discarded
 */
void logging_bridge_init(parley_log_level_t min_level);

/**
 * @brief Change the level filter after init (e.g. once the config is loaded)
 */
void logging_bridge_set_level(parley_log_level_t min_level);

#ifdef __cplusplus
}
#endif

#endif /* LOGGING_BRIDGE_H */
