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
 * PARLEY Configuration Parser - TOML file parsing interface
 */

#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include "config/parley_config.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Parse a TOML configuration file into a config struct
 *
 * Fields not specified in the file retain their current values.
 * Unknown sections and keys are ignored with a warning.
 *
 * @param path Path to the TOML config file
 * @param config Config struct to populate (should be pre-initialized with defaults)
 * @return 0 on success, 1 on failure (unreadable file or TOML syntax error)
 */
int config_parse_file(const char *path, parley_config_t *config);

/**
 * @brief Parse TOML text held in memory
 *
 * Same rules as config_parse_file().
 *
 * @param text NUL-terminated TOML document
 * @param config Config struct to populate
 * @return 0 on success, 1 on syntax error
 */
int config_parse_string(const char *text, parley_config_t *config);

/**
 * @brief Check if a configuration file exists and is readable
 *
 * Note: This function returns a boolean (true/false), NOT SUCCESS/FAILURE.
 *
 * @param path Path to check (a leading "~/" is expanded)
 * @return non-zero if the file exists and is readable, 0 otherwise
 */
int config_file_readable(const char *path);

/**
 * @brief Find and load the configuration file
 *
 * Searches for config files in order:
 * 1. --config=PATH (if provided; must exist)
 * 2. ./parley.toml
 * 3. ~/.config/parley/parley.toml
 * 4. /etc/parley/parley.toml
 *
 * @param explicit_path Explicit path from command line (NULL to use search)
 * @param config Config struct to populate
 * @return 0 if a file was loaded or none was found (defaults kept),
 *         1 if the explicit file is missing or any found file fails to parse
 */
int config_load_from_search(const char *explicit_path, parley_config_t *config);

/**
 * @brief Get the path to the loaded config file
 *
 * @return Path string, or "(none - using defaults)" if no file was loaded
 */
const char *config_get_loaded_path(void);

#ifdef __cplusplus
}
#endif

#endif /* CONFIG_PARSER_H */
