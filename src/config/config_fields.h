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
 * Config field table - one entry per recognized section.key
 *
 * Shared by the TOML parser, the environment overrides and the dump so the
 * three always agree on names and types. Internal to the config module.
 */

#ifndef CONFIG_FIELDS_H
#define CONFIG_FIELDS_H

#include <stddef.h>

#include "config/parley_config.h"

typedef enum {
   CONFIG_FIELD_STRING,
   CONFIG_FIELD_BOOL,
   CONFIG_FIELD_INT,
   CONFIG_FIELD_UINT,
} config_field_type_t;

typedef struct {
   const char *section;
   const char *key;
   config_field_type_t type;
   size_t offset; /* offsetof into parley_config_t */
   size_t size;   /* buffer size for strings */
   bool secret;   /* masked in dumps */
} config_field_t;

/**
 * @brief Get the field table
 *
 * @param count_out Receives the number of entries
 * @return Static table, grouped by section in file order
 */
const config_field_t *config_fields(size_t *count_out);

/**
 * @brief Find a field by section and key (exact, lowercase)
 *
 * @return Field entry, or NULL if unknown
 */
const config_field_t *config_field_find(const char *section, const char *key);

/**
 * @brief Assign a field from its textual form
 *
 * Integers must be complete decimal numbers, booleans accept
 * true/false, yes/no, on/off, 1/0. Strings longer than the field are
 * rejected rather than truncated.
 *
 * @return 0 on success, 1 if the text does not parse for the field type
 */
int config_field_set_text(parley_config_t *config, const config_field_t *field, const char *text);

/**
 * @brief Set a string field, rejecting values that do not fit
 *
 * @return 0 on success, 1 if too long
 */
int config_field_set_string(parley_config_t *config, const config_field_t *field, const char *value);

/**
 * @brief Set a numeric field from a 64-bit integer, rejecting values outside the C type
 *
 * @return 0 on success, 1 if out of range for the field
 */
int config_field_set_int(parley_config_t *config, const config_field_t *field, long long value);

void config_field_set_bool(parley_config_t *config, const config_field_t *field, bool value);

/**
 * @brief Format a field value (TOML syntax, strings quoted and escaped)
 */
void config_field_format(const parley_config_t *config,
                         const config_field_t *field,
                         char *buf,
                         size_t buf_size);

#endif /* CONFIG_FIELDS_H */
