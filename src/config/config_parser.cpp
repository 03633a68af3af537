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
 * PARLEY Configuration Parser - TOML file parsing (tomlc99)
 */

#include "config/config_parser.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include <toml.h>

#include "config_fields.h"
#include "logging_common.h"

namespace {

const char *const kSections[] = { "server", "audio", "vad", "session", "controller", "logging" };

/* Path of the file loaded by config_load_from_search() */
char g_loaded_path[CONFIG_URL_MAX] = "";

bool known_section(const char *name) {
   for (const char *section : kSections) {
      if (strcmp(section, name) == 0)
         return true;
   }
   return false;
}

std::string expand_home(const char *path) {
   if (path[0] == '~' && path[1] == '/') {
      const char *home = getenv("HOME");
      if (home && home[0])
         return std::string(home) + (path + 1);
   }
   return std::string(path);
}

/**
 * @brief Apply one TOML value to its config field
 *
 * @return 0 on success, 1 on a type or range mismatch
 */
int apply_value(toml_table_t *table, const char *key, const config_field_t *field,
                parley_config_t *config) {
   switch (field->type) {
      case CONFIG_FIELD_STRING: {
         toml_datum_t d = toml_string_in(table, key);
         if (!d.ok) {
            PARLEY_LOG_ERROR("Config: %s.%s must be a string", field->section, key);
            return 1;
         }
         int rc = config_field_set_string(config, field, d.u.s);
         free(d.u.s);
         if (rc != 0) {
            PARLEY_LOG_ERROR("Config: %s.%s is too long (max %zu)", field->section, key,
                             field->size - 1);
            return 1;
         }
         return 0;
      }
      case CONFIG_FIELD_BOOL: {
         toml_datum_t d = toml_bool_in(table, key);
         if (!d.ok) {
            PARLEY_LOG_ERROR("Config: %s.%s must be true or false", field->section, key);
            return 1;
         }
         config_field_set_bool(config, field, d.u.b != 0);
         return 0;
      }
      case CONFIG_FIELD_INT:
      case CONFIG_FIELD_UINT: {
         toml_datum_t d = toml_int_in(table, key);
         if (!d.ok) {
            PARLEY_LOG_ERROR("Config: %s.%s must be an integer", field->section, key);
            return 1;
         }
         if (config_field_set_int(config, field, static_cast<long long>(d.u.i)) != 0) {
            PARLEY_LOG_ERROR("Config: %s.%s value %lld out of range", field->section, key,
                             static_cast<long long>(d.u.i));
            return 1;
         }
         return 0;
      }
   }
   return 1;
}

int apply_section(toml_table_t *table, const char *section, parley_config_t *config) {
   int errors = 0;

   for (int i = 0;; i++) {
      const char *key = toml_key_in(table, i);
      if (!key)
         break;

      const config_field_t *field = config_field_find(section, key);
      if (!field) {
         PARLEY_LOG_WARNING("Config: ignoring unknown key '%s.%s'", section, key);
         continue;
      }
      if (apply_value(table, key, field, config) != 0)
         errors++;
   }
   return errors;
}

int apply_document(toml_table_t *root, parley_config_t *config) {
   int errors = 0;

   for (int i = 0;; i++) {
      const char *key = toml_key_in(root, i);
      if (!key)
         break;

      if (!known_section(key)) {
         PARLEY_LOG_WARNING("Config: ignoring unknown section '[%s]'", key);
         continue;
      }
      toml_table_t *table = toml_table_in(root, key);
      if (!table) {
         PARLEY_LOG_ERROR("Config: '%s' must be a table", key);
         errors++;
         continue;
      }
      errors += apply_section(table, key, config);
   }
   return errors == 0 ? 0 : 1;
}

}  // namespace

extern "C" {

int config_parse_file(const char *path, parley_config_t *config) {
   if (!path || !config)
      return 1;

   std::string full_path = expand_home(path);
   FILE *fp = fopen(full_path.c_str(), "r");
   if (!fp) {
      PARLEY_LOG_ERROR("Config: cannot open %s", full_path.c_str());
      return 1;
   }

   char errbuf[256];
   toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
   fclose(fp);

   if (!root) {
      PARLEY_LOG_ERROR("Config: parse error in %s: %s", full_path.c_str(), errbuf);
      return 1;
   }

   int rc = apply_document(root, config);
   toml_free(root);
   return rc;
}

int config_parse_string(const char *text, parley_config_t *config) {
   if (!text || !config)
      return 1;

   /* toml_parse() takes a mutable buffer */
   std::string buffer(text);
   char errbuf[256];
   toml_table_t *root = toml_parse(&buffer[0], errbuf, sizeof(errbuf));
   if (!root) {
      PARLEY_LOG_ERROR("Config: parse error: %s", errbuf);
      return 1;
   }

   int rc = apply_document(root, config);
   toml_free(root);
   return rc;
}

int config_file_readable(const char *path) {
   if (!path || !path[0])
      return 0;
   return access(expand_home(path).c_str(), R_OK) == 0;
}

int config_load_from_search(const char *explicit_path, parley_config_t *config) {
   if (!config)
      return 1;

   g_loaded_path[0] = '\0';

   if (explicit_path && explicit_path[0]) {
      if (!config_file_readable(explicit_path)) {
         PARLEY_LOG_ERROR("Config: file not found: %s", explicit_path);
         return 1;
      }
      if (config_parse_file(explicit_path, config) != 0)
         return 1;
      snprintf(g_loaded_path, sizeof(g_loaded_path), "%s", explicit_path);
      PARLEY_LOG_INFO("Config: loaded %s", explicit_path);
      return 0;
   }

   const char *const candidates[] = { CONFIG_PATH_LOCAL, CONFIG_PATH_HOME, CONFIG_PATH_ETC };
   for (const char *candidate : candidates) {
      if (!config_file_readable(candidate))
         continue;
      if (config_parse_file(candidate, config) != 0)
         return 1;
      snprintf(g_loaded_path, sizeof(g_loaded_path), "%s", candidate);
      PARLEY_LOG_INFO("Config: loaded %s", candidate);
      return 0;
   }

   PARLEY_LOG_INFO("Config: no config file found, using defaults");
   return 0;
}

const char *config_get_loaded_path(void) {
   return g_loaded_path[0] ? g_loaded_path : "(none - using defaults)";
}

} /* extern "C" */
