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
 * PARLEY Configuration Environment - PARLEY_<SECTION>_<KEY> overrides and dump
 */

#include "config/config_env.h"

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include "config_fields.h"
#include "logging_common.h"

namespace {

void build_env_name(const config_field_t *field, char *buf, size_t buf_size) {
   snprintf(buf, buf_size, "PARLEY_%s_%s", field->section, field->key);
   for (char *p = buf; *p; p++)
      *p = static_cast<char>(toupper(static_cast<unsigned char>(*p)));
}

}  // namespace

extern "C" {

int config_apply_env(parley_config_t *config) {
   if (!config)
      return 0;

   size_t count = 0;
   const config_field_t *fields = config_fields(&count);
   int applied = 0;

   for (size_t i = 0; i < count; i++) {
      char name[128];
      build_env_name(&fields[i], name, sizeof(name));

      const char *value = getenv(name);
      if (!value)
         continue;

      if (config_field_set_text(config, &fields[i], value) != 0) {
         PARLEY_LOG_WARNING("Config: ignoring %s: invalid value", name);
         continue;
      }
      applied++;
   }

   if (applied > 0)
      PARLEY_LOG_INFO("Config: %d environment override(s) applied", applied);
   return applied;
}

void config_dump_toml(const parley_config_t *config, FILE *out) {
   if (!config || !out)
      return;

   size_t count = 0;
   const config_field_t *fields = config_fields(&count);
   const char *section = NULL;

   fprintf(out, "# parley configuration\n");
   for (size_t i = 0; i < count; i++) {
      const config_field_t *field = &fields[i];

      if (!section || strcmp(section, field->section) != 0) {
         section = field->section;
         fprintf(out, "\n[%s]\n", section);
      }

      char value[CONFIG_URL_MAX + 64];
      if (field->secret) {
         const char *raw = reinterpret_cast<const char *>(config) + field->offset;
         snprintf(value, sizeof(value), "\"%s\"", raw[0] ? "********" : "");
      } else {
         config_field_format(config, field, value, sizeof(value));
      }
      fprintf(out, "%s = %s\n", field->key, value);
   }
}

} /* extern "C" */
