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
 */

#include "logging_common.h"

#include <strings.h>

namespace {

parley_log_callback_t g_log_callback = nullptr;

}  // namespace

extern "C" {

void parley_common_set_logger(parley_log_callback_t callback) {
   g_log_callback = callback;
}

void parley_common_log(parley_log_level_t level,
                       const char *file,
                       int line,
                       const char *func,
                       const char *fmt,
                       ...) {
   if (!g_log_callback || !fmt)
      return;

   va_list args;
   va_start(args, fmt);
   g_log_callback(level, file, line, func, fmt, args);
   va_end(args);
}

int parley_log_level_parse(const char *name, parley_log_level_t *level_out) {
   if (!name || !level_out)
      return 1;

   if (strcasecmp(name, "info") == 0) {
      *level_out = PARLEY_LOG_INFO;
   } else if (strcasecmp(name, "warning") == 0 || strcasecmp(name, "warn") == 0) {
      *level_out = PARLEY_LOG_WARNING;
   } else if (strcasecmp(name, "error") == 0) {
      *level_out = PARLEY_LOG_ERROR;
   } else {
      return 1;
   }
   return 0;
}

const char *parley_log_level_name(parley_log_level_t level) {
   switch (level) {
      case PARLEY_LOG_INFO:
         return "INFO";
      case PARLEY_LOG_WARNING:
         return "WARNING";
      case PARLEY_LOG_ERROR:
         return "ERROR";
      default:
         return "UNKNOWN";
   }
}

} /* extern "C" */
