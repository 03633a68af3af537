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

#include "logging_bridge.h"

#include <stdio.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>

#include <atomic>
#include <mutex>

namespace {

std::atomic<int> g_min_level(PARLEY_LOG_INFO);
std::mutex g_log_mutex;

const char *base_name(const char *path) {
   if (!path)
      return "?";
   const char *slash = strrchr(path, '/');
   return slash ? slash + 1 : path;
}

void stderr_logger(parley_log_level_t level,
                   const char *file,
                   int line,
                   const char *func,
                   const char *fmt,
                   va_list args) {
   if (static_cast<int>(level) < g_min_level.load())
      return;

   struct timeval tv;
   gettimeofday(&tv, NULL);
   struct tm tm_local;
   localtime_r(&tv.tv_sec, &tm_local);

   char stamp[32];
   strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_local);

   std::lock_guard<std::mutex> lock(g_log_mutex);
   fprintf(stderr, "[%s.%03ld] [%-7s] %s:%d %s(): ", stamp, static_cast<long>(tv.tv_usec / 1000),
           parley_log_level_name(level), base_name(file), line, func ? func : "?");
   vfprintf(stderr, fmt, args);
   fputc('\n', stderr);
}

}  // namespace

extern "C" {

void logging_bridge_init(parley_log_level_t min_level) {
   g_min_level.store(static_cast<int>(min_level));
   parley_common_set_logger(stderr_logger);
}

void logging_bridge_set_level(parley_log_level_t min_level) {
   g_min_level.store(static_cast<int>(min_level));
}

} /* extern "C" */
