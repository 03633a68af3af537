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
 * Common Logging Interface - Callback-based logging for the session engine
 *
 * The engine and its buffers log through this callback so they carry no
 * dependency on how the host program writes logs. The program registers
 * its callback at startup (see logging_bridge.h); unit tests register
 * nothing and run silent.
 */

#ifndef PARLEY_COMMON_LOGGING_COMMON_H
#define PARLEY_COMMON_LOGGING_COMMON_H

#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Log level enumeration
 */
typedef enum {
   PARLEY_LOG_INFO = 0,
   PARLEY_LOG_WARNING = 1,
   PARLEY_LOG_ERROR = 2,
} parley_log_level_t;

/**
 * @brief Callback function type for logging
 *
 * @param level Log level (PARLEY_LOG_INFO, PARLEY_LOG_WARNING, PARLEY_LOG_ERROR)
 * @param file Source file name (from __FILE__)
 * @param line Line number (from __LINE__)
 * @param func Function name (from __func__)
 * @param fmt Printf-style format string
 * @param args Variable arguments list
 */
typedef void (*parley_log_callback_t)(parley_log_level_t level,
                                      const char *file,
                                      int line,
                                      const char *func,
                                      const char *fmt,
                                      va_list args);

/**
 * @brief Set the logging callback
 *
 * If not set, log messages are discarded.
 *
 * Thread Safety: This function is NOT thread-safe. Call it once at
 * initialization before any other threads are started.
 *
 * @param callback The logging callback function, or NULL to disable logging
 */
void parley_common_set_logger(parley_log_callback_t callback);

/**
 * @brief Internal logging function - do not call directly
 *
 * Use the PARLEY_LOG_* macros instead.
 */
void parley_common_log(parley_log_level_t level,
                       const char *file,
                       int line,
                       const char *func,
                       const char *fmt,
                       ...);

/**
 * @brief Parse a level name ("info", "warning", "error")
 *
 * @param name Level name (case-insensitive)
 * @param level_out Receives the parsed level
 * @return 0 on success, 1 if the name is not a level
 */
int parley_log_level_parse(const char *name, parley_log_level_t *level_out);

/**
 * @brief Get level name for display
 */
const char *parley_log_level_name(parley_log_level_t level);

#define PARLEY_LOG_INFO(fmt, ...) \
   parley_common_log(PARLEY_LOG_INFO, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define PARLEY_LOG_WARNING(fmt, ...) \
   parley_common_log(PARLEY_LOG_WARNING, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define PARLEY_LOG_ERROR(fmt, ...) \
   parley_common_log(PARLEY_LOG_ERROR, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#ifdef __cplusplus
}
#endif

#endif /* PARLEY_COMMON_LOGGING_COMMON_H */
