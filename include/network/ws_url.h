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

#ifndef WS_URL_H
#define WS_URL_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

#define WS_URL_HOST_SIZE 256
#define WS_URL_PATH_SIZE 768

/**
 * @brief Parsed ws:// or wss:// endpoint
 */
typedef struct {
   bool tls;
   char host[WS_URL_HOST_SIZE];
   int port;                    /* Explicit port, else 80 / 443 */
   char path[WS_URL_PATH_SIZE]; /* Path plus query, always starts with '/' */
} ws_url_t;

/**
 * @brief Split an endpoint URL into connection parameters
 *
 * When bot_id is non-empty it is appended as a bot_id query parameter
 * (unless the URL already carries one).
 *
 * @param url ws://host[:port][/path][?query] or wss://...
 * @param bot_id Bot id to append (can be NULL)
 * @param out Receives the parts
 * @return 0 on success, 1 on a malformed URL or a part that does not fit
 */
int ws_url_parse(const char *url, const char *bot_id, ws_url_t *out);

#ifdef __cplusplus
}
#endif

#endif /* WS_URL_H */
