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

#include "network/ws_url.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>

extern "C" int ws_url_parse(const char *url, const char *bot_id, ws_url_t *out) {
   if (!url || !out)
      return 1;

   memset(out, 0, sizeof(*out));

   const char *rest = NULL;
   if (strncmp(url, "wss://", 6) == 0) {
      out->tls = true;
      out->port = 443;
      rest = url + 6;
   } else if (strncmp(url, "ws://", 5) == 0) {
      out->tls = false;
      out->port = 80;
      rest = url + 5;
   } else {
      return 1;
   }

   size_t authority_len = strcspn(rest, "/?");
   if (authority_len == 0)
      return 1;

   std::string authority(rest, authority_len);
   const char *tail = rest + authority_len;

   /* host[:port] (no IPv6 literals) */
   size_t colon = authority.find(':');
   std::string host = authority.substr(0, colon);
   if (host.empty() || host.size() >= sizeof(out->host))
      return 1;

   if (colon != std::string::npos) {
      std::string port = authority.substr(colon + 1);
      char *end = NULL;
      long value = strtol(port.c_str(), &end, 10);
      if (port.empty() || !end || *end != '\0' || value < 1 || value > 65535)
         return 1;
      out->port = static_cast<int>(value);
   }
   snprintf(out->host, sizeof(out->host), "%s", host.c_str());

   std::string path = (*tail == '/') ? std::string(tail) : std::string("/") + tail;
   if (bot_id && bot_id[0] && path.find("bot_id=") == std::string::npos) {
      path += (path.find('?') == std::string::npos) ? "?" : "&";
      path += "bot_id=";
      path += bot_id;
   }
   if (path.size() >= sizeof(out->path))
      return 1;
   snprintf(out->path, sizeof(out->path), "%s", path.c_str());

   return 0;
}
