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

#include "session/reconnect_backoff.h"

extern "C" {

void reconnect_backoff_init(reconnect_backoff_t *b, uint32_t base_ms, uint32_t cap_ms, int max_attempts) {
   if (!b)
      return;
   b->base_ms = base_ms;
   b->cap_ms = cap_ms < base_ms ? base_ms : cap_ms;
   b->max_attempts = max_attempts;
   b->failures = 0;
}

uint32_t reconnect_backoff_delay_ms(const reconnect_backoff_t *b, int n) {
   if (!b || n <= 0)
      return 0;

   uint64_t delay = b->base_ms;
   for (int i = 1; i < n && delay < b->cap_ms; i++)
      delay *= 2;

   return delay > b->cap_ms ? b->cap_ms : static_cast<uint32_t>(delay);
}

uint32_t reconnect_backoff_fail(reconnect_backoff_t *b) {
   if (!b)
      return 0;
   b->failures++;
   return reconnect_backoff_delay_ms(b, b->failures);
}

void reconnect_backoff_reset(reconnect_backoff_t *b) {
   if (b)
      b->failures = 0;
}

bool reconnect_backoff_exhausted(const reconnect_backoff_t *b) {
   return b && b->failures >= b->max_attempts;
}

} /* extern "C" */
