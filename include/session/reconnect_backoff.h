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

#ifndef RECONNECT_BACKOFF_H
#define RECONNECT_BACKOFF_H

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Consecutive-failure tracker with exponential delay
 *
 * delay(n) = min(cap_ms, base_ms * 2^(n-1)) for n consecutive failures.
 */
typedef struct {
   uint32_t base_ms;
   uint32_t cap_ms;
   int max_attempts;
   int failures; /* Consecutive failures since the last success */
} reconnect_backoff_t;

void reconnect_backoff_init(reconnect_backoff_t *b, uint32_t base_ms, uint32_t cap_ms, int max_attempts);

/**
 * @brief Delay before the next attempt after n consecutive failures
 *
 * @return 0 for n <= 0
 */
uint32_t reconnect_backoff_delay_ms(const reconnect_backoff_t *b, int n);

/**
 * @brief Record a failure
 *
 * @return Delay before the next attempt
 */
uint32_t reconnect_backoff_fail(reconnect_backoff_t *b);

/**
 * @brief Record a success (connection established)
 */
void reconnect_backoff_reset(reconnect_backoff_t *b);

/**
 * @brief True once consecutive failures reached max_attempts
 */
bool reconnect_backoff_exhausted(const reconnect_backoff_t *b);

#ifdef __cplusplus
}
#endif

#endif /* RECONNECT_BACKOFF_H */
