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

#ifndef PARLEY_COMMON_RING_BUFFER_H
#define PARLEY_COMMON_RING_BUFFER_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Thread-safe bounded ring of audio chunks
 *
 * Fixed number of fixed-size slots, allocated once at creation. One producer
 * pushes chunks, one consumer pops them. When the ring is full the overflow
 * policy decides what happens:
 *
 * - RING_BUFFER_DROP_OLDEST: the oldest chunk is discarded so the newest one
 *   fits (playback: keeps latency from building up).
 * - RING_BUFFER_REJECT: the push fails and the producer keeps its chunk
 *   (capture-to-network: backpressure instead of losing user speech).
 *
 * The ring never grows.
 */
typedef struct ring_buffer ring_buffer_t;

/**
 * @brief Overflow policy
 */
typedef enum {
   RING_BUFFER_DROP_OLDEST = 0,
   RING_BUFFER_REJECT = 1,
} ring_buffer_policy_t;

/**
 * @brief Push result codes (positive values, 0 = success)
 */
typedef enum {
   RING_BUFFER_OK = 0,          /**< Chunk stored */
   RING_BUFFER_DROPPED = 1,     /**< Chunk stored, oldest chunk discarded */
   RING_BUFFER_FULL = 2,        /**< Ring full (REJECT policy), nothing stored */
   RING_BUFFER_ERR_INVALID = 3, /**< NULL ring/data, empty chunk or chunk larger than a slot */
} ring_buffer_result_t;

/**
 * @brief Create a new chunk ring
 *
 * @param slot_size Maximum bytes per chunk
 * @param capacity Number of chunk slots
 * @param policy Overflow policy
 * @return Newly allocated ring, or NULL on error
 */
ring_buffer_t *ring_buffer_create(size_t slot_size, size_t capacity, ring_buffer_policy_t policy);

/**
 * @brief Free a ring buffer and all associated resources
 *
 * @param rb Ring buffer to free (can be NULL)
 */
void ring_buffer_free(ring_buffer_t *rb);

/**
 * @brief Push one chunk (producer)
 *
 * Thread-safe: can be called concurrently with ring_buffer_pop().
 *
 * @param rb Ring buffer
 * @param data Chunk data
 * @param len Chunk length in bytes (1..slot_size)
 * @return RING_BUFFER_OK, RING_BUFFER_DROPPED, RING_BUFFER_FULL or RING_BUFFER_ERR_INVALID
 */
int ring_buffer_push(ring_buffer_t *rb, const uint8_t *data, size_t len);

/**
 * @brief Pop the oldest chunk (consumer)
 *
 * Non-blocking. Copies at most out_size bytes; a longer chunk is truncated.
 *
 * @param rb Ring buffer
 * @param out Destination buffer
 * @param out_size Destination size in bytes
 * @return Bytes copied, 0 if the ring is empty
 */
size_t ring_buffer_pop(ring_buffer_t *rb, uint8_t *out, size_t out_size);

/**
 * @brief Wait until at least one chunk is available
 *
 * @param rb Ring buffer
 * @param timeout_ms Timeout in milliseconds (0 = return immediately)
 * @return Number of chunks available, 0 on timeout
 */
size_t ring_buffer_wait_for_data(ring_buffer_t *rb, int timeout_ms);

/**
 * @brief Number of chunks currently stored
 */
size_t ring_buffer_count(ring_buffer_t *rb);

/**
 * @brief Number of free slots
 */
size_t ring_buffer_free_slots(ring_buffer_t *rb);

/**
 * @brief Slot count the ring was created with
 */
size_t ring_buffer_capacity(const ring_buffer_t *rb);

/**
 * @brief Total chunks discarded by the DROP_OLDEST policy since creation
 */
uint64_t ring_buffer_dropped(ring_buffer_t *rb);

/**
 * @brief Discard all stored chunks
 *
 * Used on barge-in and teardown. The dropped counter is not affected.
 *
 * @param rb Ring buffer
 */
void ring_buffer_clear(ring_buffer_t *rb);

#ifdef __cplusplus
}
#endif

#endif /* PARLEY_COMMON_RING_BUFFER_H */
