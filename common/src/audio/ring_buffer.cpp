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

#include "audio/ring_buffer.h"

#include <errno.h>
#include <pthread.h>
#include <string.h>
#include <time.h>

#include <new>
#include <vector>

#include "logging_common.h"

/**
 * @brief Internal ring structure
 *
 * Slot i lives at storage[i * slot_size] with its used length in lengths[i].
 * head = next slot to write, tail = next slot to read.
 */
struct ring_buffer {
   std::vector<uint8_t> storage;
   std::vector<size_t> lengths;
   size_t slot_size;
   size_t capacity;
   size_t head;
   size_t tail;
   size_t count;
   uint64_t dropped;
   ring_buffer_policy_t policy;
   pthread_mutex_t mutex;
   pthread_cond_t cond;
};

extern "C" {

ring_buffer_t *ring_buffer_create(size_t slot_size, size_t capacity, ring_buffer_policy_t policy) {
   if (slot_size == 0 || capacity == 0) {
      PARLEY_LOG_ERROR("ring_buffer_create: invalid geometry (slot=%zu, capacity=%zu)", slot_size,
                       capacity);
      return NULL;
   }

   ring_buffer_t *rb = new (std::nothrow) ring_buffer_t();
   if (!rb) {
      PARLEY_LOG_ERROR("ring_buffer_create: failed to allocate ring");
      return NULL;
   }

   try {
      rb->storage.assign(slot_size * capacity, 0);
      rb->lengths.assign(capacity, 0);
   } catch (const std::bad_alloc &) {
      PARLEY_LOG_ERROR("ring_buffer_create: failed to allocate %zu bytes", slot_size * capacity);
      delete rb;
      return NULL;
   }

   rb->slot_size = slot_size;
   rb->capacity = capacity;
   rb->head = 0;
   rb->tail = 0;
   rb->count = 0;
   rb->dropped = 0;
   rb->policy = policy;

   if (pthread_mutex_init(&rb->mutex, NULL) != 0) {
      PARLEY_LOG_ERROR("ring_buffer_create: mutex init failed");
      delete rb;
      return NULL;
   }
   if (pthread_cond_init(&rb->cond, NULL) != 0) {
      PARLEY_LOG_ERROR("ring_buffer_create: cond init failed");
      pthread_mutex_destroy(&rb->mutex);
      delete rb;
      return NULL;
   }

   return rb;
}

void ring_buffer_free(ring_buffer_t *rb) {
   if (!rb)
      return;

   pthread_cond_destroy(&rb->cond);
   pthread_mutex_destroy(&rb->mutex);
   delete rb;
}

int ring_buffer_push(ring_buffer_t *rb, const uint8_t *data, size_t len) {
   if (!rb || !data || len == 0 || len > rb->slot_size)
      return RING_BUFFER_ERR_INVALID;

   int result = RING_BUFFER_OK;

   pthread_mutex_lock(&rb->mutex);

   if (rb->count == rb->capacity) {
      if (rb->policy == RING_BUFFER_REJECT) {
         pthread_mutex_unlock(&rb->mutex);
         return RING_BUFFER_FULL;
      }

      /* Drop oldest */
      rb->tail = (rb->tail + 1) % rb->capacity;
      rb->count--;
      rb->dropped++;
      result = RING_BUFFER_DROPPED;
   }

   memcpy(&rb->storage[rb->head * rb->slot_size], data, len);
   rb->lengths[rb->head] = len;
   rb->head = (rb->head + 1) % rb->capacity;
   rb->count++;

   pthread_cond_signal(&rb->cond);
   pthread_mutex_unlock(&rb->mutex);

   return result;
}

size_t ring_buffer_pop(ring_buffer_t *rb, uint8_t *out, size_t out_size) {
   if (!rb || !out || out_size == 0)
      return 0;

   pthread_mutex_lock(&rb->mutex);

   if (rb->count == 0) {
      pthread_mutex_unlock(&rb->mutex);
      return 0;
   }

   size_t len = rb->lengths[rb->tail];
   if (len > out_size)
      len = out_size;
   memcpy(out, &rb->storage[rb->tail * rb->slot_size], len);

   rb->tail = (rb->tail + 1) % rb->capacity;
   rb->count--;

   pthread_mutex_unlock(&rb->mutex);
   return len;
}

size_t ring_buffer_wait_for_data(ring_buffer_t *rb, int timeout_ms) {
   if (!rb)
      return 0;

   pthread_mutex_lock(&rb->mutex);

   if (rb->count == 0 && timeout_ms > 0) {
      struct timespec deadline;
      clock_gettime(CLOCK_REALTIME, &deadline);
      deadline.tv_sec += timeout_ms / 1000;
      deadline.tv_nsec += static_cast<long>(timeout_ms % 1000) * 1000000L;
      if (deadline.tv_nsec >= 1000000000L) {
         deadline.tv_sec++;
         deadline.tv_nsec -= 1000000000L;
      }

      while (rb->count == 0) {
         int rc = pthread_cond_timedwait(&rb->cond, &rb->mutex, &deadline);
         if (rc == ETIMEDOUT)
            break;
      }
   }

   size_t count = rb->count;
   pthread_mutex_unlock(&rb->mutex);
   return count;
}

size_t ring_buffer_count(ring_buffer_t *rb) {
   if (!rb)
      return 0;

   pthread_mutex_lock(&rb->mutex);
   size_t count = rb->count;
   pthread_mutex_unlock(&rb->mutex);
   return count;
}

size_t ring_buffer_free_slots(ring_buffer_t *rb) {
   if (!rb)
      return 0;

   pthread_mutex_lock(&rb->mutex);
   size_t free_slots = rb->capacity - rb->count;
   pthread_mutex_unlock(&rb->mutex);
   return free_slots;
}

size_t ring_buffer_capacity(const ring_buffer_t *rb) {
   return rb ? rb->capacity : 0;
}

uint64_t ring_buffer_dropped(ring_buffer_t *rb) {
   if (!rb)
      return 0;

   pthread_mutex_lock(&rb->mutex);
   uint64_t dropped = rb->dropped;
   pthread_mutex_unlock(&rb->mutex);
   return dropped;
}

void ring_buffer_clear(ring_buffer_t *rb) {
   if (!rb)
      return;

   pthread_mutex_lock(&rb->mutex);
   rb->head = 0;
   rb->tail = 0;
   rb->count = 0;
   pthread_mutex_unlock(&rb->mutex);
}

} /* extern "C" */
