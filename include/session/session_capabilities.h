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
 * Session Capabilities - Interfaces the session engine consumes
 *
 * The engine never talks to a socket, a sound card or a display directly.
 * Each collaborator is a table of function pointers plus an opaque context,
 * supplied by the host program (see network/ws_transport.h,
 * audio/alsa_capture.h, audio/alsa_sink.h) or by test fakes. Capabilities
 * are borrowed: they must outlive every session that uses them.
 *
 * All calls are made from the session's service loop and must not block,
 * except transport poll_receive() which blocks at most timeout_ms.
 */

#ifndef SESSION_CAPABILITIES_H
#define SESSION_CAPABILITIES_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>

#include "session/session_state.h"

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * Transport Channel
 * ============================================================================= */

/**
 * @brief Transport error codes (positive values, 0 = success)
 */
typedef enum {
   TRANSPORT_SUCCESS = 0,
   TRANSPORT_ERR_CONNECT = 1,   /**< Connection could not be established (retryable) */
   TRANSPORT_ERR_TRANSIENT = 2, /**< Temporary failure, retry on next iteration */
   TRANSPORT_ERR_CONN_LOST = 3, /**< Connection is gone */
} transport_error_t;

/**
 * @brief Duplex message channel
 *
 * open() may complete asynchronously. A connect failure reported later by
 * poll_receive() (TRANSPORT_ERR_CONNECT or TRANSPORT_ERR_CONN_LOST) while the
 * session is still connecting is treated as a connect failure.
 */
typedef struct {
   void *ctx;

   /** Begin connecting. TRANSPORT_SUCCESS or TRANSPORT_ERR_CONNECT. */
   int (*open)(void *ctx);

   /**
    * Queue one whole message for sending.
    * @param binary true for a binary message, false for text
    * @return TRANSPORT_SUCCESS, TRANSPORT_ERR_TRANSIENT or TRANSPORT_ERR_CONN_LOST
    */
   int (*send)(void *ctx, const uint8_t *data, size_t len, bool binary);

   /**
    * Wait up to timeout_ms for one received message.
    *
    * On success *len == 0 means nothing arrived. The returned data pointer
    * belongs to the transport and is valid until the next poll_receive() or
    * close() call.
    *
    * @return TRANSPORT_SUCCESS, TRANSPORT_ERR_TRANSIENT, TRANSPORT_ERR_CONNECT
    *         or TRANSPORT_ERR_CONN_LOST
    */
   int (*poll_receive)(void *ctx, int timeout_ms, const uint8_t **data, size_t *len, bool *binary);

   /** Close the connection. Safe to call when not open. */
   void (*close)(void *ctx);
} session_transport_t;

/* =============================================================================
 * Audio Capture Source
 * ============================================================================= */

/**
 * @brief Microphone capture
 */
typedef struct {
   void *ctx;

   /** Start capturing. 0 on success, non-zero on failure. */
   int (*start)(void *ctx);

   /** Stop capturing and discard anything the device still holds. */
   void (*stop)(void *ctx);

   /**
    * Non-blocking read of S16LE PCM.
    * @return Bytes read, 0 if no data is ready, negative on device error
    */
   ssize_t (*read)(void *ctx, uint8_t *buf, size_t max_bytes);
} session_capture_t;

/* =============================================================================
 * Audio Sink
 * ============================================================================= */

/**
 * @brief Sink error codes (positive values, 0 = success)
 */
typedef enum {
   SINK_SUCCESS = 0,
   SINK_ERR_BUSY = 1, /**< Device has no room now, retry the same chunk later */
   SINK_ERR_IO = 2,   /**< Device error, chunk is dropped */
} sink_error_t;

/**
 * @brief Speaker playback
 */
typedef struct {
   void *ctx;

   /** Prepare for playback. 0 on success, non-zero on failure. */
   int (*start)(void *ctx);

   /** Stop output immediately, discarding anything queued in the device. */
   void (*stop)(void *ctx);

   /**
    * Write one PCM chunk. Must not block beyond one chunk duration.
    * @return SINK_SUCCESS, SINK_ERR_BUSY or SINK_ERR_IO
    */
   int (*write)(void *ctx, const uint8_t *data, size_t len);
} session_sink_t;

/* =============================================================================
 * Status Sink
 * ============================================================================= */

/**
 * @brief State and problem notifications for a display or log
 *
 * Fire-and-forget. detail is a short human-readable reason (may be empty),
 * valid only for the duration of the call.
 */
typedef struct {
   void *ctx;
   void (*notify)(void *ctx, session_state_t state, const char *detail);
} session_status_t;

/* =============================================================================
 * Clock
 * ============================================================================= */

/**
 * @brief Millisecond clock
 *
 * Leave now_ms NULL to use CLOCK_MONOTONIC. Tests supply a fake.
 */
typedef struct {
   void *ctx;
   uint64_t (*now_ms)(void *ctx);
} session_clock_t;

/**
 * @brief Everything a session needs from its host
 *
 * transport, capture and sink are required. status and clock are optional
 * (NULL function pointers are skipped / replaced by the default).
 */
typedef struct {
   session_transport_t transport;
   session_capture_t capture;
   session_sink_t sink;
   session_status_t status;
   session_clock_t clock;
} session_capabilities_t;

#ifdef __cplusplus
}
#endif

#endif /* SESSION_CAPABILITIES_H */
