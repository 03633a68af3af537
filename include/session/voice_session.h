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
 * Voice Session - streaming conversation state machine
 *
 * One session multiplexes microphone capture, the duplex connection and
 * speaker playback. It is driven by a single cooperative loop:
 *
 *   while (running)
 *      voice_session_service(session, 50);
 *
 * Each service call runs: timers, receive (one bounded poll, then drain),
 * capture pump, outbound send, playback pump. Local triggers
 * (end of utterance, interrupt, stop) take effect inside the call that
 * requests them.
 *
 * Thread Safety: a session is not thread-safe. All calls must come from the
 * thread that runs the service loop. Sessions share no state, so any number
 * may exist at once.
 */

#ifndef VOICE_SESSION_H
#define VOICE_SESSION_H

#include <stdbool.h>
#include <stdint.h>

#include "config/parley_config.h"
#include "session/session_capabilities.h"
#include "session/session_state.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Session error codes (positive values, 0 = success)
 */
typedef enum {
   SESSION_SUCCESS = 0,
   SESSION_ERR_INVALID = 1,   /**< NULL argument or missing capability */
   SESSION_ERR_CONFIG = 2,    /**< Configuration failed validation */
   SESSION_ERR_STATE = 3,     /**< Operation not allowed in the current state */
   SESSION_ERR_DISABLED = 4,  /**< Barge-in is disabled */
   SESSION_ERR_CLOSED = 5,    /**< Session reached CLOSED */
   SESSION_ERR_NO_MEMORY = 6, /**< Allocation failed */
} session_error_t;

/**
 * @brief Counters for diagnostics and tests
 */
typedef struct {
   uint64_t frames_sent;        /* Audio frames handed to the transport */
   uint64_t frames_received;    /* Audio frames accepted for playback */
   uint64_t chunks_played;      /* Chunks accepted by the sink */
   uint64_t sequence_drops;     /* Out-of-order, duplicate or foreign-turn audio */
   uint64_t playback_overflows; /* Oldest chunk dropped on a full playback buffer */
   uint64_t codec_errors;       /* Malformed or unsupported messages */
   uint64_t protocol_anomalies; /* Everything unexpected, including sequence drops */
   uint64_t transient_errors;   /* Transient send/receive failures */
   uint64_t capture_stalls;     /* Capture buffer full (backpressure) */
   uint64_t reconnects;         /* Connection attempts after an error */
   uint32_t turns_completed;    /* Assistant turns played to the end */
} voice_session_stats_t;

typedef struct voice_session voice_session_t;

/**
 * @brief Create a session
 *
 * Validates the configuration and allocates the capture and playback
 * buffers. Nothing is opened until voice_session_start().
 *
 * @param config Configuration (copied)
 * @param caps Capabilities (copied; the contexts they point to are borrowed)
 * @param err_out Receives a session_error_t on failure (can be NULL)
 * @return New session in IDLE, or NULL on error
 */
voice_session_t *voice_session_create(const parley_config_t *config,
                                      const session_capabilities_t *caps,
                                      int *err_out);

/**
 * @brief Destroy a session
 *
 * Stops it first if it is still active.
 *
 * @param session Session (can be NULL)
 */
void voice_session_destroy(voice_session_t *session);

/**
 * @brief IDLE -> CONNECTING
 *
 * @return SESSION_SUCCESS, SESSION_ERR_STATE (not IDLE) or SESSION_ERR_CLOSED
 */
int voice_session_start(voice_session_t *session);

/**
 * @brief Run one loop iteration
 *
 * Blocks at most timeout_ms (less when a timer is due or local work is
 * pending).
 *
 * @param session Session
 * @param timeout_ms Upper bound on waiting (0 = never wait)
 * @return SESSION_SUCCESS, or SESSION_ERR_CLOSED once the session is closed
 */
int voice_session_service(voice_session_t *session, int timeout_ms);

/**
 * @brief End the user's turn (LISTENING -> WAITING)
 *
 * Stops capture, sends the buffered audio (the last partial chunk padded with
 * silence), then the end-of-turn event.
 *
 * @return SESSION_SUCCESS or SESSION_ERR_STATE
 */
int voice_session_end_of_utterance(voice_session_t *session);

/**
 * @brief Interrupt (LISTENING/SPEAKING -> INTERRUPTING)
 *
 * While SPEAKING the sink is stopped before anything else happens and all
 * buffered playback is discarded.
 *
 * @return SESSION_SUCCESS, SESSION_ERR_DISABLED (SPEAKING with barge-in off)
 *         or SESSION_ERR_STATE
 */
int voice_session_interrupt(voice_session_t *session);

/**
 * @brief Any state -> CLOSED
 *
 * Closes the connection, stops capture and playback, discards buffers.
 */
void voice_session_stop(voice_session_t *session);

session_state_t voice_session_get_state(const voice_session_t *session);

/**
 * @brief Current turn id (user turn while LISTENING, assistant turn while SPEAKING)
 */
uint32_t voice_session_get_turn_id(const voice_session_t *session);

/**
 * @brief Last error reason ("" if none)
 */
const char *voice_session_get_error(const voice_session_t *session);

/**
 * @brief Consecutive connection failures since the last successful connect
 */
int voice_session_get_failures(const voice_session_t *session);

void voice_session_get_stats(const voice_session_t *session, voice_session_stats_t *stats);

/**
 * @brief Read a capability clock (CLOCK_MONOTONIC when none is set)
 */
uint64_t session_clock_now_ms(const session_clock_t *clock);

/**
 * @brief Get error code name string
 */
const char *session_error_string(int err);

#ifdef __cplusplus
}
#endif

#endif /* VOICE_SESSION_H */
