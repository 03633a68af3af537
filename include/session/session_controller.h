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
 * Session Controller - owns the active session and its restart policy
 *
 * Exactly one session exists per controller. A new one is created only when
 * the previous one has closed. With controller.auto_restart the controller
 * replaces a session that closed on its own (retry exhaustion) after
 * controller.restart_delay_ms; an explicit stop is final.
 */

#ifndef SESSION_CONTROLLER_H
#define SESSION_CONTROLLER_H

#include <signal.h>
#include <stdbool.h>

#include "config/parley_config.h"
#include "session/session_capabilities.h"
#include "session/voice_session.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct session_controller session_controller_t;

/**
 * @brief Create a controller
 *
 * Fails fast with SESSION_ERR_CONFIG on an invalid configuration. No session
 * is created until session_controller_start().
 *
 * @param config Configuration (copied)
 * @param caps Capabilities (copied; contexts are borrowed)
 * @param err_out Receives a session_error_t on failure (can be NULL)
 * @return Controller, or NULL on error
 */
session_controller_t *session_controller_create(const parley_config_t *config,
                                                const session_capabilities_t *caps,
                                                int *err_out);

/**
 * @brief Stop and destroy the session, free the controller
 */
void session_controller_destroy(session_controller_t *ctrl);

/**
 * @brief Start a conversation
 *
 * Reuses an IDLE session, replaces a CLOSED one.
 *
 * @return SESSION_SUCCESS, SESSION_ERR_STATE (a session is already active)
 *         or a creation error
 */
int session_controller_start(session_controller_t *ctrl);

/**
 * @brief Stop the session (final, no automatic restart)
 */
void session_controller_stop(session_controller_t *ctrl);

/**
 * @brief Forward an interrupt trigger to the session
 */
int session_controller_interrupt(session_controller_t *ctrl);

/**
 * @brief Forward an end-of-utterance trigger to the session
 */
int session_controller_end_of_utterance(session_controller_t *ctrl);

/**
 * @brief One loop iteration: session service plus restart policy
 *
 * @return SESSION_SUCCESS while there is work to do, SESSION_ERR_CLOSED
 *         when the session is closed and no restart is scheduled
 */
int session_controller_service(session_controller_t *ctrl, int timeout_ms);

/**
 * @brief Run the loop until *running becomes 0 or the session closes for good
 *
 * @param ctrl Controller
 * @param running Flag cleared by a signal handler
 * @param timeout_ms Per-iteration wait bound
 * @return SESSION_SUCCESS when stopped through *running, SESSION_ERR_CLOSED otherwise
 */
int session_controller_run(session_controller_t *ctrl,
                           volatile sig_atomic_t *running,
                           int timeout_ms);

/**
 * @brief State of the current session (IDLE when none exists yet)
 */
session_state_t session_controller_get_state(const session_controller_t *ctrl);

/**
 * @brief Current session, NULL before the first start
 */
voice_session_t *session_controller_get_session(session_controller_t *ctrl);

/**
 * @brief Sessions created to replace a closed one
 */
int session_controller_get_restarts(const session_controller_t *ctrl);

#ifdef __cplusplus
}
#endif

#endif /* SESSION_CONTROLLER_H */
