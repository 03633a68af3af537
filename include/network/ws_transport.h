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
 * WebSocket Transport - libwebsockets client behind session_transport_t
 *
 * Single-threaded: every call, including the lws service loop, runs on the
 * session's service thread. Outgoing messages are queued and written from
 * the WRITEABLE callback. Fragmented incoming messages are reassembled
 * before they are handed to the session.
 */

#ifndef WS_TRANSPORT_H
#define WS_TRANSPORT_H

#include <stdbool.h>
#include <stddef.h>

#include "config/parley_config.h"
#include "session/session_capabilities.h"

#ifdef __cplusplus
extern "C" {
#endif

#define WS_TRANSPORT_TX_QUEUE_MAX 256       /* Queued outgoing messages */
#define WS_TRANSPORT_RX_QUEUE_MAX 256       /* Reassembled incoming messages */
#define WS_TRANSPORT_MESSAGE_MAX (1 << 20) /* Largest incoming message accepted */

/* Connection states */
typedef enum {
   WS_TRANSPORT_DISCONNECTED = 0,
   WS_TRANSPORT_CONNECTING,
   WS_TRANSPORT_CONNECTED,
   WS_TRANSPORT_FAILED, /* Connect attempt failed */
   WS_TRANSPORT_LOST,   /* Established connection closed by the peer or the network */
} ws_transport_state_t;

typedef struct ws_transport ws_transport_t;

/**
 * @brief Create a transport for the configured endpoint
 *
 * Copies url, bot_id, access_token and ssl_verify. Nothing is connected
 * until the session calls open().
 *
 * @return Transport handle, or NULL if the URL is malformed or memory is short
 */
ws_transport_t *ws_transport_create(const parley_config_t *config);

/**
 * @brief Close any connection and free the transport
 */
void ws_transport_destroy(ws_transport_t *transport);

/**
 * @brief Fill a session_transport_t that drives this transport
 */
void ws_transport_bind(ws_transport_t *transport, session_transport_t *out);

/**
 * @brief Last connection error text (empty if none)
 */
const char *ws_transport_get_error(const ws_transport_t *transport);

#ifdef __cplusplus
}
#endif

#endif /* WS_TRANSPORT_H */
