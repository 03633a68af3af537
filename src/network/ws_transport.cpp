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

#include "network/ws_transport.h"

#include <libwebsockets.h>
#include <stdio.h>
#include <string.h>

#include <deque>
#include <new>
#include <string>
#include <vector>

#include "logging_common.h"
#include "network/ws_url.h"

namespace {

struct ws_message {
   std::vector<uint8_t> data; /* LWS_PRE bytes of headroom, then payload */
   bool binary;
};

}  // namespace

struct ws_transport {
   ws_url_t url;
   std::string auth_header; /* "Bearer <token>", empty = none */
   bool ssl_verify;

   struct lws_context *context;
   struct lws *wsi;
   ws_transport_state_t state;

   std::deque<ws_message> tx_queue;

   std::vector<uint8_t> rx_partial;
   bool rx_partial_binary;
   bool rx_oversize; /* Current message exceeded WS_TRANSPORT_MESSAGE_MAX */
   std::deque<ws_message> rx_queue;
   ws_message rx_current; /* Handed to the caller until the next poll */

   char error[128];
};

namespace {

/* =============================================================================
 * libwebsockets callback
 * ============================================================================= */

void set_error(ws_transport_t *t, const char *msg) {
   snprintf(t->error, sizeof(t->error), "%s", msg ? msg : "unknown");
}

void finish_rx_message(ws_transport_t *t) {
   if (t->rx_oversize) {
      PARLEY_LOG_WARNING("WS: dropped oversize message");
   } else if (t->rx_queue.size() >= WS_TRANSPORT_RX_QUEUE_MAX) {
      PARLEY_LOG_WARNING("WS: receive queue full, dropping message");
   } else {
      ws_message msg;
      msg.data.swap(t->rx_partial);
      msg.binary = t->rx_partial_binary;
      t->rx_queue.push_back(std::move(msg));
   }
   t->rx_partial.clear();
   t->rx_oversize = false;
}

int transport_callback(struct lws *wsi,
                       enum lws_callback_reasons reason,
                       void *user,
                       void *in,
                       size_t len) {
   struct lws_context *context = lws_get_context(wsi);
   ws_transport_t *t = context ? static_cast<ws_transport_t *>(lws_context_user(context)) : NULL;
   if (!t)
      return lws_callback_http_dummy(wsi, reason, user, in, len);

   switch (reason) {
      case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
         if (t->auth_header.empty())
            break;
         unsigned char **p = static_cast<unsigned char **>(in);
         unsigned char *end = *p + len;
         if (lws_add_http_header_by_name(
                 wsi, reinterpret_cast<const unsigned char *>("authorization:"),
                 reinterpret_cast<const unsigned char *>(t->auth_header.c_str()),
                 static_cast<int>(t->auth_header.size()), p, end)) {
            PARLEY_LOG_ERROR("WS: no room for authorization header");
            return -1;
         }
         break;
      }

      case LWS_CALLBACK_CLIENT_ESTABLISHED:
         PARLEY_LOG_INFO("WS: connected to %s:%d", t->url.host, t->url.port);
         t->state = WS_TRANSPORT_CONNECTED;
         t->error[0] = '\0';
         if (!t->tx_queue.empty())
            lws_callback_on_writable(wsi);
         break;

      case LWS_CALLBACK_CLIENT_RECEIVE:
         if (lws_is_first_fragment(wsi)) {
            t->rx_partial.clear();
            t->rx_oversize = false;
            t->rx_partial_binary = lws_frame_is_binary(wsi) != 0;
         }
         if (!t->rx_oversize) {
            if (t->rx_partial.size() + len > WS_TRANSPORT_MESSAGE_MAX) {
               t->rx_oversize = true;
               t->rx_partial.clear();
            } else {
               const uint8_t *bytes = static_cast<const uint8_t *>(in);
               t->rx_partial.insert(t->rx_partial.end(), bytes, bytes + len);
            }
         }
         if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0)
            finish_rx_message(t);
         break;

      case LWS_CALLBACK_CLIENT_WRITEABLE: {
         if (t->tx_queue.empty())
            break;
         ws_message &msg = t->tx_queue.front();
         size_t payload_len = msg.data.size() - LWS_PRE;
         int n = lws_write(wsi, msg.data.data() + LWS_PRE, payload_len,
                           msg.binary ? LWS_WRITE_BINARY : LWS_WRITE_TEXT);
         if (n < static_cast<int>(payload_len)) {
            PARLEY_LOG_ERROR("WS: write failed (%d of %zu bytes)", n, payload_len);
            set_error(t, "write failed");
            return -1;
         }
         t->tx_queue.pop_front();
         if (!t->tx_queue.empty())
            lws_callback_on_writable(wsi);
         break;
      }

      case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
         set_error(t, in ? static_cast<const char *>(in) : "connection error");
         PARLEY_LOG_ERROR("WS: connection error: %s", t->error);
         t->state = WS_TRANSPORT_FAILED;
         t->wsi = NULL;
         break;

      case LWS_CALLBACK_CLIENT_CLOSED:
         PARLEY_LOG_WARNING("WS: connection closed");
         if (t->state == WS_TRANSPORT_CONNECTED || t->state == WS_TRANSPORT_CONNECTING) {
            if (!t->error[0])
               set_error(t, "closed by peer");
            t->state = (t->state == WS_TRANSPORT_CONNECTED) ? WS_TRANSPORT_LOST
                                                            : WS_TRANSPORT_FAILED;
         }
         t->wsi = NULL;
         break;

      case LWS_CALLBACK_WSI_DESTROY:
         if (t->wsi == wsi)
            t->wsi = NULL;
         break;

      default:
         break;
   }

   return lws_callback_http_dummy(wsi, reason, user, in, len);
}

const struct lws_protocols kProtocols[] = {
   { "parley-client", transport_callback, 0, 65536, 0, NULL, 0 },
   { NULL, NULL, 0, 0, 0, NULL, 0 },
};

void lws_log_bridge(int level, const char *line) {
   if (level & LLL_ERR)
      PARLEY_LOG_ERROR("lws: %s", line);
   else
      PARLEY_LOG_WARNING("lws: %s", line);
}

/* =============================================================================
 * session_transport_t operations
 * ============================================================================= */

void reset_queues(ws_transport_t *t) {
   t->tx_queue.clear();
   t->rx_queue.clear();
   t->rx_partial.clear();
   t->rx_oversize = false;
}

void op_close(void *ctx) {
   ws_transport_t *t = static_cast<ws_transport_t *>(ctx);

   /* Destroying the context closes the connection and frees the wsi */
   if (t->context) {
      lws_context_destroy(t->context);
      t->context = NULL;
   }
   t->wsi = NULL;
   t->state = WS_TRANSPORT_DISCONNECTED;
   reset_queues(t);
}

int op_open(void *ctx) {
   ws_transport_t *t = static_cast<ws_transport_t *>(ctx);

   op_close(t);
   t->error[0] = '\0';

   struct lws_context_creation_info info;
   memset(&info, 0, sizeof(info));
   info.port = CONTEXT_PORT_NO_LISTEN;
   info.protocols = kProtocols;
   info.gid = -1;
   info.uid = -1;
   info.user = t;
   if (t->url.tls)
      info.options |= LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;

   t->context = lws_create_context(&info);
   if (!t->context) {
      set_error(t, "failed to create lws context");
      PARLEY_LOG_ERROR("WS: %s", t->error);
      return TRANSPORT_ERR_CONNECT;
   }

   struct lws_client_connect_info ci;
   memset(&ci, 0, sizeof(ci));
   ci.context = t->context;
   ci.address = t->url.host;
   ci.port = t->url.port;
   ci.path = t->url.path;
   ci.host = t->url.host;
   ci.origin = t->url.host;
   ci.protocol = NULL;
   ci.pwsi = &t->wsi;
   if (t->url.tls) {
      ci.ssl_connection = LCCSCF_USE_SSL;
      if (!t->ssl_verify) {
         ci.ssl_connection |= LCCSCF_ALLOW_SELFSIGNED | LCCSCF_SKIP_SERVER_CERT_HOSTNAME_CHECK;
      }
   }

   t->state = WS_TRANSPORT_CONNECTING;
   PARLEY_LOG_INFO("WS: connecting to %s://%s:%d%s", t->url.tls ? "wss" : "ws", t->url.host,
                   t->url.port, t->url.path);

   if (!lws_client_connect_via_info(&ci)) {
      set_error(t, "connect request failed");
      PARLEY_LOG_ERROR("WS: %s", t->error);
      op_close(t);
      return TRANSPORT_ERR_CONNECT;
   }
   return TRANSPORT_SUCCESS;
}

int op_send(void *ctx, const uint8_t *data, size_t len, bool binary) {
   ws_transport_t *t = static_cast<ws_transport_t *>(ctx);

   if (t->state != WS_TRANSPORT_CONNECTING && t->state != WS_TRANSPORT_CONNECTED)
      return TRANSPORT_ERR_CONN_LOST;
   if (t->tx_queue.size() >= WS_TRANSPORT_TX_QUEUE_MAX)
      return TRANSPORT_ERR_TRANSIENT;

   try {
      ws_message msg;
      msg.data.resize(LWS_PRE + len);
      if (len > 0)
         memcpy(msg.data.data() + LWS_PRE, data, len);
      msg.binary = binary;
      t->tx_queue.push_back(std::move(msg));
   } catch (const std::bad_alloc &) {
      return TRANSPORT_ERR_TRANSIENT;
   }

   if (t->state == WS_TRANSPORT_CONNECTED && t->wsi)
      lws_callback_on_writable(t->wsi);
   return TRANSPORT_SUCCESS;
}

bool take_rx(ws_transport_t *t, const uint8_t **data, size_t *len, bool *binary) {
   if (t->rx_queue.empty())
      return false;

   t->rx_current = std::move(t->rx_queue.front());
   t->rx_queue.pop_front();
   *data = t->rx_current.data.data();
   *len = t->rx_current.data.size();
   *binary = t->rx_current.binary;
   return true;
}

int state_error(const ws_transport_t *t) {
   switch (t->state) {
      case WS_TRANSPORT_FAILED:
         return TRANSPORT_ERR_CONNECT;
      case WS_TRANSPORT_LOST:
      case WS_TRANSPORT_DISCONNECTED:
         return TRANSPORT_ERR_CONN_LOST;
      default:
         return TRANSPORT_SUCCESS;
   }
}

int op_poll_receive(void *ctx, int timeout_ms, const uint8_t **data, size_t *len, bool *binary) {
   ws_transport_t *t = static_cast<ws_transport_t *>(ctx);

   *data = NULL;
   *len = 0;
   *binary = false;

   /* Deliver what is already reassembled before reporting a close */
   if (take_rx(t, data, len, binary))
      return TRANSPORT_SUCCESS;

   int err = state_error(t);
   if (err != TRANSPORT_SUCCESS)
      return err;

   if (lws_service(t->context, timeout_ms) < 0) {
      set_error(t, "service failed");
      t->state = WS_TRANSPORT_LOST;
      return TRANSPORT_ERR_CONN_LOST;
   }

   if (take_rx(t, data, len, binary))
      return TRANSPORT_SUCCESS;
   return state_error(t);
}

}  // namespace

/* =============================================================================
 * Public API
 * ============================================================================= */

extern "C" {

ws_transport_t *ws_transport_create(const parley_config_t *config) {
   if (!config)
      return NULL;

   ws_transport_t *t = new (std::nothrow) ws_transport_t();
   if (!t)
      return NULL;

   if (ws_url_parse(config->server.url, config->server.bot_id, &t->url) != 0) {
      PARLEY_LOG_ERROR("WS: malformed endpoint URL: %s", config->server.url);
      delete t;
      return NULL;
   }

   try {
      if (config->server.access_token[0])
         t->auth_header = std::string("Bearer ") + config->server.access_token;
   } catch (const std::bad_alloc &) {
      delete t;
      return NULL;
   }

   t->ssl_verify = config->server.ssl_verify;
   t->state = WS_TRANSPORT_DISCONNECTED;

   lws_set_log_level(LLL_ERR | LLL_WARN, lws_log_bridge);
   return t;
}

void ws_transport_destroy(ws_transport_t *transport) {
   if (!transport)
      return;

   op_close(transport);
   delete transport;
}

void ws_transport_bind(ws_transport_t *transport, session_transport_t *out) {
   if (!out)
      return;

   out->ctx = transport;
   out->open = op_open;
   out->send = op_send;
   out->poll_receive = op_poll_receive;
   out->close = op_close;
}

const char *ws_transport_get_error(const ws_transport_t *transport) {
   return transport ? transport->error : "";
}

} /* extern "C" */
