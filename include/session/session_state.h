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

#ifndef SESSION_STATE_H
#define SESSION_STATE_H

/**
 * @enum session_state_t
 * Lifecycle states of a voice session.
 *
 * @var SESSION_STATE_IDLE
 * No connection. Initial state, and the state after a one-shot interaction
 * or a server-completed chat.
 *
 * @var SESSION_STATE_CONNECTING
 * Transport is opening, or the audio configuration handshake is in progress.
 *
 * @var SESSION_STATE_LISTENING
 * Capturing microphone audio and streaming it to the server.
 *
 * @var SESSION_STATE_WAITING
 * End of user turn sent, waiting for the assistant's turn to start.
 *
 * @var SESSION_STATE_SPEAKING
 * Receiving assistant audio and playing it.
 *
 * @var SESSION_STATE_INTERRUPTING
 * Interrupt sent, waiting for acknowledgment (or its timeout).
 *
 * @var SESSION_STATE_ERROR
 * Connection failed or was lost. Waiting out the reconnect backoff.
 *
 * @var SESSION_STATE_CLOSED
 * Terminal. Connection and buffers released.
 */
typedef enum {
   SESSION_STATE_IDLE = 0,
   SESSION_STATE_CONNECTING,
   SESSION_STATE_LISTENING,
   SESSION_STATE_WAITING,
   SESSION_STATE_SPEAKING,
   SESSION_STATE_INTERRUPTING,
   SESSION_STATE_ERROR,
   SESSION_STATE_CLOSED,
   SESSION_STATE_COUNT
} session_state_t;

/**
 * @brief Get the string name of a state.
 *
 * @param state The state to get the name of.
 * @return const char* The human-readable name of the state.
 */
static inline const char *session_state_name(session_state_t state) {
   switch (state) {
      case SESSION_STATE_IDLE:
         return "IDLE";
      case SESSION_STATE_CONNECTING:
         return "CONNECTING";
      case SESSION_STATE_LISTENING:
         return "LISTENING";
      case SESSION_STATE_WAITING:
         return "WAITING";
      case SESSION_STATE_SPEAKING:
         return "SPEAKING";
      case SESSION_STATE_INTERRUPTING:
         return "INTERRUPTING";
      case SESSION_STATE_ERROR:
         return "ERROR";
      case SESSION_STATE_CLOSED:
         return "CLOSED";
      case SESSION_STATE_COUNT:
      default:
         return "UNKNOWN";
   }
}

#endif /* SESSION_STATE_H */
