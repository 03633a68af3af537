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
 * Voice Session implementation
 */

#include "session/voice_session.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#include <new>
#include <random>
#include <vector>

#include "audio/ring_buffer.h"
#include "config/config_validate.h"
#include "logging_common.h"
#include "session/frame_codec.h"
#include "session/reconnect_backoff.h"
#include "session/silence_detector.h"
#include "utils/base64.h"

namespace {

/* Wait used instead of the full timeout while capture or playback is running */
constexpr int kActiveWaitMs = 10;

/* Per-iteration limits so one busy source cannot starve the others */
constexpr int kMaxDrainMessages = 64;
constexpr int kMaxCaptureReads = 8;
constexpr int kMaxSendFrames = 16;

constexpr size_t kReasonMax = 128;

}  // namespace

/**
 * @brief Internal session structure
 */
struct voice_session {
   parley_config_t config;
   session_capabilities_t caps;
   session_state_t state;
   frame_wire_format_t wire_format;

   /* Turn tracking */
   uint32_t turn_id;
   uint32_t send_seq;  /* Next outbound audio sequence */
   uint32_t last_seq;  /* Last sequence accepted for playback */
   bool have_last_seq; /* last_seq is valid for this turn */

   /* Resources held */
   bool transport_open;
   bool capture_running;
   bool sink_running;

   /* Deferred outbound work */
   bool update_pending;    /* chat.update not yet sent */
   bool interrupt_pending; /* INTERRUPT not yet sent */
   bool eot_pending;       /* END_OF_TURN waits for the capture buffer to drain */
   bool turn_end_pending;  /* TURN_END received, playing out the rest */

   /* Timers (ms on the session clock, 0 = not armed) */
   uint64_t connect_deadline;
   uint64_t response_deadline;
   uint64_t interrupt_deadline;
   uint64_t reconnect_at;

   /* Buffers */
   ring_buffer_t *capture_rb;  /* REJECT: backpressure, never loses speech */
   ring_buffer_t *playback_rb; /* DROP_OLDEST: bounded latency */
   frame_packer_t *packer;
   std::vector<uint8_t> chunk;       /* Scratch chunk */
   std::vector<uint8_t> read_buf;    /* Capture read buffer */
   std::vector<uint8_t> tx_buf;      /* Encoded audio message */
   size_t tx_len;                    /* > 0: tx_buf holds an unsent message */
   std::vector<uint8_t> rx_audio;    /* Decoded JSON audio */
   std::vector<uint8_t> inflight;    /* Chunk the sink reported BUSY for */
   size_t inflight_len;
   uint8_t ctrl_buf[FRAME_CONTROL_MAX];

   silence_detector_t vad;
   reconnect_backoff_t backoff;
   int consecutive_codec_errors;

   std::minstd_rand rng;
   char last_error[kReasonMax];
   voice_session_stats_t stats;
};

namespace {

/* =============================================================================
 * Helpers
 * ============================================================================= */

uint64_t now_ms(const voice_session_t *s) {
   return session_clock_now_ms(&s->caps.clock);
}

uint64_t deadline_after(const voice_session_t *s, int timeout_ms) {
   return now_ms(s) + static_cast<uint64_t>(timeout_ms);
}

uint64_t wall_clock_ms() {
   struct timespec ts;
   clock_gettime(CLOCK_REALTIME, &ts);
   return static_cast<uint64_t>(ts.tv_sec) * 1000u + static_cast<uint64_t>(ts.tv_nsec) / 1000000u;
}

void notify(voice_session_t *s, const char *detail) {
   if (s->caps.status.notify)
      s->caps.status.notify(s->caps.status.ctx, s->state, detail ? detail : "");
}

void set_state(voice_session_t *s, session_state_t next, const char *reason) {
   if (s->state != next) {
      PARLEY_LOG_INFO("Session: %s -> %s (%s)", session_state_name(s->state),
                      session_state_name(next), reason);
   }
   s->state = next;
   notify(s, reason);
}

/* Recoverable problem: log and notify without changing state */
__attribute__((format(printf, 2, 3))) void report_problem(voice_session_t *s, const char *fmt, ...) {
   char reason[kReasonMax];
   va_list args;
   va_start(args, fmt);
   vsnprintf(reason, sizeof(reason), fmt, args);
   va_end(args);

   PARLEY_LOG_WARNING("Session [%s]: %s", session_state_name(s->state), reason);
   notify(s, reason);
}

__attribute__((format(printf, 2, 3))) void anomaly(voice_session_t *s, const char *fmt, ...) {
   char reason[kReasonMax];
   va_list args;
   va_start(args, fmt);
   vsnprintf(reason, sizeof(reason), fmt, args);
   va_end(args);

   s->stats.protocol_anomalies++;
   report_problem(s, "protocol anomaly: %s", reason);
}

void stop_capture(voice_session_t *s) {
   if (s->capture_running) {
      s->caps.capture.stop(s->caps.capture.ctx);
      s->capture_running = false;
   }
}

void stop_sink(voice_session_t *s) {
   if (s->sink_running) {
      s->caps.sink.stop(s->caps.sink.ctx);
      s->sink_running = false;
   }
}

void close_transport(voice_session_t *s) {
   if (s->transport_open) {
      s->caps.transport.close(s->caps.transport.ctx);
      s->transport_open = false;
   }
}

void discard_outbound_audio(voice_session_t *s) {
   ring_buffer_clear(s->capture_rb);
   frame_packer_reset(s->packer);
   s->tx_len = 0;
   s->eot_pending = false;
}

void discard_playback(voice_session_t *s) {
   ring_buffer_clear(s->playback_rb);
   s->inflight_len = 0;
   s->turn_end_pending = false;
}

/**
 * @brief Stop all I/O and forget every pending piece of work
 */
void release_io(voice_session_t *s) {
   stop_sink(s);
   stop_capture(s);
   close_transport(s);
   discard_outbound_audio(s);
   discard_playback(s);
   s->update_pending = false;
   s->interrupt_pending = false;
   s->connect_deadline = 0;
   s->response_deadline = 0;
   s->interrupt_deadline = 0;
   s->consecutive_codec_errors = 0;
}

void set_error_reason(voice_session_t *s, const char *reason) {
   snprintf(s->last_error, sizeof(s->last_error), "%s", reason);
}

/* =============================================================================
 * Transitions
 * ============================================================================= */

void enter_error(voice_session_t *s, const char *reason);

void enter_closed(voice_session_t *s, const char *reason) {
   release_io(s);
   s->reconnect_at = 0;
   set_state(s, SESSION_STATE_CLOSED, reason);
}

void enter_idle(voice_session_t *s, const char *reason) {
   release_io(s);
   s->reconnect_at = 0;
   set_state(s, SESSION_STATE_IDLE, reason);
}

/**
 * @brief Open a new user turn and start streaming the microphone
 */
void enter_listening(voice_session_t *s, const char *reason) {
   stop_sink(s);
   discard_playback(s);
   discard_outbound_audio(s);
   s->connect_deadline = 0;
   s->response_deadline = 0;
   s->interrupt_deadline = 0;

   s->turn_id++;
   s->send_seq = 0;
   s->have_last_seq = false;
   silence_detector_reset(&s->vad);

   if (!s->capture_running) {
      if (s->caps.capture.start(s->caps.capture.ctx) != 0) {
         enter_error(s, "capture start failed");
         return;
      }
      s->capture_running = true;
   }

   reconnect_backoff_reset(&s->backoff);
   set_state(s, SESSION_STATE_LISTENING, reason);
}

void enter_error(voice_session_t *s, const char *reason) {
   PARLEY_LOG_ERROR("Session: %s", reason);
   set_error_reason(s, reason);
   release_io(s);

   uint32_t delay = reconnect_backoff_fail(&s->backoff);
   set_state(s, SESSION_STATE_ERROR, reason);

   if (reconnect_backoff_exhausted(&s->backoff)) {
      char detail[kReasonMax];
      snprintf(detail, sizeof(detail), "gave up after %d attempts", s->backoff.failures);
      set_error_reason(s, detail);
      enter_closed(s, detail);
      return;
   }

   s->reconnect_at = now_ms(s) + delay;
   PARLEY_LOG_INFO("Session: reconnecting in %u ms (failure %d of %d)", delay,
                   s->backoff.failures, s->backoff.max_attempts);
}

/**
 * @brief Open the transport (IDLE or ERROR -> CONNECTING)
 */
void begin_connect(voice_session_t *s, const char *reason) {
   s->reconnect_at = 0;
   set_state(s, SESSION_STATE_CONNECTING, reason);

   int rc = s->caps.transport.open(s->caps.transport.ctx);
   if (rc != TRANSPORT_SUCCESS) {
      enter_error(s, "connect failed");
      return;
   }
   s->transport_open = true;
   s->connect_deadline = deadline_after(s, s->config.session.connect_timeout_ms);

   if (!s->config.session.require_handshake)
      enter_listening(s, "connected");
}

void finish_assistant_turn(voice_session_t *s) {
   stop_sink(s);
   s->turn_end_pending = false;
   s->stats.turns_completed++;

   if (s->config.session.continuous) {
      enter_listening(s, "turn complete");
   } else {
      enter_idle(s, "interaction complete");
   }
}

/* =============================================================================
 * Outbound
 * ============================================================================= */

/**
 * @brief Send one message
 *
 * Connection loss moves the session to ERROR.
 *
 * @return transport_error_t
 */
int send_message(voice_session_t *s, const uint8_t *data, size_t len, bool binary) {
   int rc = s->caps.transport.send(s->caps.transport.ctx, data, len, binary);
   if (rc == TRANSPORT_SUCCESS)
      return rc;

   if (rc == TRANSPORT_ERR_TRANSIENT) {
      s->stats.transient_errors++;
      return rc;
   }

   enter_error(s, "connection lost");
   return TRANSPORT_ERR_CONN_LOST;
}

void make_event_id(voice_session_t *s, char *out, size_t out_size) {
   frame_codec_make_event_id(wall_clock_ms(), static_cast<uint32_t>(s->rng()), out, out_size);
}

int send_control(voice_session_t *s, control_kind_t kind) {
   char event_id[FRAME_EVENT_ID_MAX];
   make_event_id(s, event_id, sizeof(event_id));

   frame_audio_config_t audio;
   audio.sample_rate = s->config.audio.sample_rate;
   audio.channels = s->config.audio.channels;
   audio.voice_id = s->config.audio.voice_id;

   uint32_t turn_id = (kind == CONTROL_SESSION_UPDATE) ? 0 : s->turn_id;
   size_t len = 0;
   int rc = frame_codec_encode_control(kind, turn_id, event_id, &audio, s->ctrl_buf,
                                       sizeof(s->ctrl_buf), &len);
   if (rc != CODEC_SUCCESS) {
      PARLEY_LOG_ERROR("Session: cannot encode %s: %s", control_kind_name(kind),
                       codec_error_string(rc));
      return TRANSPORT_SUCCESS;
   }

   return send_message(s, s->ctrl_buf, len, false);
}

/**
 * @brief Move packed chunks into the capture buffer while it has room
 *
 * @param flush Also release the padded remainder (end of the user turn)
 * @param run_vad Feed released chunks to the silence detector
 * @return true if the silence detector ended the utterance
 */
bool feed_capture_buffer(voice_session_t *s, bool flush, bool run_vad) {
   bool silence = false;
   uint8_t *chunk = s->chunk.data();
   size_t chunk_bytes = s->config.audio.chunk_bytes;

   while (ring_buffer_free_slots(s->capture_rb) > 0) {
      bool got = frame_packer_next(s->packer, chunk);
      if (!got && flush)
         got = frame_packer_flush(s->packer, chunk);
      if (!got)
         break;

      if (run_vad && s->config.vad.enabled && !silence)
         silence = silence_detector_process(&s->vad, chunk, chunk_bytes);

      ring_buffer_push(s->capture_rb, chunk, chunk_bytes);
   }
   return silence;
}

/**
 * @brief Encode n bytes of s->chunk into tx_buf in the configured wire format
 */
int encode_audio(voice_session_t *s, size_t n) {
   if (s->wire_format == FRAME_WIRE_BINARY) {
      return frame_codec_encode_audio(s->chunk.data(), n, s->turn_id, s->send_seq,
                                      s->tx_buf.data(), s->tx_buf.size(), &s->tx_len);
   }

   char event_id[FRAME_EVENT_ID_MAX];
   make_event_id(s, event_id, sizeof(event_id));
   return frame_codec_encode_audio_event(s->chunk.data(), n, event_id, s->tx_buf.data(),
                                         s->tx_buf.size(), &s->tx_len);
}

/**
 * @brief Send queued control events, audio, then a pending END_OF_TURN
 */
void pump_outbound(voice_session_t *s) {
   if (!s->transport_open)
      return;

   if (s->update_pending) {
      int rc = send_control(s, CONTROL_SESSION_UPDATE);
      if (rc != TRANSPORT_SUCCESS)
         return;
      s->update_pending = false;
   }

   if (s->interrupt_pending) {
      int rc = send_control(s, CONTROL_INTERRUPT);
      if (rc != TRANSPORT_SUCCESS)
         return;
      s->interrupt_pending = false;
   }

   if (s->state != SESSION_STATE_LISTENING && s->state != SESSION_STATE_WAITING)
      return;

   if (s->eot_pending)
      feed_capture_buffer(s, true, false);

   for (int i = 0; i < kMaxSendFrames; i++) {
      if (s->tx_len == 0) {
         size_t n = ring_buffer_pop(s->capture_rb, s->chunk.data(), s->chunk.size());
         if (n == 0)
            break;

         int rc = encode_audio(s, n);
         if (rc != CODEC_SUCCESS) {
            PARLEY_LOG_ERROR("Session: cannot encode audio: %s", codec_error_string(rc));
            s->tx_len = 0;
            continue;
         }
         s->send_seq++;
      }

      int rc = send_message(s, s->tx_buf.data(), s->tx_len,
                            s->wire_format == FRAME_WIRE_BINARY);
      if (rc != TRANSPORT_SUCCESS)
         return;
      s->tx_len = 0;
      s->stats.frames_sent++;

      if (s->eot_pending)
         feed_capture_buffer(s, true, false);
   }

   if (s->eot_pending && s->tx_len == 0 && ring_buffer_count(s->capture_rb) == 0 &&
       frame_packer_pending(s->packer) == 0) {
      int rc = send_control(s, CONTROL_END_OF_TURN);
      if (rc != TRANSPORT_SUCCESS)
         return;
      s->eot_pending = false;
      s->response_deadline = deadline_after(s, s->config.session.response_timeout_ms);
      PARLEY_LOG_INFO("Session: turn %u sent (%u frames)", s->turn_id, s->send_seq);
   }
}

/* =============================================================================
 * Local triggers
 * ============================================================================= */

void end_user_turn(voice_session_t *s, const char *reason) {
   stop_capture(s);
   s->eot_pending = true;
   s->response_deadline = deadline_after(s, s->config.session.response_timeout_ms);
   set_state(s, SESSION_STATE_WAITING, reason);
   pump_outbound(s);
}

/* =============================================================================
 * Capture and playback
 * ============================================================================= */

void pump_capture(voice_session_t *s) {
   if (s->state != SESSION_STATE_LISTENING || !s->capture_running)
      return;

   bool silence = false;
   for (int i = 0; i < kMaxCaptureReads && !silence; i++) {
      silence = feed_capture_buffer(s, false, true);
      if (silence)
         break;

      if (ring_buffer_free_slots(s->capture_rb) == 0) {
         s->stats.capture_stalls++;
         break;
      }

      size_t space = frame_packer_space(s->packer);
      if (space > s->read_buf.size())
         space = s->read_buf.size();
      if (space == 0)
         break;

      ssize_t n = s->caps.capture.read(s->caps.capture.ctx, s->read_buf.data(), space);
      if (n < 0) {
         enter_error(s, "capture device error");
         return;
      }
      if (n == 0)
         break;

      frame_packer_push(s->packer, s->read_buf.data(), static_cast<size_t>(n));
   }

   if (!silence)
      silence = feed_capture_buffer(s, false, true);

   if (silence)
      end_user_turn(s, "silence detected");
}

void pump_playback(voice_session_t *s) {
   if (s->state != SESSION_STATE_SPEAKING || !s->sink_running)
      return;

   size_t limit = ring_buffer_capacity(s->playback_rb) + 1;
   for (size_t i = 0; i < limit; i++) {
      if (s->inflight_len == 0) {
         s->inflight_len = ring_buffer_pop(s->playback_rb, s->inflight.data(), s->inflight.size());
         if (s->inflight_len == 0)
            break;
      }

      int rc = s->caps.sink.write(s->caps.sink.ctx, s->inflight.data(), s->inflight_len);
      if (rc == SINK_ERR_BUSY)
         return;

      if (rc == SINK_SUCCESS) {
         s->stats.chunks_played++;
      } else {
         report_problem(s, "playback write failed");
      }
      s->inflight_len = 0;
   }

   if (s->turn_end_pending && s->inflight_len == 0 && ring_buffer_count(s->playback_rb) == 0)
      finish_assistant_turn(s);
}

/* =============================================================================
 * Inbound
 * ============================================================================= */

void start_assistant_turn(voice_session_t *s, uint32_t turn_id);

void handle_audio(voice_session_t *s, const session_frame_t *frame) {
   if (s->state == SESSION_STATE_INTERRUPTING)
      return; /* Tail of the interrupted turn */

   /* Unsequenced audio carries no turn start: the first delta opens the reply */
   if (!frame->audio.sequenced && s->state == SESSION_STATE_WAITING) {
      start_assistant_turn(s, s->turn_id + 1);
      if (s->state != SESSION_STATE_SPEAKING)
         return;
   }

   if (s->state != SESSION_STATE_SPEAKING || s->turn_end_pending) {
      anomaly(s, "audio while %s", session_state_name(s->state));
      return;
   }

   uint32_t turn_id = frame->audio.turn_id;
   uint32_t sequence = frame->audio.sequence;
   if (!frame->audio.sequenced) {
      turn_id = s->turn_id;
      sequence = s->have_last_seq ? s->last_seq + 1 : 0;
   }

   if (turn_id != s->turn_id) {
      s->stats.sequence_drops++;
      anomaly(s, "audio for turn %u during turn %u", turn_id, s->turn_id);
      return;
   }

   if (s->have_last_seq && sequence <= s->last_seq) {
      s->stats.sequence_drops++;
      anomaly(s, "sequence %u after %u dropped", sequence, s->last_seq);
      return;
   }

   s->last_seq = sequence;
   s->have_last_seq = true;
   s->stats.frames_received++;

   /* Payloads longer than a chunk occupy several playback slots */
   const uint8_t *p = frame->audio.payload;
   size_t remaining = frame->audio.payload_len;
   size_t slot = s->config.audio.chunk_bytes;
   uint64_t dropped = 0;
   while (remaining > 0) {
      size_t n = remaining < slot ? remaining : slot;
      if (ring_buffer_push(s->playback_rb, p, n) == RING_BUFFER_DROPPED)
         dropped++;
      p += n;
      remaining -= n;
   }

   if (dropped > 0) {
      s->stats.playback_overflows += dropped;
      report_problem(s, "playback overflow");
   }
}

void handle_turn_start(voice_session_t *s, const session_frame_t *frame) {
   if (s->state != SESSION_STATE_WAITING) {
      anomaly(s, "turn start while %s", session_state_name(s->state));
      return;
   }

   uint32_t next = s->turn_id + 1;
   if (frame->control.has_turn_id) {
      if (frame->control.turn_id <= s->turn_id) {
         anomaly(s, "stale turn start %u (current %u)", frame->control.turn_id, s->turn_id);
         return;
      }
      next = frame->control.turn_id;
   }

   start_assistant_turn(s, next);
}

/**
 * @brief Start the sink and enter SPEAKING (WAITING only)
 */
void start_assistant_turn(voice_session_t *s, uint32_t turn_id) {
   if (s->caps.sink.start(s->caps.sink.ctx) != 0) {
      enter_error(s, "sink start failed");
      return;
   }
   s->sink_running = true;

   s->turn_id = turn_id;
   s->have_last_seq = false;
   s->response_deadline = 0;
   s->turn_end_pending = false;
   discard_playback(s);
   set_state(s, SESSION_STATE_SPEAKING, "assistant speaking");
}

void handle_turn_end(voice_session_t *s, const session_frame_t *frame) {
   switch (s->state) {
      case SESSION_STATE_SPEAKING:
         if (frame->control.has_turn_id && frame->control.turn_id != s->turn_id) {
            anomaly(s, "turn end %u during turn %u", frame->control.turn_id, s->turn_id);
            return;
         }
         s->turn_end_pending = true;
         pump_playback(s);
         break;

      case SESSION_STATE_INTERRUPTING:
         enter_listening(s, "interrupted turn ended");
         break;

      default:
         anomaly(s, "turn end without turn start while %s", session_state_name(s->state));
         break;
   }
}

void handle_control(voice_session_t *s, const session_frame_t *frame) {
   switch (frame->control.kind) {
      case CONTROL_SESSION_CREATED:
         if (s->state == SESSION_STATE_CONNECTING && s->config.session.require_handshake) {
            s->update_pending = true;
            pump_outbound(s);
         }
         break;

      case CONTROL_SESSION_UPDATED:
         if (s->state == SESSION_STATE_CONNECTING)
            enter_listening(s, "session ready");
         break;

      case CONTROL_TURN_START:
         handle_turn_start(s, frame);
         break;

      case CONTROL_TURN_END:
         handle_turn_end(s, frame);
         break;

      case CONTROL_INTERRUPT_ACK:
         if (s->state == SESSION_STATE_INTERRUPTING)
            enter_listening(s, "interrupt acknowledged");
         else
            anomaly(s, "interrupt ack while %s", session_state_name(s->state));
         break;

      case CONTROL_ERROR: {
         char reason[kReasonMax];
         snprintf(reason, sizeof(reason), "server error %d: %s", frame->control.code,
                  frame->control.message[0] ? frame->control.message : "(no message)");
         enter_error(s, reason);
         break;
      }

      case CONTROL_SESSION_COMPLETED:
         enter_idle(s, "chat completed");
         break;

      case CONTROL_UNKNOWN:
         break;

      default:
         /* Client-to-server kinds echoed back */
         anomaly(s, "unexpected %s", control_kind_name(frame->control.kind));
         break;
   }
}

void handle_message(voice_session_t *s, const uint8_t *data, size_t len, bool binary) {
   uint8_t *audio_buf = NULL;
   size_t audio_buf_size = 0;
   if (!binary) {
      try {
         if (s->rx_audio.size() < parley_base64_decoded_max(len))
            s->rx_audio.resize(parley_base64_decoded_max(len));
      } catch (const std::bad_alloc &) {
         report_problem(s, "no memory for a %zu-byte message", len);
         return;
      }
      audio_buf = s->rx_audio.data();
      audio_buf_size = s->rx_audio.size();
   }

   session_frame_t frame;
   int rc = frame_codec_decode_ex(data, len, binary, audio_buf, audio_buf_size, &frame);
   if (rc != CODEC_SUCCESS) {
      s->stats.codec_errors++;
      s->consecutive_codec_errors++;
      if (s->consecutive_codec_errors >= s->config.session.codec_error_threshold) {
         enter_error(s, "codec error storm");
         return;
      }
      report_problem(s, "%s", codec_error_string(rc));
      return;
   }
   s->consecutive_codec_errors = 0;

   if (frame.type == FRAME_AUDIO)
      handle_audio(s, &frame);
   else
      handle_control(s, &frame);
}

/**
 * @brief Handle a non-success receive result
 */
void handle_receive_error(voice_session_t *s, int rc) {
   if (rc == TRANSPORT_ERR_TRANSIENT) {
      s->stats.transient_errors++;
      report_problem(s, "receive retry");
      return;
   }
   if (s->state == SESSION_STATE_CONNECTING)
      enter_error(s, rc == TRANSPORT_ERR_CONNECT ? "connect failed" : "connection lost");
   else
      enter_error(s, "connection lost");
}

void pump_receive(voice_session_t *s, int wait_ms) {
   for (int i = 0; i < kMaxDrainMessages && s->transport_open; i++) {
      const uint8_t *data = NULL;
      size_t len = 0;
      bool binary = false;

      int rc = s->caps.transport.poll_receive(s->caps.transport.ctx, i == 0 ? wait_ms : 0, &data,
                                              &len, &binary);
      if (rc != TRANSPORT_SUCCESS) {
         handle_receive_error(s, rc);
         return;
      }
      if (len == 0 || !data)
         return;

      handle_message(s, data, len, binary);
   }
}

/* =============================================================================
 * Timers
 * ============================================================================= */

void check_timers(voice_session_t *s) {
   uint64_t now = now_ms(s);

   switch (s->state) {
      case SESSION_STATE_CONNECTING:
         if (s->connect_deadline && now >= s->connect_deadline)
            enter_error(s, "connect timeout");
         break;
      case SESSION_STATE_WAITING:
         if (s->response_deadline && now >= s->response_deadline)
            enter_error(s, "response timeout");
         break;
      case SESSION_STATE_INTERRUPTING:
         if (s->interrupt_deadline && now >= s->interrupt_deadline)
            enter_listening(s, "interrupt ack timeout");
         break;
      case SESSION_STATE_ERROR:
         if (now >= s->reconnect_at) {
            s->stats.reconnects++;
            begin_connect(s, "reconnecting");
         }
         break;
      default:
         break;
   }
}

/**
 * @brief Milliseconds until the earliest armed timer, or -1 if none
 */
int64_t next_timer_ms(const voice_session_t *s) {
   uint64_t deadline = 0;
   switch (s->state) {
      case SESSION_STATE_CONNECTING:
         deadline = s->connect_deadline;
         break;
      case SESSION_STATE_WAITING:
         deadline = s->response_deadline;
         break;
      case SESSION_STATE_INTERRUPTING:
         deadline = s->interrupt_deadline;
         break;
      case SESSION_STATE_ERROR:
         deadline = s->reconnect_at;
         break;
      default:
         return -1;
   }
   if (deadline == 0)
      return -1;

   uint64_t now = now_ms(s);
   return deadline > now ? static_cast<int64_t>(deadline - now) : 0;
}

bool has_local_work(const voice_session_t *s) {
   return s->capture_running || s->update_pending || s->interrupt_pending || s->eot_pending ||
          s->tx_len > 0 || (s->sink_running && (s->inflight_len > 0 || s->turn_end_pending ||
                                                 ring_buffer_count(s->playback_rb) > 0));
}

int compute_wait(const voice_session_t *s, int timeout_ms) {
   int wait = timeout_ms > 0 ? timeout_ms : 0;
   if (wait > kActiveWaitMs && has_local_work(s))
      wait = kActiveWaitMs;

   int64_t timer = next_timer_ms(s);
   if (timer >= 0 && timer < wait)
      wait = static_cast<int>(timer);
   return wait;
}

void sleep_ms(int ms) {
   if (ms <= 0)
      return;
   struct timespec ts;
   ts.tv_sec = ms / 1000;
   ts.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
   nanosleep(&ts, NULL);
}

}  // namespace

extern "C" {

/* =============================================================================
 * Public API
 * ============================================================================= */

uint64_t session_clock_now_ms(const session_clock_t *clock) {
   if (clock && clock->now_ms)
      return clock->now_ms(clock->ctx);

   struct timespec ts;
   clock_gettime(CLOCK_MONOTONIC, &ts);
   return static_cast<uint64_t>(ts.tv_sec) * 1000u + static_cast<uint64_t>(ts.tv_nsec) / 1000000u;
}

voice_session_t *voice_session_create(const parley_config_t *config,
                                      const session_capabilities_t *caps,
                                      int *err_out) {
   if (err_out)
      *err_out = SESSION_SUCCESS;

   if (!config || !caps || !caps->transport.open || !caps->transport.send ||
       !caps->transport.poll_receive || !caps->transport.close || !caps->capture.start ||
       !caps->capture.stop || !caps->capture.read || !caps->sink.start || !caps->sink.stop ||
       !caps->sink.write) {
      PARLEY_LOG_ERROR("voice_session_create: missing config or capability");
      if (err_out)
         *err_out = SESSION_ERR_INVALID;
      return NULL;
   }

   config_error_t errors[8];
   int error_count = parley_config_validate(config, errors, 8);
   if (error_count > 0) {
      for (int i = 0; i < error_count && i < 8; i++)
         PARLEY_LOG_ERROR("Config: %s: %s", errors[i].field, errors[i].message);
      if (err_out)
         *err_out = SESSION_ERR_CONFIG;
      return NULL;
   }

   voice_session_t *s = new (std::nothrow) voice_session_t();
   if (!s) {
      if (err_out)
         *err_out = SESSION_ERR_NO_MEMORY;
      return NULL;
   }

   s->config = *config;
   s->caps = *caps;
   s->state = SESSION_STATE_IDLE;
   if (frame_wire_format_parse(config->server.wire_format, &s->wire_format) != 0)
      s->wire_format = FRAME_WIRE_JSON; /* Unreachable after validation */

   size_t chunk_bytes = config->audio.chunk_bytes;
   s->capture_rb = ring_buffer_create(chunk_bytes,
                                      static_cast<size_t>(config->session.capture_buffer_chunks),
                                      RING_BUFFER_REJECT);
   s->playback_rb = ring_buffer_create(chunk_bytes,
                                       static_cast<size_t>(config->session.playback_buffer_chunks),
                                       RING_BUFFER_DROP_OLDEST);
   s->packer = frame_packer_create(chunk_bytes);

   bool buffers_ok = s->capture_rb && s->playback_rb && s->packer;
   if (buffers_ok) {
      try {
         s->chunk.assign(chunk_bytes, 0);
         s->read_buf.assign(chunk_bytes, 0);
         s->tx_buf.assign(s->wire_format == FRAME_WIRE_BINARY
                              ? FRAME_AUDIO_HEADER_SIZE + chunk_bytes
                              : frame_codec_audio_event_size(chunk_bytes),
                          0);
         s->inflight.assign(chunk_bytes, 0);
      } catch (const std::bad_alloc &e) {
         PARLEY_LOG_ERROR("voice_session_create: %s", e.what());
         buffers_ok = false;
      }
   }
   if (!buffers_ok) {
      ring_buffer_free(s->capture_rb);
      ring_buffer_free(s->playback_rb);
      frame_packer_free(s->packer);
      delete s;
      if (err_out)
         *err_out = SESSION_ERR_NO_MEMORY;
      return NULL;
   }

   silence_detector_init(&s->vad, config->vad.silence_threshold,
                         static_cast<uint32_t>(config->vad.silence_duration_ms),
                         config->audio.sample_rate, config->audio.channels);
   reconnect_backoff_init(&s->backoff, static_cast<uint32_t>(config->session.backoff_base_ms),
                          static_cast<uint32_t>(config->session.backoff_cap_ms),
                          config->session.max_reconnect_attempts);

   s->rng.seed(static_cast<std::minstd_rand::result_type>(wall_clock_ms() ^
                                                          reinterpret_cast<uintptr_t>(s)));

   PARLEY_LOG_INFO("Session created: %u Hz, %u ch, %u-byte chunks, %s audio, %s",
                   config->audio.sample_rate, config->audio.channels, config->audio.chunk_bytes,
                   s->wire_format == FRAME_WIRE_BINARY ? "binary" : "json",
                   config->session.continuous ? "continuous" : "one-shot");
   return s;
}

void voice_session_destroy(voice_session_t *session) {
   if (!session)
      return;

   if (session->state != SESSION_STATE_CLOSED)
      release_io(session);

   ring_buffer_free(session->capture_rb);
   ring_buffer_free(session->playback_rb);
   frame_packer_free(session->packer);
   delete session;
}

int voice_session_start(voice_session_t *session) {
   if (!session)
      return SESSION_ERR_INVALID;
   if (session->state == SESSION_STATE_CLOSED)
      return SESSION_ERR_CLOSED;
   if (session->state != SESSION_STATE_IDLE)
      return SESSION_ERR_STATE;

   reconnect_backoff_reset(&session->backoff);
   session->last_error[0] = '\0';
   begin_connect(session, "start");
   return SESSION_SUCCESS;
}

int voice_session_service(voice_session_t *session, int timeout_ms) {
   if (!session)
      return SESSION_ERR_INVALID;
   if (session->state == SESSION_STATE_CLOSED)
      return SESSION_ERR_CLOSED;

   if (session->state == SESSION_STATE_IDLE) {
      sleep_ms(timeout_ms);
      return SESSION_SUCCESS;
   }

   check_timers(session);

   int wait = compute_wait(session, timeout_ms);
   if (session->transport_open)
      pump_receive(session, wait);
   else
      sleep_ms(wait);

   pump_capture(session);
   pump_outbound(session);
   pump_playback(session);

   return session->state == SESSION_STATE_CLOSED ? SESSION_ERR_CLOSED : SESSION_SUCCESS;
}

int voice_session_end_of_utterance(voice_session_t *session) {
   if (!session)
      return SESSION_ERR_INVALID;
   if (session->state != SESSION_STATE_LISTENING)
      return SESSION_ERR_STATE;

   end_user_turn(session, "end of utterance");
   return SESSION_SUCCESS;
}

int voice_session_interrupt(voice_session_t *session) {
   if (!session)
      return SESSION_ERR_INVALID;

   switch (session->state) {
      case SESSION_STATE_SPEAKING:
         if (!session->config.session.barge_in)
            return SESSION_ERR_DISABLED;
         /* Silence first, then bookkeeping */
         stop_sink(session);
         discard_playback(session);
         break;

      case SESSION_STATE_LISTENING:
         stop_capture(session);
         discard_outbound_audio(session);
         break;

      default:
         return SESSION_ERR_STATE;
   }

   session->interrupt_pending = true;
   session->interrupt_deadline =
       deadline_after(session, session->config.session.interrupt_timeout_ms);
   set_state(session, SESSION_STATE_INTERRUPTING, "interrupt");
   pump_outbound(session);
   return SESSION_SUCCESS;
}

void voice_session_stop(voice_session_t *session) {
   if (!session || session->state == SESSION_STATE_CLOSED)
      return;
   enter_closed(session, "stopped");
}

session_state_t voice_session_get_state(const voice_session_t *session) {
   return session ? session->state : SESSION_STATE_CLOSED;
}

uint32_t voice_session_get_turn_id(const voice_session_t *session) {
   return session ? session->turn_id : 0;
}

const char *voice_session_get_error(const voice_session_t *session) {
   return session ? session->last_error : "";
}

int voice_session_get_failures(const voice_session_t *session) {
   return session ? session->backoff.failures : 0;
}

void voice_session_get_stats(const voice_session_t *session, voice_session_stats_t *stats) {
   if (!stats)
      return;
   if (!session) {
      memset(stats, 0, sizeof(*stats));
      return;
   }
   *stats = session->stats;
}

const char *session_error_string(int err) {
   switch (err) {
      case SESSION_SUCCESS:
         return "success";
      case SESSION_ERR_INVALID:
         return "invalid argument";
      case SESSION_ERR_CONFIG:
         return "invalid configuration";
      case SESSION_ERR_STATE:
         return "not allowed in current state";
      case SESSION_ERR_DISABLED:
         return "barge-in disabled";
      case SESSION_ERR_CLOSED:
         return "session closed";
      case SESSION_ERR_NO_MEMORY:
         return "out of memory";
      default:
         return "unknown error";
   }
}

} /* extern "C" */
