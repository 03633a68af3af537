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
 * Test doubles for the session capabilities
 *
 * Every fake records its calls in a shared event log so tests can assert
 * ordering (e.g. sink stopped before anything else is written).
 */

#ifndef SESSION_FAKES_H
#define SESSION_FAKES_H

#include <stdint.h>
#include <stdio.h>
#include <string.h>

#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "config/parley_config.h"
#include "session/frame_codec.h"
#include "session/session_capabilities.h"
#include "utils/base64.h"

namespace fakes {

typedef std::vector<std::string> EventLog;

/* =============================================================================
 * Transport
 * ============================================================================= */

struct Incoming {
   std::vector<uint8_t> data;
   bool binary;
   int rc; /* != TRANSPORT_SUCCESS: returned instead of a message */
};

struct SentMessage {
   std::vector<uint8_t> data;
   bool binary;
};

struct FakeTransport {
   EventLog *log = nullptr;
   int open_result = TRANSPORT_SUCCESS;
   int send_result = TRANSPORT_SUCCESS;
   int open_calls = 0;
   int close_calls = 0;
   bool is_open = false;
   std::deque<Incoming> inbox;
   std::vector<uint8_t> current;
   std::vector<SentMessage> sent;

   static int open(void *ctx) {
      FakeTransport *t = static_cast<FakeTransport *>(ctx);
      t->open_calls++;
      if (t->log)
         t->log->push_back("transport.open");
      t->is_open = (t->open_result == TRANSPORT_SUCCESS);
      return t->open_result;
   }

   static int send(void *ctx, const uint8_t *data, size_t len, bool binary) {
      FakeTransport *t = static_cast<FakeTransport *>(ctx);
      if (t->send_result != TRANSPORT_SUCCESS)
         return t->send_result;
      t->sent.push_back(SentMessage{ std::vector<uint8_t>(data, data + len), binary });
      return TRANSPORT_SUCCESS;
   }

   static int poll_receive(void *ctx,
                           int timeout_ms,
                           const uint8_t **data,
                           size_t *len,
                           bool *binary) {
      (void)timeout_ms;
      FakeTransport *t = static_cast<FakeTransport *>(ctx);
      *data = nullptr;
      *len = 0;
      *binary = false;
      if (t->inbox.empty())
         return TRANSPORT_SUCCESS;

      Incoming in = t->inbox.front();
      t->inbox.pop_front();
      if (in.rc != TRANSPORT_SUCCESS)
         return in.rc;

      t->current = in.data;
      *data = t->current.data();
      *len = t->current.size();
      *binary = in.binary;
      return TRANSPORT_SUCCESS;
   }

   static void close(void *ctx) {
      FakeTransport *t = static_cast<FakeTransport *>(ctx);
      t->close_calls++;
      t->is_open = false;
      if (t->log)
         t->log->push_back("transport.close");
   }

   void bind(session_transport_t *out) {
      out->ctx = this;
      out->open = open;
      out->send = send;
      out->poll_receive = poll_receive;
      out->close = close;
   }

   /* Queue a server control event; turn_id < 0 omits data.turn_id */
   void push_control(const char *event_type, long long turn_id = -1) {
      char text[256];
      if (turn_id >= 0) {
         snprintf(text, sizeof(text), "{\"id\":\"1\",\"event_type\":\"%s\",\"data\":{\"turn_id\":%lld}}",
                  event_type, turn_id);
      } else {
         snprintf(text, sizeof(text), "{\"id\":\"1\",\"event_type\":\"%s\",\"data\":{}}", event_type);
      }
      push_text(text);
   }

   void push_text(const std::string &text) {
      inbox.push_back(Incoming{ std::vector<uint8_t>(text.begin(), text.end()), false,
                                TRANSPORT_SUCCESS });
   }

   void push_audio(uint32_t turn_id, uint32_t sequence, size_t bytes, uint8_t fill = 0x10) {
      std::vector<uint8_t> pcm(bytes, fill);
      std::vector<uint8_t> out(FRAME_AUDIO_HEADER_SIZE + bytes);
      size_t out_len = 0;
      frame_codec_encode_audio(pcm.data(), pcm.size(), turn_id, sequence, out.data(), out.size(),
                               &out_len);
      out.resize(out_len);
      inbox.push_back(Incoming{ out, true, TRANSPORT_SUCCESS });
   }

   /* Queue a JSON audio delta (base64 PCM, no turn id or sequence) */
   void push_delta(size_t bytes, uint8_t fill = 0x10) {
      std::vector<uint8_t> pcm(bytes, fill);
      std::vector<char> b64(parley_base64_encoded_len(bytes) + 1);
      parley_base64_encode(pcm.data(), pcm.size(), b64.data(), b64.size(), nullptr);
      push_text(std::string("{\"id\":\"1\",\"event_type\":\"conversation.audio.delta\",") +
                "\"data\":{\"content\":\"" + b64.data() + "\"}}");
   }

   void push_raw(const std::vector<uint8_t> &data, bool binary) {
      inbox.push_back(Incoming{ data, binary, TRANSPORT_SUCCESS });
   }

   void push_error(int rc) { inbox.push_back(Incoming{ std::vector<uint8_t>(), false, rc }); }

   /* Decoded control kinds of everything sent so far (audio frames skipped) */
   std::vector<control_kind_t> sent_controls() const {
      std::vector<control_kind_t> kinds;
      for (const SentMessage &m : sent) {
         if (m.binary || is_audio_event(m))
            continue;
         session_frame_t frame;
         if (frame_codec_decode(m.data.data(), m.data.size(), false, &frame) == CODEC_SUCCESS)
            kinds.push_back(frame.control.kind);
      }
      return kinds;
   }

   /* (turn_id, sequence) of every audio frame sent so far */
   std::vector<std::pair<uint32_t, uint32_t>> sent_audio() const {
      std::vector<std::pair<uint32_t, uint32_t>> frames;
      for (const SentMessage &m : sent) {
         if (!m.binary)
            continue;
         session_frame_t frame;
         if (frame_codec_decode(m.data.data(), m.data.size(), true, &frame) == CODEC_SUCCESS)
            frames.push_back(std::make_pair(frame.audio.turn_id, frame.audio.sequence));
      }
      return frames;
   }

   static bool is_audio_event(const SentMessage &m) {
      std::string text(m.data.begin(), m.data.end());
      return text.find("\"event_type\":\"input_audio_buffer.append\"") != std::string::npos;
   }

   /* Decoded PCM of every input_audio_buffer.append sent so far */
   std::vector<std::vector<uint8_t>> sent_deltas() const {
      static const std::string kKey = "\"delta\":\"";
      std::vector<std::vector<uint8_t>> out;
      for (const SentMessage &m : sent) {
         if (m.binary || !is_audio_event(m))
            continue;
         std::string text(m.data.begin(), m.data.end());
         size_t begin = text.find(kKey);
         if (begin == std::string::npos)
            continue;
         begin += kKey.size();
         size_t end = text.find('"', begin);
         if (end == std::string::npos)
            continue;

         std::vector<uint8_t> pcm(parley_base64_decoded_max(end - begin));
         size_t pcm_len = 0;
         if (parley_base64_decode(text.data() + begin, end - begin, pcm.data(), pcm.size(),
                                  &pcm_len) != 0)
            continue;
         pcm.resize(pcm_len);
         out.push_back(pcm);
      }
      return out;
   }

   /* Wire kind of the most recent message: CONTROL_UNKNOWN for audio */
   control_kind_t last_sent_kind() const {
      if (sent.empty() || sent.back().binary)
         return CONTROL_UNKNOWN;
      session_frame_t frame;
      if (frame_codec_decode(sent.back().data.data(), sent.back().data.size(), false, &frame) !=
          CODEC_SUCCESS)
         return CONTROL_UNKNOWN;
      return frame.control.kind;
   }
};

/* =============================================================================
 * Capture
 * ============================================================================= */

struct FakeCapture {
   EventLog *log = nullptr;
   int start_result = 0;
   bool running = false;
   bool fail_reads = false;
   int start_calls = 0;
   int stop_calls = 0;
   std::deque<uint8_t> pending; /* Bytes the "microphone" will deliver */

   static int start(void *ctx) {
      FakeCapture *c = static_cast<FakeCapture *>(ctx);
      c->start_calls++;
      if (c->log)
         c->log->push_back("capture.start");
      c->running = (c->start_result == 0);
      return c->start_result;
   }

   static void stop(void *ctx) {
      FakeCapture *c = static_cast<FakeCapture *>(ctx);
      c->stop_calls++;
      c->running = false;
      if (c->log)
         c->log->push_back("capture.stop");
   }

   static ssize_t read(void *ctx, uint8_t *buf, size_t max_bytes) {
      FakeCapture *c = static_cast<FakeCapture *>(ctx);
      if (c->fail_reads)
         return -1;
      size_t n = c->pending.size() < max_bytes ? c->pending.size() : max_bytes;
      for (size_t i = 0; i < n; i++) {
         buf[i] = c->pending.front();
         c->pending.pop_front();
      }
      return static_cast<ssize_t>(n);
   }

   void bind(session_capture_t *out) {
      out->ctx = this;
      out->start = start;
      out->stop = stop;
      out->read = read;
   }

   /* Queue S16LE samples of alternating sign at the given amplitude */
   void speak(int16_t amplitude, size_t bytes) {
      for (size_t i = 0; i + 1 < bytes; i += 2) {
         int16_t s = ((i / 2) % 2) ? amplitude : static_cast<int16_t>(-amplitude);
         pending.push_back(static_cast<uint8_t>(static_cast<uint16_t>(s) & 0xff));
         pending.push_back(static_cast<uint8_t>(static_cast<uint16_t>(s) >> 8));
      }
   }
};

/* =============================================================================
 * Sink
 * ============================================================================= */

struct FakeSink {
   EventLog *log = nullptr;
   int start_result = 0;
   int write_result = SINK_SUCCESS;
   bool running = false;
   int start_calls = 0;
   int stop_calls = 0;
   std::vector<std::vector<uint8_t>> written;

   static int start(void *ctx) {
      FakeSink *s = static_cast<FakeSink *>(ctx);
      s->start_calls++;
      if (s->log)
         s->log->push_back("sink.start");
      s->running = (s->start_result == 0);
      return s->start_result;
   }

   static void stop(void *ctx) {
      FakeSink *s = static_cast<FakeSink *>(ctx);
      s->stop_calls++;
      s->running = false;
      if (s->log)
         s->log->push_back("sink.stop");
   }

   static int write(void *ctx, const uint8_t *data, size_t len) {
      FakeSink *s = static_cast<FakeSink *>(ctx);
      if (s->log)
         s->log->push_back("sink.write");
      if (s->write_result == SINK_SUCCESS)
         s->written.push_back(std::vector<uint8_t>(data, data + len));
      return s->write_result;
   }

   void bind(session_sink_t *out) {
      out->ctx = this;
      out->start = start;
      out->stop = stop;
      out->write = write;
   }
};

/* =============================================================================
 * Status and clock
 * ============================================================================= */

struct FakeStatus {
   std::vector<std::pair<session_state_t, std::string>> notes;

   static void notify(void *ctx, session_state_t state, const char *detail) {
      FakeStatus *st = static_cast<FakeStatus *>(ctx);
      st->notes.push_back(std::make_pair(state, std::string(detail ? detail : "")));
   }

   void bind(session_status_t *out) {
      out->ctx = this;
      out->notify = notify;
   }

   /* Distinct states in the order they were first reported after each change */
   std::vector<session_state_t> states() const {
      std::vector<session_state_t> seq;
      for (const auto &n : notes) {
         if (seq.empty() || seq.back() != n.first)
            seq.push_back(n.first);
      }
      return seq;
   }
};

struct FakeClock {
   uint64_t now = 1000;

   static uint64_t now_ms(void *ctx) { return static_cast<FakeClock *>(ctx)->now; }

   void bind(session_clock_t *out) {
      out->ctx = this;
      out->now_ms = now_ms;
   }
};

/* =============================================================================
 * Test configuration
 * ============================================================================= */

/* 320-byte chunks = 10 ms of 16 kHz mono */
inline parley_config_t test_config() {
   parley_config_t config;
   parley_config_init_defaults(&config);
   snprintf(config.server.url, sizeof(config.server.url), "ws://localhost:9000/chat");
   snprintf(config.server.wire_format, sizeof(config.server.wire_format), "binary");
   config.audio.sample_rate = 16000;
   config.audio.channels = 1;
   config.audio.chunk_bytes = 320;
   config.vad.enabled = true;
   config.vad.silence_threshold = 100;
   config.vad.silence_duration_ms = 100;
   config.session.continuous = true;
   config.session.barge_in = true;
   config.session.require_handshake = true;
   config.session.max_reconnect_attempts = 3;
   config.session.backoff_base_ms = 100;
   config.session.backoff_cap_ms = 1000;
   config.session.connect_timeout_ms = 1000;
   config.session.response_timeout_ms = 5000;
   config.session.interrupt_timeout_ms = 500;
   config.session.capture_buffer_chunks = 8;
   config.session.playback_buffer_chunks = 4;
   config.session.codec_error_threshold = 3;
   config.controller.auto_restart = false;
   config.controller.restart_delay_ms = 2000;
   return config;
}

}  // namespace fakes

#endif /* SESSION_FAKES_H */
