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
 * Frame Codec implementation (json-c for control events and JSON audio)
 */

#include "session/frame_codec.h"

#include <json-c/json.h>
#include <stdio.h>
#include <string.h>

#include <new>
#include <vector>

#include "logging_common.h"
#include "utils/base64.h"

namespace {

struct KindName {
   control_kind_t kind;
   const char *event_type;
};

const KindName kKindNames[] = {
   { CONTROL_SESSION_CREATED, "chat.created" },
   { CONTROL_SESSION_UPDATE, "chat.update" },
   { CONTROL_SESSION_UPDATED, "chat.updated" },
   { CONTROL_TURN_START, "conversation.audio.started" },
   { CONTROL_TURN_END, "conversation.audio.completed" },
   { CONTROL_END_OF_TURN, "input_audio_buffer.complete" },
   { CONTROL_INTERRUPT, "conversation.chat.cancel" },
   { CONTROL_INTERRUPT_ACK, "conversation.chat.canceled" },
   { CONTROL_ERROR, "error" },
   { CONTROL_SESSION_COMPLETED, "chat.completed" },
};

/* JSON audio events, decoded as FRAME_AUDIO rather than control */
const char kAudioAppendEvent[] = "input_audio_buffer.append";
const char kAudioDeltaEvent[] = "conversation.audio.delta";

control_kind_t kind_from_event_type(const char *event_type) {
   for (const KindName &entry : kKindNames) {
      if (strcmp(entry.event_type, event_type) == 0)
         return entry.kind;
   }
   return CONTROL_UNKNOWN;
}

void put_u32_le(uint8_t *p, uint32_t v) {
   p[0] = static_cast<uint8_t>(v & 0xFF);
   p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
   p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
   p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

uint32_t get_u32_le(const uint8_t *p) {
   return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
          (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

/* =============================================================================
 * Binary audio
 * ============================================================================= */

int decode_audio(const uint8_t *data, size_t len, session_frame_t *frame) {
   if (len < FRAME_AUDIO_HEADER_SIZE) {
      PARLEY_LOG_WARNING("Codec: audio message too short (%zu bytes)", len);
      return CODEC_ERR_MALFORMED;
   }
   if (data[0] != FRAME_AUDIO_MAGIC_0 || data[1] != FRAME_AUDIO_MAGIC_1) {
      PARLEY_LOG_WARNING("Codec: bad audio magic 0x%02x%02x", data[0], data[1]);
      return CODEC_ERR_MALFORMED;
   }
   if (data[2] != FRAME_WIRE_VERSION) {
      PARLEY_LOG_WARNING("Codec: unsupported audio wire version %u", data[2]);
      return CODEC_ERR_UNSUPPORTED;
   }

   uint32_t payload_bytes = get_u32_le(data + 12);
   if (payload_bytes != len - FRAME_AUDIO_HEADER_SIZE) {
      PARLEY_LOG_WARNING("Codec: audio length mismatch (header %u, actual %zu)", payload_bytes,
                         len - FRAME_AUDIO_HEADER_SIZE);
      return CODEC_ERR_MALFORMED;
   }
   if (payload_bytes == 0 || (payload_bytes % 2) != 0) {
      PARLEY_LOG_WARNING("Codec: invalid audio payload size %u", payload_bytes);
      return CODEC_ERR_MALFORMED;
   }

   frame->type = FRAME_AUDIO;
   frame->audio.sequenced = true;
   frame->audio.turn_id = get_u32_le(data + 4);
   frame->audio.sequence = get_u32_le(data + 8);
   frame->audio.payload = data + FRAME_AUDIO_HEADER_SIZE;
   frame->audio.payload_len = payload_bytes;
   return CODEC_SUCCESS;
}

/* =============================================================================
 * JSON control
 * ============================================================================= */

/**
 * @brief Read an optional unsigned 32-bit field
 *
 * @return false if the field is present but not a valid turn id
 */
bool read_turn_id(json_object *data, bool *has, uint32_t *value) {
   json_object *field = NULL;
   *has = false;
   *value = 0;

   if (!data || !json_object_object_get_ex(data, "turn_id", &field))
      return true;
   if (!json_object_is_type(field, json_type_int))
      return false;

   int64_t v = json_object_get_int64(field);
   if (v < 0 || v > static_cast<int64_t>(UINT32_MAX))
      return false;

   *has = true;
   *value = static_cast<uint32_t>(v);
   return true;
}

/* =============================================================================
 * JSON audio
 * ============================================================================= */

int decode_audio_event(json_object *root,
                       uint8_t *audio_buf,
                       size_t audio_buf_size,
                       session_frame_t *frame) {
   json_object *payload = NULL;
   json_object *content = NULL;

   if (!json_object_object_get_ex(root, "data", &payload) ||
       !json_object_is_type(payload, json_type_object) ||
       !json_object_object_get_ex(payload, "content", &content) ||
       !json_object_is_type(content, json_type_string)) {
      PARLEY_LOG_WARNING("Codec: audio delta without content");
      return CODEC_ERR_MALFORMED;
   }

   const char *text = json_object_get_string(content);
   size_t text_len = static_cast<size_t>(json_object_get_string_len(content));
   if (!audio_buf || parley_base64_decoded_max(text_len) > audio_buf_size)
      return CODEC_ERR_NO_SPACE;

   size_t pcm_len = 0;
   if (parley_base64_decode(text, text_len, audio_buf, audio_buf_size, &pcm_len) != 0) {
      PARLEY_LOG_WARNING("Codec: audio delta is not valid base64");
      return CODEC_ERR_MALFORMED;
   }
   if (pcm_len == 0 || (pcm_len % 2) != 0) {
      PARLEY_LOG_WARNING("Codec: invalid audio delta size %zu", pcm_len);
      return CODEC_ERR_MALFORMED;
   }

   frame->type = FRAME_AUDIO;
   frame->audio.sequenced = false;
   frame->audio.payload = audio_buf;
   frame->audio.payload_len = pcm_len;
   return CODEC_SUCCESS;
}

int decode_control(const uint8_t *data,
                   size_t len,
                   uint8_t *audio_buf,
                   size_t audio_buf_size,
                   session_frame_t *frame) {
   json_tokener *tok = json_tokener_new();
   if (!tok)
      return CODEC_ERR_MALFORMED;

   json_object *root = json_tokener_parse_ex(tok, reinterpret_cast<const char *>(data),
                                             static_cast<int>(len));
   enum json_tokener_error jerr = json_tokener_get_error(tok);
   json_tokener_free(tok);

   if (!root || jerr != json_tokener_success) {
      PARLEY_LOG_WARNING("Codec: invalid JSON control message: %s",
                         json_tokener_error_desc(jerr));
      if (root)
         json_object_put(root);
      return CODEC_ERR_MALFORMED;
   }

   int rc = CODEC_SUCCESS;
   json_object *event_type = NULL;
   json_object *id = NULL;
   json_object *payload = NULL;

   if (!json_object_is_type(root, json_type_object) ||
       !json_object_object_get_ex(root, "event_type", &event_type) ||
       !json_object_is_type(event_type, json_type_string)) {
      PARLEY_LOG_WARNING("Codec: control message without event_type");
      json_object_put(root);
      return CODEC_ERR_MALFORMED;
   }

   if (strcmp(json_object_get_string(event_type), kAudioDeltaEvent) == 0) {
      rc = decode_audio_event(root, audio_buf, audio_buf_size, frame);
      json_object_put(root);
      return rc;
   }

   frame->type = FRAME_CONTROL;
   frame->control.kind = kind_from_event_type(json_object_get_string(event_type));

   if (json_object_object_get_ex(root, "id", &id) && json_object_is_type(id, json_type_string)) {
      snprintf(frame->control.event_id, sizeof(frame->control.event_id), "%s",
               json_object_get_string(id));
   }

   if (json_object_object_get_ex(root, "data", &payload) &&
       !json_object_is_type(payload, json_type_object)) {
      /* Unknown kinds may carry anything */
      payload = NULL;
      if (frame->control.kind != CONTROL_UNKNOWN) {
         PARLEY_LOG_WARNING("Codec: %s data is not an object",
                            control_kind_name(frame->control.kind));
         json_object_put(root);
         return CODEC_ERR_MALFORMED;
      }
   }

   if (frame->control.kind != CONTROL_UNKNOWN &&
       !read_turn_id(payload, &frame->control.has_turn_id, &frame->control.turn_id)) {
      PARLEY_LOG_WARNING("Codec: %s has an invalid turn_id", control_kind_name(frame->control.kind));
      rc = CODEC_ERR_MALFORMED;
   }

   if (rc == CODEC_SUCCESS && frame->control.kind == CONTROL_ERROR && payload) {
      json_object *code = NULL;
      json_object *msg = NULL;
      if (json_object_object_get_ex(payload, "code", &code))
         frame->control.code = json_object_get_int(code);
      if (json_object_object_get_ex(payload, "msg", &msg) &&
          json_object_is_type(msg, json_type_string)) {
         snprintf(frame->control.message, sizeof(frame->control.message), "%s",
                  json_object_get_string(msg));
      }
   }

   json_object_put(root);
   return rc;
}

json_object *build_audio_config(const frame_audio_config_t *audio) {
   json_object *data = json_object_new_object();

   json_object *input = json_object_new_object();
   json_object_object_add(input, "format", json_object_new_string("pcm"));
   json_object_object_add(input, "codec", json_object_new_string("pcm"));
   json_object_object_add(input, "sample_rate",
                          json_object_new_int(static_cast<int>(audio->sample_rate)));
   json_object_object_add(input, "channel", json_object_new_int(static_cast<int>(audio->channels)));
   json_object_object_add(input, "bit_depth", json_object_new_int(16));
   json_object_object_add(data, "input_audio", input);

   json_object *pcm_config = json_object_new_object();
   json_object_object_add(pcm_config, "sample_rate",
                          json_object_new_int(static_cast<int>(audio->sample_rate)));

   json_object *output = json_object_new_object();
   json_object_object_add(output, "codec", json_object_new_string("pcm"));
   json_object_object_add(output, "pcm_config", pcm_config);
   json_object_object_add(output, "speech_rate", json_object_new_int(0));
   if (audio->voice_id && audio->voice_id[0])
      json_object_object_add(output, "voice_id", json_object_new_string(audio->voice_id));
   json_object_object_add(data, "output_audio", output);

   return data;
}

}  // namespace

/**
 * @brief Internal packer structure
 */
struct frame_packer {
   std::vector<uint8_t> data; /* 2 * chunk_bytes */
   size_t chunk_bytes;
   size_t used;
};

extern "C" {

/* =============================================================================
 * Codec API
 * ============================================================================= */

int frame_codec_encode_audio(const uint8_t *pcm,
                             size_t len,
                             uint32_t turn_id,
                             uint32_t sequence,
                             uint8_t *out,
                             size_t out_size,
                             size_t *out_len) {
   if (!pcm || !out || !out_len || len == 0 || (len % 2) != 0 || len > UINT32_MAX)
      return CODEC_ERR_INVALID;
   if (out_size < FRAME_AUDIO_HEADER_SIZE + len)
      return CODEC_ERR_NO_SPACE;

   out[0] = FRAME_AUDIO_MAGIC_0;
   out[1] = FRAME_AUDIO_MAGIC_1;
   out[2] = FRAME_WIRE_VERSION;
   out[3] = 0;
   put_u32_le(out + 4, turn_id);
   put_u32_le(out + 8, sequence);
   put_u32_le(out + 12, static_cast<uint32_t>(len));
   memcpy(out + FRAME_AUDIO_HEADER_SIZE, pcm, len);

   *out_len = FRAME_AUDIO_HEADER_SIZE + len;
   return CODEC_SUCCESS;
}

size_t frame_codec_audio_event_size(size_t len) {
   return parley_base64_encoded_len(len) + FRAME_AUDIO_EVENT_OVERHEAD;
}

int frame_codec_encode_audio_event(const uint8_t *pcm,
                                   size_t len,
                                   const char *event_id,
                                   uint8_t *out,
                                   size_t out_size,
                                   size_t *out_len) {
   if (!pcm || !event_id || !out || !out_len || len == 0 || (len % 2) != 0)
      return CODEC_ERR_INVALID;
   if (out_size < frame_codec_audio_event_size(len))
      return CODEC_ERR_NO_SPACE;

   std::vector<char> delta;
   try {
      delta.resize(parley_base64_encoded_len(len) + 1);
   } catch (const std::bad_alloc &) {
      return CODEC_ERR_NO_SPACE;
   }
   size_t delta_len = 0;
   if (parley_base64_encode(pcm, len, delta.data(), delta.size(), &delta_len) != 0)
      return CODEC_ERR_NO_SPACE;

   json_object *root = json_object_new_object();
   if (!root)
      return CODEC_ERR_NO_SPACE;

   json_object *data = json_object_new_object();
   json_object_object_add(data, "delta",
                          json_object_new_string_len(delta.data(), static_cast<int>(delta_len)));
   json_object_object_add(root, "id", json_object_new_string(event_id));
   json_object_object_add(root, "event_type", json_object_new_string(kAudioAppendEvent));
   json_object_object_add(root, "data", data);

   size_t text_len = 0;
   const char *text = json_object_to_json_string_length(
       root, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE, &text_len);
   int rc = CODEC_SUCCESS;
   if (!text || text_len > out_size) {
      rc = CODEC_ERR_NO_SPACE;
   } else {
      memcpy(out, text, text_len);
      *out_len = text_len;
   }

   json_object_put(root);
   return rc;
}

int frame_codec_encode_control(control_kind_t kind,
                               uint32_t turn_id,
                               const char *event_id,
                               const frame_audio_config_t *audio,
                               uint8_t *out,
                               size_t out_size,
                               size_t *out_len) {
   if (!event_id || !out || !out_len)
      return CODEC_ERR_INVALID;
   if (kind == CONTROL_UNKNOWN || kind >= CONTROL_KIND_COUNT)
      return CODEC_ERR_UNSUPPORTED;
   if (kind == CONTROL_SESSION_UPDATE && !audio)
      return CODEC_ERR_INVALID;

   json_object *root = json_object_new_object();
   if (!root)
      return CODEC_ERR_NO_SPACE;

   json_object *data = (kind == CONTROL_SESSION_UPDATE) ? build_audio_config(audio)
                                                        : json_object_new_object();
   if (turn_id != 0)
      json_object_object_add(data, "turn_id", json_object_new_int64(turn_id));

   json_object_object_add(root, "id", json_object_new_string(event_id));
   json_object_object_add(root, "event_type", json_object_new_string(control_kind_name(kind)));
   json_object_object_add(root, "data", data);

   size_t text_len = 0;
   const char *text = json_object_to_json_string_length(root, JSON_C_TO_STRING_PLAIN, &text_len);
   int rc = CODEC_SUCCESS;
   if (!text) {
      rc = CODEC_ERR_NO_SPACE;
   } else if (text_len > out_size) {
      rc = CODEC_ERR_NO_SPACE;
   } else {
      memcpy(out, text, text_len);
      *out_len = text_len;
   }

   json_object_put(root);
   return rc;
}

int frame_codec_decode(const uint8_t *data, size_t len, bool binary, session_frame_t *frame) {
   return frame_codec_decode_ex(data, len, binary, NULL, 0, frame);
}

int frame_codec_decode_ex(const uint8_t *data,
                          size_t len,
                          bool binary,
                          uint8_t *audio_buf,
                          size_t audio_buf_size,
                          session_frame_t *frame) {
   if (!data || !frame)
      return CODEC_ERR_INVALID;

   memset(frame, 0, sizeof(*frame));
   if (len == 0)
      return CODEC_ERR_MALFORMED;

   if (binary)
      return decode_audio(data, len, frame);
   return decode_control(data, len, audio_buf, audio_buf_size, frame);
}

void frame_codec_make_event_id(uint64_t epoch_ms, uint32_t random, char *out, size_t out_size) {
   if (!out || out_size == 0)
      return;
   snprintf(out, out_size, "%llu-%04u", static_cast<unsigned long long>(epoch_ms),
            1000u + (random % 9000u));
}

const char *control_kind_name(control_kind_t kind) {
   for (const KindName &entry : kKindNames) {
      if (entry.kind == kind)
         return entry.event_type;
   }
   return "unknown";
}

int frame_wire_format_parse(const char *name, frame_wire_format_t *format) {
   if (!name || !format)
      return 1;
   if (strcmp(name, "json") == 0) {
      *format = FRAME_WIRE_JSON;
      return 0;
   }
   if (strcmp(name, "binary") == 0) {
      *format = FRAME_WIRE_BINARY;
      return 0;
   }
   return 1;
}

const char *codec_error_string(int err) {
   switch (err) {
      case CODEC_SUCCESS:
         return "success";
      case CODEC_ERR_MALFORMED:
         return "malformed frame";
      case CODEC_ERR_UNSUPPORTED:
         return "unsupported frame";
      case CODEC_ERR_INVALID:
         return "invalid argument";
      case CODEC_ERR_NO_SPACE:
         return "buffer too small";
      default:
         return "unknown";
   }
}

/* =============================================================================
 * Audio Packer
 * ============================================================================= */

frame_packer_t *frame_packer_create(size_t chunk_bytes) {
   if (chunk_bytes == 0 || (chunk_bytes % 2) != 0) {
      PARLEY_LOG_ERROR("frame_packer_create: invalid chunk size %zu", chunk_bytes);
      return NULL;
   }

   frame_packer_t *packer = new (std::nothrow) frame_packer_t();
   if (!packer)
      return NULL;

   try {
      packer->data.assign(chunk_bytes * 2, 0);
   } catch (const std::bad_alloc &) {
      delete packer;
      return NULL;
   }
   packer->chunk_bytes = chunk_bytes;
   packer->used = 0;
   return packer;
}

void frame_packer_free(frame_packer_t *packer) {
   delete packer;
}

size_t frame_packer_space(const frame_packer_t *packer) {
   return packer ? packer->data.size() - packer->used : 0;
}

size_t frame_packer_pending(const frame_packer_t *packer) {
   return packer ? packer->used : 0;
}

size_t frame_packer_push(frame_packer_t *packer, const uint8_t *data, size_t len) {
   if (!packer || !data)
      return 0;

   size_t space = packer->data.size() - packer->used;
   size_t n = len < space ? len : space;
   if (n > 0) {
      memcpy(packer->data.data() + packer->used, data, n);
      packer->used += n;
   }
   return n;
}

bool frame_packer_next(frame_packer_t *packer, uint8_t *out) {
   if (!packer || !out || packer->used < packer->chunk_bytes)
      return false;

   memcpy(out, packer->data.data(), packer->chunk_bytes);
   packer->used -= packer->chunk_bytes;
   if (packer->used > 0)
      memmove(packer->data.data(), packer->data.data() + packer->chunk_bytes, packer->used);
   return true;
}

bool frame_packer_flush(frame_packer_t *packer, uint8_t *out) {
   if (!packer || !out || packer->used == 0)
      return false;

   if (frame_packer_next(packer, out))
      return true;

   /* Remainder: pad with zero samples */
   memcpy(out, packer->data.data(), packer->used);
   memset(out + packer->used, 0, packer->chunk_bytes - packer->used);
   packer->used = 0;
   return true;
}

void frame_packer_reset(frame_packer_t *packer) {
   if (packer)
      packer->used = 0;
}

} /* extern "C" */
