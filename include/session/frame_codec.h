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
 * Frame Codec - wire messages <-> session frames
 *
 * Audio travels in one of two wire formats, chosen by server.wire_format.
 * Control events are JSON text in both.
 *
 * JSON audio (the default):
 *
 *   uplink:   {"id": ..., "event_type": "input_audio_buffer.append",
 *              "data": {"delta": "<base64 PCM>"}}
 *   downlink: {"id": ..., "event_type": "conversation.audio.delta",
 *              "data": {"content": "<base64 PCM>"}}
 *
 * These carry no turn id or sequence. The receiver numbers them per turn.
 *
 * Binary audio message (little-endian, version 1):
 *
 *   offset  size  field
 *   0       2     magic 'P','A'
 *   2       1     version (1)
 *   3       1     flags (0)
 *   4       4     turn_id
 *   8       4     sequence
 *   12      4     payload_bytes
 *   16      n     PCM S16LE payload
 *
 * Text control message (JSON):
 *
 *   {"id": "<epoch ms>-<4 digits>", "event_type": "<kind>", "data": {...}}
 *
 * The codec is stateless. Unknown event types decode successfully as
 * CONTROL_UNKNOWN so newer servers do not break older clients.
 */

#ifndef FRAME_CODEC_H
#define FRAME_CODEC_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * Constants
 * ============================================================================= */

#define FRAME_WIRE_VERSION 1
#define FRAME_AUDIO_MAGIC_0 'P'
#define FRAME_AUDIO_MAGIC_1 'A'
#define FRAME_AUDIO_HEADER_SIZE 16
#define FRAME_EVENT_ID_MAX 32
#define FRAME_MESSAGE_MAX 256

/* Encoded control messages always fit in this many bytes */
#define FRAME_CONTROL_MAX 1024

/* JSON audio event size excluding the base64 text */
#define FRAME_AUDIO_EVENT_OVERHEAD 128

/**
 * @brief Audio wire formats
 */
typedef enum {
   FRAME_WIRE_JSON = 0,   /**< base64 PCM inside JSON events */
   FRAME_WIRE_BINARY = 1, /**< binary messages with a 16-byte header */
} frame_wire_format_t;

/**
 * @brief Codec error codes (positive values, 0 = success)
 */
typedef enum {
   CODEC_SUCCESS = 0,
   CODEC_ERR_MALFORMED = 1,   /**< Input is not a valid message */
   CODEC_ERR_UNSUPPORTED = 2, /**< Valid shape, but a wire version or kind we cannot handle */
   CODEC_ERR_INVALID = 3,     /**< Bad arguments */
   CODEC_ERR_NO_SPACE = 4,    /**< Output buffer too small */
} codec_error_t;

typedef enum {
   FRAME_CONTROL = 0,
   FRAME_AUDIO = 1,
} frame_type_t;

/**
 * @brief Control event kinds
 */
typedef enum {
   CONTROL_UNKNOWN = 0,
   CONTROL_SESSION_CREATED,   /**< server: chat.created */
   CONTROL_SESSION_UPDATE,    /**< client: chat.update (audio configuration) */
   CONTROL_SESSION_UPDATED,   /**< server: chat.updated */
   CONTROL_TURN_START,        /**< server: conversation.audio.started */
   CONTROL_TURN_END,          /**< server: conversation.audio.completed */
   CONTROL_END_OF_TURN,       /**< client: input_audio_buffer.complete */
   CONTROL_INTERRUPT,         /**< client: conversation.chat.cancel */
   CONTROL_INTERRUPT_ACK,     /**< server: conversation.chat.canceled */
   CONTROL_ERROR,             /**< server: error */
   CONTROL_SESSION_COMPLETED, /**< server: chat.completed */
   CONTROL_KIND_COUNT
} control_kind_t;

/**
 * @brief Audio format announced in chat.update
 */
typedef struct {
   unsigned int sample_rate;
   unsigned int channels;
   const char *voice_id; /* NULL or empty = server default */
} frame_audio_config_t;

/**
 * @brief Decoded protocol unit
 *
 * For FRAME_AUDIO the payload points into the decoded input buffer (binary)
 * or the caller's audio buffer (JSON) and is valid only as long as that
 * buffer is.
 */
typedef struct {
   frame_type_t type;

   struct {
      control_kind_t kind;
      bool has_turn_id;
      uint32_t turn_id;
      char event_id[FRAME_EVENT_ID_MAX];
      int code;                        /* CONTROL_ERROR only */
      char message[FRAME_MESSAGE_MAX]; /* CONTROL_ERROR only */
   } control;

   struct {
      bool sequenced; /* false for JSON audio: turn_id and sequence are 0 */
      uint32_t turn_id;
      uint32_t sequence;
      const uint8_t *payload;
      size_t payload_len;
   } audio;
} session_frame_t;

/* =============================================================================
 * Codec
 * ============================================================================= */

/**
 * @brief Encode one PCM chunk as a binary audio message
 *
 * @param pcm S16LE samples (non-empty, even length)
 * @param len Payload bytes
 * @param turn_id Turn the audio belongs to
 * @param sequence Position of the chunk within the turn
 * @param out Output buffer (at least FRAME_AUDIO_HEADER_SIZE + len bytes)
 * @param out_size Output buffer size
 * @param out_len Receives the encoded length
 * @return CODEC_SUCCESS, CODEC_ERR_INVALID or CODEC_ERR_NO_SPACE
 */
int frame_codec_encode_audio(const uint8_t *pcm,
                             size_t len,
                             uint32_t turn_id,
                             uint32_t sequence,
                             uint8_t *out,
                             size_t out_size,
                             size_t *out_len);

/**
 * @brief Buffer size needed by frame_codec_encode_audio_event for len bytes
 */
size_t frame_codec_audio_event_size(size_t len);

/**
 * @brief Encode one PCM chunk as an input_audio_buffer.append text message
 *
 * @param pcm S16LE samples (non-empty, even length)
 * @param len Payload bytes
 * @param event_id Message id
 * @param out Output buffer (frame_codec_audio_event_size(len) bytes)
 * @param out_size Output buffer size
 * @param out_len Receives the encoded length
 * @return CODEC_SUCCESS, CODEC_ERR_INVALID or CODEC_ERR_NO_SPACE
 */
int frame_codec_encode_audio_event(const uint8_t *pcm,
                                   size_t len,
                                   const char *event_id,
                                   uint8_t *out,
                                   size_t out_size,
                                   size_t *out_len);

/**
 * @brief Encode a control event as a JSON text message
 *
 * data.turn_id is written when turn_id is non-zero. The audio configuration
 * is required for CONTROL_SESSION_UPDATE and ignored otherwise.
 *
 * @param kind Event kind (not CONTROL_UNKNOWN)
 * @param turn_id Turn id, 0 = omit
 * @param event_id Message id (see frame_codec_make_event_id)
 * @param audio Audio configuration for CONTROL_SESSION_UPDATE
 * @param out Output buffer (not NUL-terminated)
 * @param out_size Output buffer size
 * @param out_len Receives the encoded length
 * @return CODEC_SUCCESS, CODEC_ERR_UNSUPPORTED, CODEC_ERR_INVALID or CODEC_ERR_NO_SPACE
 */
int frame_codec_encode_control(control_kind_t kind,
                               uint32_t turn_id,
                               const char *event_id,
                               const frame_audio_config_t *audio,
                               uint8_t *out,
                               size_t out_size,
                               size_t *out_len);

/**
 * @brief Decode one received message
 *
 * @param data Message bytes
 * @param len Message length
 * @param binary true if the transport delivered a binary message
 * @param frame Receives the decoded frame
 * @return CODEC_SUCCESS, CODEC_ERR_MALFORMED, CODEC_ERR_UNSUPPORTED or CODEC_ERR_INVALID
 */
int frame_codec_decode(const uint8_t *data, size_t len, bool binary, session_frame_t *frame);

/**
 * @brief Decode one received message, with room for JSON audio
 *
 * conversation.audio.delta is decoded into audio_buf as an unsequenced
 * FRAME_AUDIO. frame_codec_decode() passes no buffer and reports such
 * messages as CODEC_ERR_NO_SPACE.
 *
 * @param data Message bytes
 * @param len Message length
 * @param binary true if the transport delivered a binary message
 * @param audio_buf Receives decoded JSON audio (can be NULL)
 * @param audio_buf_size Size of audio_buf
 * @param frame Receives the decoded frame
 * @return CODEC_SUCCESS, CODEC_ERR_MALFORMED, CODEC_ERR_UNSUPPORTED,
 *         CODEC_ERR_INVALID or CODEC_ERR_NO_SPACE
 */
int frame_codec_decode_ex(const uint8_t *data,
                          size_t len,
                          bool binary,
                          uint8_t *audio_buf,
                          size_t audio_buf_size,
                          session_frame_t *frame);

/**
 * @brief Build a message id of the form "<epoch ms>-<4 digits>"
 *
 * @param epoch_ms Wall-clock milliseconds
 * @param random Any random value, reduced to 1000..9999
 * @param out Output buffer (FRAME_EVENT_ID_MAX is enough)
 * @param out_size Output buffer size
 */
void frame_codec_make_event_id(uint64_t epoch_ms, uint32_t random, char *out, size_t out_size);

/**
 * @brief Get the event_type string for a kind
 *
 * @return Wire name, or "unknown" for CONTROL_UNKNOWN
 */
const char *control_kind_name(control_kind_t kind);

/**
 * @brief Parse "json" or "binary"
 *
 * @return 0 on success, 1 if the name is not a wire format
 */
int frame_wire_format_parse(const char *name, frame_wire_format_t *format);

/**
 * @brief Get error code name string
 */
const char *codec_error_string(int err);

/* =============================================================================
 * Audio Packer
 * ============================================================================= */

/**
 * @brief Cuts captured PCM into fixed-size payloads
 *
 * Holds up to two chunks of data. Full chunks are released by
 * frame_packer_next(); a shorter remainder waits for more data until
 * frame_packer_flush() pads it with silence.
 */
typedef struct frame_packer frame_packer_t;

/**
 * @brief Create a packer
 *
 * @param chunk_bytes Payload size (non-zero, even)
 * @return Packer, or NULL on error
 */
frame_packer_t *frame_packer_create(size_t chunk_bytes);

void frame_packer_free(frame_packer_t *packer);

/**
 * @brief Bytes the packer can accept right now
 */
size_t frame_packer_space(const frame_packer_t *packer);

/**
 * @brief Bytes held, not yet released
 */
size_t frame_packer_pending(const frame_packer_t *packer);

/**
 * @brief Append captured data
 *
 * @return Bytes accepted (less than len when the packer is full)
 */
size_t frame_packer_push(frame_packer_t *packer, const uint8_t *data, size_t len);

/**
 * @brief Release one full chunk
 *
 * @param packer Packer
 * @param out Receives chunk_bytes bytes
 * @return true if a chunk was written to out
 */
bool frame_packer_next(frame_packer_t *packer, uint8_t *out);

/**
 * @brief Release the remainder padded with zero samples
 *
 * @param packer Packer
 * @param out Receives chunk_bytes bytes
 * @return true if there was a remainder (out is valid), false if empty
 */
bool frame_packer_flush(frame_packer_t *packer, uint8_t *out);

/**
 * @brief Discard everything held
 */
void frame_packer_reset(frame_packer_t *packer);

#ifdef __cplusplus
}
#endif

#endif /* FRAME_CODEC_H */
