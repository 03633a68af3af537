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
 * PARLEY Configuration System - Main configuration struct definitions
 *
 * Thread Safety: Configuration is loaded once at startup and read-only during
 * runtime. Sessions take a copy when they are created.
 */

#ifndef PARLEY_CONFIG_H
#define PARLEY_CONFIG_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * Buffer Size Constants
 * ============================================================================= */
#define CONFIG_URL_MAX 512
#define CONFIG_ID_MAX 128
#define CONFIG_TOKEN_MAX 512
#define CONFIG_DEVICE_MAX 128
#define CONFIG_LEVEL_MAX 16
#define CONFIG_FORMAT_MAX 16

/* Default config file locations (searched in order) */
#define CONFIG_PATH_LOCAL "./parley.toml"
#define CONFIG_PATH_HOME "~/.config/parley/parley.toml"
#define CONFIG_PATH_ETC "/etc/parley/parley.toml"

/* =============================================================================
 * Defaults
 * ============================================================================= */
#define PARLEY_DEFAULT_URL "wss://ws.coze.cn/v1/chat"
#define PARLEY_DEFAULT_SAMPLE_RATE 16000
#define PARLEY_DEFAULT_CHANNELS 1
#define PARLEY_DEFAULT_CHUNK_BYTES 1024
#define PARLEY_DEFAULT_SILENCE_THRESHOLD 100
#define PARLEY_DEFAULT_SILENCE_DURATION_MS 1500
#define PARLEY_DEFAULT_MAX_RECONNECT 5
#define PARLEY_DEFAULT_BACKOFF_BASE_MS 500
#define PARLEY_DEFAULT_BACKOFF_CAP_MS 8000
#define PARLEY_DEFAULT_CONNECT_TIMEOUT_MS 10000
#define PARLEY_DEFAULT_RESPONSE_TIMEOUT_MS 60000
#define PARLEY_DEFAULT_INTERRUPT_TIMEOUT_MS 500
#define PARLEY_DEFAULT_CAPTURE_CHUNKS 32
#define PARLEY_DEFAULT_PLAYBACK_CHUNKS 64
#define PARLEY_DEFAULT_CODEC_ERROR_THRESHOLD 8
#define PARLEY_DEFAULT_RESTART_DELAY_MS 5000

/* =============================================================================
 * Configuration Structure
 * ============================================================================= */

/**
 * @brief Complete client configuration
 */
typedef struct parley_config {
   /* Cloud endpoint */
   struct {
      char url[CONFIG_URL_MAX];               /* ws:// or wss:// endpoint */
      char bot_id[CONFIG_ID_MAX];             /* Appended as ?bot_id= when set */
      char access_token[CONFIG_TOKEN_MAX];    /* Sent as Authorization: Bearer */
      bool ssl_verify;                        /* false = accept self-signed certs */
      char wire_format[CONFIG_FORMAT_MAX];    /* Audio on the wire: "json" or "binary" */
   } server;

   /* Audio format and devices */
   struct {
      unsigned int sample_rate;                /* Hz, capture and playback */
      unsigned int channels;                   /* 1 or 2 */
      unsigned int chunk_bytes;                /* Bytes per audio frame payload */
      char capture_device[CONFIG_DEVICE_MAX];  /* ALSA capture device */
      char playback_device[CONFIG_DEVICE_MAX]; /* ALSA playback device */
      char voice_id[CONFIG_ID_MAX];            /* Server voice, empty = server default */
   } audio;

   /* End-of-utterance detection */
   struct {
      bool enabled;
      int silence_threshold;   /* Mean absolute amplitude at or below = silence */
      int silence_duration_ms; /* Silence after speech that ends the user turn */
   } vad;

   /* Session behavior */
   struct {
      bool continuous;        /* true: back to LISTENING after each reply, false: one-shot */
      bool barge_in;          /* Allow interrupting playback */
      bool require_handshake; /* Wait for chat.created/chat.updated before listening */
      int max_reconnect_attempts;
      int backoff_base_ms;
      int backoff_cap_ms;
      int connect_timeout_ms;
      int response_timeout_ms;
      int interrupt_timeout_ms;
      int capture_buffer_chunks;
      int playback_buffer_chunks;
      int codec_error_threshold; /* Consecutive malformed frames before ERROR */
   } session;

   /* Session controller */
   struct {
      bool auto_restart; /* Recreate the session after it closes on retry exhaustion */
      int restart_delay_ms;
   } controller;

   struct {
      char level[CONFIG_LEVEL_MAX]; /* "info", "warning", "error" */
   } logging;
} parley_config_t;

/**
 * @brief Fill a config struct with default values
 *
 * @param config Config struct to initialize
 */
void parley_config_init_defaults(parley_config_t *config);

#ifdef __cplusplus
}
#endif

#endif /* PARLEY_CONFIG_H */
