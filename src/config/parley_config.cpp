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
 * PARLEY Configuration - defaults and the field table
 */

#include "config/parley_config.h"

#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

#include "config_fields.h"

#define FIELD_STR(sec, name, member, secret) \
   { #sec, #name, CONFIG_FIELD_STRING, offsetof(parley_config_t, sec.member), \
     sizeof(static_cast<parley_config_t *>(nullptr)->sec.member), secret }
#define FIELD_BOOL(sec, name) \
   { #sec, #name, CONFIG_FIELD_BOOL, offsetof(parley_config_t, sec.name), sizeof(bool), false }
#define FIELD_INT(sec, name) \
   { #sec, #name, CONFIG_FIELD_INT, offsetof(parley_config_t, sec.name), sizeof(int), false }
#define FIELD_UINT(sec, name) \
   { #sec, #name, CONFIG_FIELD_UINT, offsetof(parley_config_t, sec.name), sizeof(unsigned int), \
     false }

namespace {

const config_field_t g_fields[] = {
   FIELD_STR(server, url, url, false),
   FIELD_STR(server, bot_id, bot_id, false),
   FIELD_STR(server, access_token, access_token, true),
   FIELD_BOOL(server, ssl_verify),
   FIELD_STR(server, wire_format, wire_format, false),

   FIELD_UINT(audio, sample_rate),
   FIELD_UINT(audio, channels),
   FIELD_UINT(audio, chunk_bytes),
   FIELD_STR(audio, capture_device, capture_device, false),
   FIELD_STR(audio, playback_device, playback_device, false),
   FIELD_STR(audio, voice_id, voice_id, false),

   FIELD_BOOL(vad, enabled),
   FIELD_INT(vad, silence_threshold),
   FIELD_INT(vad, silence_duration_ms),

   FIELD_BOOL(session, continuous),
   FIELD_BOOL(session, barge_in),
   FIELD_BOOL(session, require_handshake),
   FIELD_INT(session, max_reconnect_attempts),
   FIELD_INT(session, backoff_base_ms),
   FIELD_INT(session, backoff_cap_ms),
   FIELD_INT(session, connect_timeout_ms),
   FIELD_INT(session, response_timeout_ms),
   FIELD_INT(session, interrupt_timeout_ms),
   FIELD_INT(session, capture_buffer_chunks),
   FIELD_INT(session, playback_buffer_chunks),
   FIELD_INT(session, codec_error_threshold),

   FIELD_BOOL(controller, auto_restart),
   FIELD_INT(controller, restart_delay_ms),

   FIELD_STR(logging, level, level, false),
};

void *field_ptr(parley_config_t *config, const config_field_t *field) {
   return reinterpret_cast<char *>(config) + field->offset;
}

const void *field_ptr(const parley_config_t *config, const config_field_t *field) {
   return reinterpret_cast<const char *>(config) + field->offset;
}

void copy_string(char *dst, size_t size, const char *src) {
   snprintf(dst, size, "%s", src);
}

}  // namespace

/* =============================================================================
 * Defaults
 * ============================================================================= */

extern "C" void parley_config_init_defaults(parley_config_t *config) {
   if (!config)
      return;

   memset(config, 0, sizeof(*config));

   copy_string(config->server.url, sizeof(config->server.url), PARLEY_DEFAULT_URL);
   config->server.ssl_verify = true;
   copy_string(config->server.wire_format, sizeof(config->server.wire_format), "json");

   config->audio.sample_rate = PARLEY_DEFAULT_SAMPLE_RATE;
   config->audio.channels = PARLEY_DEFAULT_CHANNELS;
   config->audio.chunk_bytes = PARLEY_DEFAULT_CHUNK_BYTES;
   copy_string(config->audio.capture_device, sizeof(config->audio.capture_device), "default");
   copy_string(config->audio.playback_device, sizeof(config->audio.playback_device), "default");

   config->vad.enabled = true;
   config->vad.silence_threshold = PARLEY_DEFAULT_SILENCE_THRESHOLD;
   config->vad.silence_duration_ms = PARLEY_DEFAULT_SILENCE_DURATION_MS;

   config->session.continuous = true;
   config->session.barge_in = true;
   config->session.require_handshake = true;
   config->session.max_reconnect_attempts = PARLEY_DEFAULT_MAX_RECONNECT;
   config->session.backoff_base_ms = PARLEY_DEFAULT_BACKOFF_BASE_MS;
   config->session.backoff_cap_ms = PARLEY_DEFAULT_BACKOFF_CAP_MS;
   config->session.connect_timeout_ms = PARLEY_DEFAULT_CONNECT_TIMEOUT_MS;
   config->session.response_timeout_ms = PARLEY_DEFAULT_RESPONSE_TIMEOUT_MS;
   config->session.interrupt_timeout_ms = PARLEY_DEFAULT_INTERRUPT_TIMEOUT_MS;
   config->session.capture_buffer_chunks = PARLEY_DEFAULT_CAPTURE_CHUNKS;
   config->session.playback_buffer_chunks = PARLEY_DEFAULT_PLAYBACK_CHUNKS;
   config->session.codec_error_threshold = PARLEY_DEFAULT_CODEC_ERROR_THRESHOLD;

   config->controller.auto_restart = false;
   config->controller.restart_delay_ms = PARLEY_DEFAULT_RESTART_DELAY_MS;

   copy_string(config->logging.level, sizeof(config->logging.level), "info");
}

/* =============================================================================
 * Field Table
 * ============================================================================= */

const config_field_t *config_fields(size_t *count_out) {
   if (count_out)
      *count_out = sizeof(g_fields) / sizeof(g_fields[0]);
   return g_fields;
}

const config_field_t *config_field_find(const char *section, const char *key) {
   if (!section || !key)
      return NULL;

   for (const config_field_t &field : g_fields) {
      if (strcmp(field.section, section) == 0 && strcmp(field.key, key) == 0)
         return &field;
   }
   return NULL;
}

int config_field_set_string(parley_config_t *config, const config_field_t *field, const char *value) {
   if (!config || !field || !value || field->type != CONFIG_FIELD_STRING)
      return 1;
   if (strlen(value) >= field->size)
      return 1;

   copy_string(static_cast<char *>(field_ptr(config, field)), field->size, value);
   return 0;
}

int config_field_set_int(parley_config_t *config, const config_field_t *field, long long value) {
   if (!config || !field)
      return 1;

   if (field->type == CONFIG_FIELD_INT) {
      if (value < INT_MIN || value > INT_MAX)
         return 1;
      *static_cast<int *>(field_ptr(config, field)) = static_cast<int>(value);
      return 0;
   }
   if (field->type == CONFIG_FIELD_UINT) {
      if (value < 0 || value > static_cast<long long>(UINT_MAX))
         return 1;
      *static_cast<unsigned int *>(field_ptr(config, field)) = static_cast<unsigned int>(value);
      return 0;
   }
   return 1;
}

void config_field_set_bool(parley_config_t *config, const config_field_t *field, bool value) {
   if (!config || !field || field->type != CONFIG_FIELD_BOOL)
      return;
   *static_cast<bool *>(field_ptr(config, field)) = value;
}

int config_field_set_text(parley_config_t *config, const config_field_t *field, const char *text) {
   if (!config || !field || !text)
      return 1;

   switch (field->type) {
      case CONFIG_FIELD_STRING:
         return config_field_set_string(config, field, text);

      case CONFIG_FIELD_BOOL:
         if (strcasecmp(text, "true") == 0 || strcasecmp(text, "yes") == 0 ||
             strcasecmp(text, "on") == 0 || strcmp(text, "1") == 0) {
            config_field_set_bool(config, field, true);
            return 0;
         }
         if (strcasecmp(text, "false") == 0 || strcasecmp(text, "no") == 0 ||
             strcasecmp(text, "off") == 0 || strcmp(text, "0") == 0) {
            config_field_set_bool(config, field, false);
            return 0;
         }
         return 1;

      case CONFIG_FIELD_INT:
      case CONFIG_FIELD_UINT: {
         if (*text == '\0')
            return 1;
         char *end = NULL;
         errno = 0;
         long long value = strtoll(text, &end, 10);
         if (errno != 0 || !end || *end != '\0')
            return 1;
         return config_field_set_int(config, field, value);
      }
   }
   return 1;
}

void config_field_format(const parley_config_t *config,
                         const config_field_t *field,
                         char *buf,
                         size_t buf_size) {
   if (!buf || buf_size == 0)
      return;
   buf[0] = '\0';
   if (!config || !field)
      return;

   switch (field->type) {
      case CONFIG_FIELD_STRING: {
         const char *value = static_cast<const char *>(field_ptr(config, field));
         size_t pos = 0;
         if (pos + 1 < buf_size)
            buf[pos++] = '"';
         for (const char *p = value; *p && pos + 3 < buf_size; p++) {
            if (*p == '"' || *p == '\\')
               buf[pos++] = '\\';
            buf[pos++] = *p;
         }
         if (pos + 1 < buf_size)
            buf[pos++] = '"';
         buf[pos] = '\0';
         break;
      }
      case CONFIG_FIELD_BOOL:
         snprintf(buf, buf_size, "%s",
                  *static_cast<const bool *>(field_ptr(config, field)) ? "true" : "false");
         break;
      case CONFIG_FIELD_INT:
         snprintf(buf, buf_size, "%d", *static_cast<const int *>(field_ptr(config, field)));
         break;
      case CONFIG_FIELD_UINT:
         snprintf(buf, buf_size, "%u",
                  *static_cast<const unsigned int *>(field_ptr(config, field)));
         break;
   }
}
