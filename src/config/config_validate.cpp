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
 * PARLEY Configuration Validation
 */

#include "config/config_validate.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "logging_common.h"
#include "session/frame_codec.h"

namespace {

class ErrorCollector {
 public:
   ErrorCollector(config_error_t *errors, size_t max_errors)
       : errors_(errors), max_errors_(max_errors), count_(0) {}

   __attribute__((format(printf, 3, 4))) void add(const char *field, const char *fmt, ...) {
      if (errors_ && static_cast<size_t>(count_) < max_errors_) {
         config_error_t *err = &errors_[count_];
         snprintf(err->field, sizeof(err->field), "%s", field);
         va_list args;
         va_start(args, fmt);
         vsnprintf(err->message, sizeof(err->message), fmt, args);
         va_end(args);
      }
      count_++;
   }

   void check_range(const char *field, long long value, long long min, long long max) {
      if (value < min || value > max)
         add(field, "must be between %lld and %lld (got %lld)", min, max, value);
   }

   void check_not_empty(const char *field, const char *value) {
      if (!value[0])
         add(field, "must not be empty");
   }

   int count() const { return count_; }

 private:
   config_error_t *errors_;
   size_t max_errors_;
   int count_;
};

/* True for ws://host... or wss://host... */
bool is_ws_url(const char *url) {
   const char *host = NULL;
   if (strncmp(url, "ws://", 5) == 0)
      host = url + 5;
   else if (strncmp(url, "wss://", 6) == 0)
      host = url + 6;
   return host && host[0] && host[0] != '/';
}

}  // namespace

extern "C" {

int parley_config_validate(const parley_config_t *config, config_error_t *errors, size_t max_errors) {
   ErrorCollector v(errors, max_errors);

   if (!config) {
      v.add("config", "configuration is missing");
      return v.count();
   }

   /* [server] */
   if (!config->server.url[0]) {
      v.add("server.url", "must not be empty");
   } else if (!is_ws_url(config->server.url)) {
      v.add("server.url", "must start with ws:// or wss:// and name a host");
   }
   frame_wire_format_t format;
   if (frame_wire_format_parse(config->server.wire_format, &format) != 0) {
      v.add("server.wire_format", "must be json or binary (got '%s')",
            config->server.wire_format);
   }

   /* [audio] */
   v.check_range("audio.sample_rate", config->audio.sample_rate, 8000, 48000);
   v.check_range("audio.channels", config->audio.channels, 1, 2);
   v.check_range("audio.chunk_bytes", config->audio.chunk_bytes, 2, 16384);
   if (config->audio.channels >= 1 && config->audio.channels <= 2 &&
       config->audio.chunk_bytes % (2 * config->audio.channels) != 0) {
      v.add("audio.chunk_bytes", "must be a multiple of %u (whole 16-bit frames)",
            2 * config->audio.channels);
   }
   v.check_not_empty("audio.capture_device", config->audio.capture_device);
   v.check_not_empty("audio.playback_device", config->audio.playback_device);

   /* [vad] */
   v.check_range("vad.silence_threshold", config->vad.silence_threshold, 0, 32767);
   v.check_range("vad.silence_duration_ms", config->vad.silence_duration_ms, 100, 30000);

   /* [session] */
   v.check_range("session.max_reconnect_attempts", config->session.max_reconnect_attempts, 1, 100);
   v.check_range("session.backoff_base_ms", config->session.backoff_base_ms, 10, 60000);
   v.check_range("session.backoff_cap_ms", config->session.backoff_cap_ms, 10, 300000);
   if (config->session.backoff_cap_ms < config->session.backoff_base_ms) {
      v.add("session.backoff_cap_ms", "must not be less than session.backoff_base_ms (%d)",
            config->session.backoff_base_ms);
   }
   v.check_range("session.connect_timeout_ms", config->session.connect_timeout_ms, 100, 120000);
   v.check_range("session.response_timeout_ms", config->session.response_timeout_ms, 100, 600000);
   v.check_range("session.interrupt_timeout_ms", config->session.interrupt_timeout_ms, 10, 10000);
   v.check_range("session.capture_buffer_chunks", config->session.capture_buffer_chunks, 2, 1024);
   v.check_range("session.playback_buffer_chunks", config->session.playback_buffer_chunks, 2,
                 1024);
   v.check_range("session.codec_error_threshold", config->session.codec_error_threshold, 1, 1000);

   /* [controller] */
   v.check_range("controller.restart_delay_ms", config->controller.restart_delay_ms, 0, 600000);

   /* [logging] */
   parley_log_level_t level;
   if (parley_log_level_parse(config->logging.level, &level) != 0)
      v.add("logging.level", "must be one of info, warning, error (got '%s')", config->logging.level);

   return v.count();
}

void config_print_errors(const config_error_t *errors, int count) {
   if (!errors || count <= 0)
      return;

   fprintf(stderr, "Configuration errors:\n");
   for (int i = 0; i < count; i++)
      fprintf(stderr, "  %s: %s\n", errors[i].field, errors[i].message);
}

} /* extern "C" */
