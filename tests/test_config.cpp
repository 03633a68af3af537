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

#include <gtest/gtest.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include "config/config_env.h"
#include "config/config_parser.h"
#include "config/config_validate.h"
#include "config/parley_config.h"

namespace {

class ConfigTest : public ::testing::Test {
 protected:
   void SetUp() override { parley_config_init_defaults(&config_); }

   bool has_error(const char *field) {
      config_error_t errors[32];
      int count = parley_config_validate(&config_, errors, 32);
      for (int i = 0; i < count && i < 32; i++) {
         if (strcmp(errors[i].field, field) == 0)
            return true;
      }
      return false;
   }

   parley_config_t config_;
};

/* Sets an environment variable for the lifetime of the object */
class ScopedEnv {
 public:
   ScopedEnv(const char *name, const char *value) : name_(name) { setenv(name, value, 1); }
   ~ScopedEnv() { unsetenv(name_.c_str()); }

 private:
   std::string name_;
};

}  // namespace

/* =============================================================================
 * Defaults and validation
 * ============================================================================= */

TEST_F(ConfigTest, DefaultsAreValid) {
   EXPECT_EQ(parley_config_validate(&config_, nullptr, 0), 0);
   EXPECT_STREQ(config_.server.url, PARLEY_DEFAULT_URL);
   EXPECT_EQ(config_.audio.sample_rate, 16000u);
   EXPECT_EQ(config_.audio.channels, 1u);
   EXPECT_EQ(config_.audio.chunk_bytes, 1024u);
   EXPECT_STREQ(config_.audio.capture_device, "default");
   EXPECT_TRUE(config_.server.ssl_verify);
   EXPECT_STREQ(config_.server.wire_format, "json");
   EXPECT_TRUE(config_.session.continuous);
   EXPECT_TRUE(config_.session.barge_in);
   EXPECT_EQ(config_.session.max_reconnect_attempts, 5);
   EXPECT_FALSE(config_.controller.auto_restart);
   EXPECT_STREQ(config_.logging.level, "info");
}

TEST_F(ConfigTest, RejectsNonWebSocketUrl) {
   snprintf(config_.server.url, sizeof(config_.server.url), "http://example.com/chat");
   EXPECT_TRUE(has_error("server.url"));

   snprintf(config_.server.url, sizeof(config_.server.url), "wss://");
   EXPECT_TRUE(has_error("server.url"));

   config_.server.url[0] = '\0';
   EXPECT_TRUE(has_error("server.url"));

   snprintf(config_.server.url, sizeof(config_.server.url), "ws://a");
   EXPECT_FALSE(has_error("server.url"));
}

TEST_F(ConfigTest, WireFormatIsJsonOrBinary) {
   snprintf(config_.server.wire_format, sizeof(config_.server.wire_format), "binary");
   EXPECT_FALSE(has_error("server.wire_format"));

   snprintf(config_.server.wire_format, sizeof(config_.server.wire_format), "base64");
   EXPECT_TRUE(has_error("server.wire_format"));

   config_.server.wire_format[0] = '\0';
   EXPECT_TRUE(has_error("server.wire_format"));
}

TEST_F(ConfigTest, ChunkMustHoldWholeFrames) {
   config_.audio.channels = 2;
   config_.audio.chunk_bytes = 1026;
   EXPECT_TRUE(has_error("audio.chunk_bytes"));

   config_.audio.chunk_bytes = 1024;
   EXPECT_FALSE(has_error("audio.chunk_bytes"));

   config_.audio.chunk_bytes = 0;
   EXPECT_TRUE(has_error("audio.chunk_bytes"));
}

TEST_F(ConfigTest, RangeChecks) {
   config_.audio.sample_rate = 4000;
   EXPECT_TRUE(has_error("audio.sample_rate"));
   config_.audio.channels = 3;
   EXPECT_TRUE(has_error("audio.channels"));
   config_.session.max_reconnect_attempts = 0;
   EXPECT_TRUE(has_error("session.max_reconnect_attempts"));
   config_.session.playback_buffer_chunks = 1;
   EXPECT_TRUE(has_error("session.playback_buffer_chunks"));
   config_.vad.silence_duration_ms = 50;
   EXPECT_TRUE(has_error("vad.silence_duration_ms"));
}

TEST_F(ConfigTest, BackoffCapNotBelowBase) {
   config_.session.backoff_base_ms = 2000;
   config_.session.backoff_cap_ms = 1000;
   EXPECT_TRUE(has_error("session.backoff_cap_ms"));
}

TEST_F(ConfigTest, EmptyDeviceAndBadLevel) {
   config_.audio.playback_device[0] = '\0';
   snprintf(config_.logging.level, sizeof(config_.logging.level), "verbose");
   EXPECT_TRUE(has_error("audio.playback_device"));
   EXPECT_TRUE(has_error("logging.level"));
}

TEST_F(ConfigTest, CountsErrorsBeyondArray) {
   config_.audio.sample_rate = 1;
   config_.audio.channels = 9;
   config_.session.codec_error_threshold = 0;

   config_error_t errors[1];
   int count = parley_config_validate(&config_, errors, 1);
   EXPECT_GE(count, 3);
   EXPECT_STREQ(errors[0].field, "audio.sample_rate");
}

/* =============================================================================
 * TOML parsing
 * ============================================================================= */

TEST_F(ConfigTest, ParsesTomlSections) {
   const char *toml =
       "[server]\n"
       "url = \"ws://localhost:8080/v1/chat\"\n"
       "bot_id = \"bot-1\"\n"
       "ssl_verify = false\n"
       "wire_format = \"binary\"\n"
       "[audio]\n"
       "sample_rate = 24000\n"
       "chunk_bytes = 640\n"
       "voice_id = \"v-9\"\n"
       "[session]\n"
       "continuous = false\n"
       "max_reconnect_attempts = 3\n"
       "[controller]\n"
       "auto_restart = true\n"
       "[logging]\n"
       "level = \"warning\"\n";

   ASSERT_EQ(config_parse_string(toml, &config_), 0);
   EXPECT_STREQ(config_.server.url, "ws://localhost:8080/v1/chat");
   EXPECT_STREQ(config_.server.bot_id, "bot-1");
   EXPECT_FALSE(config_.server.ssl_verify);
   EXPECT_STREQ(config_.server.wire_format, "binary");
   EXPECT_EQ(config_.audio.sample_rate, 24000u);
   EXPECT_EQ(config_.audio.chunk_bytes, 640u);
   EXPECT_STREQ(config_.audio.voice_id, "v-9");
   EXPECT_FALSE(config_.session.continuous);
   EXPECT_EQ(config_.session.max_reconnect_attempts, 3);
   EXPECT_TRUE(config_.controller.auto_restart);
   EXPECT_STREQ(config_.logging.level, "warning");

   /* Untouched keys keep their defaults */
   EXPECT_EQ(config_.audio.channels, 1u);
   EXPECT_EQ(config_.session.backoff_base_ms, PARLEY_DEFAULT_BACKOFF_BASE_MS);
}

TEST_F(ConfigTest, UnknownKeysAndSectionsAreIgnored) {
   const char *toml =
       "[display]\n"
       "brightness = 3\n"
       "[audio]\n"
       "sample_rate = 8000\n"
       "equalizer = \"flat\"\n";

   EXPECT_EQ(config_parse_string(toml, &config_), 0);
   EXPECT_EQ(config_.audio.sample_rate, 8000u);
}

TEST_F(ConfigTest, TypeMismatchIsAnError) {
   EXPECT_NE(config_parse_string("[audio]\nsample_rate = \"fast\"\n", &config_), 0);
   EXPECT_NE(config_parse_string("[session]\nbarge_in = 1\n", &config_), 0);
   EXPECT_NE(config_parse_string("[audio]\nchannels = -1\n", &config_), 0);
   EXPECT_NE(config_parse_string("server = 5\n", &config_), 0);
}

TEST_F(ConfigTest, SyntaxErrorIsAnError) {
   EXPECT_NE(config_parse_string("[audio\nsample_rate = 1\n", &config_), 0);
}

TEST_F(ConfigTest, ParsesFileAndSearchesExplicitPath) {
   char path[] = "/tmp/parley_config_testXXXXXX";
   int fd = mkstemp(path);
   ASSERT_GE(fd, 0);
   const char *toml = "[vad]\nsilence_threshold = 250\n";
   ASSERT_EQ(write(fd, toml, strlen(toml)), static_cast<ssize_t>(strlen(toml)));
   close(fd);

   EXPECT_EQ(config_file_readable(path), 1);
   ASSERT_EQ(config_load_from_search(path, &config_), 0);
   EXPECT_EQ(config_.vad.silence_threshold, 250);
   EXPECT_STREQ(config_get_loaded_path(), path);

   unlink(path);
}

TEST_F(ConfigTest, MissingExplicitPathFails) {
   EXPECT_EQ(config_file_readable("/nonexistent/parley.toml"), 0);
   EXPECT_NE(config_load_from_search("/nonexistent/parley.toml", &config_), 0);
   EXPECT_NE(config_parse_file("/nonexistent/parley.toml", &config_), 0);
}

/* =============================================================================
 * Environment overrides and dump
 * ============================================================================= */

TEST_F(ConfigTest, EnvironmentOverrides) {
   ScopedEnv url("PARLEY_SERVER_URL", "wss://edge.example.com/chat");
   ScopedEnv barge("PARLEY_SESSION_BARGE_IN", "off");
   ScopedEnv rate("PARLEY_AUDIO_SAMPLE_RATE", "48000");

   EXPECT_EQ(config_apply_env(&config_), 3);
   EXPECT_STREQ(config_.server.url, "wss://edge.example.com/chat");
   EXPECT_FALSE(config_.session.barge_in);
   EXPECT_EQ(config_.audio.sample_rate, 48000u);
}

TEST_F(ConfigTest, InvalidEnvironmentValueIsIgnored) {
   ScopedEnv rate("PARLEY_AUDIO_SAMPLE_RATE", "fast");
   ScopedEnv restart("PARLEY_CONTROLLER_AUTO_RESTART", "maybe");

   EXPECT_EQ(config_apply_env(&config_), 0);
   EXPECT_EQ(config_.audio.sample_rate, 16000u);
   EXPECT_FALSE(config_.controller.auto_restart);
}

TEST_F(ConfigTest, DumpMasksAccessToken) {
   snprintf(config_.server.access_token, sizeof(config_.server.access_token), "s3cret-token");
   snprintf(config_.audio.voice_id, sizeof(config_.audio.voice_id), "say \"hi\"");

   char *buf = nullptr;
   size_t size = 0;
   FILE *out = open_memstream(&buf, &size);
   ASSERT_NE(out, nullptr);
   config_dump_toml(&config_, out);
   fclose(out);

   std::string text(buf, size);
   free(buf);

   EXPECT_EQ(text.find("s3cret-token"), std::string::npos);
   EXPECT_NE(text.find("access_token = \"********\""), std::string::npos);
   EXPECT_NE(text.find("[session]"), std::string::npos);
   EXPECT_NE(text.find("sample_rate = 16000"), std::string::npos);
   EXPECT_NE(text.find("barge_in = true"), std::string::npos);
   EXPECT_NE(text.find("voice_id = \"say \\\"hi\\\"\""), std::string::npos);
}

TEST_F(ConfigTest, DumpedConfigParsesBack) {
   snprintf(config_.server.bot_id, sizeof(config_.server.bot_id), "bot-42");
   config_.session.interrupt_timeout_ms = 750;

   char *buf = nullptr;
   size_t size = 0;
   FILE *out = open_memstream(&buf, &size);
   ASSERT_NE(out, nullptr);
   config_dump_toml(&config_, out);
   fclose(out);
   std::string text(buf, size);
   free(buf);

   parley_config_t reloaded;
   parley_config_init_defaults(&reloaded);
   ASSERT_EQ(config_parse_string(text.c_str(), &reloaded), 0);
   EXPECT_STREQ(reloaded.server.bot_id, "bot-42");
   EXPECT_EQ(reloaded.session.interrupt_timeout_ms, 750);
}
