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

#include <getopt.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include "audio/alsa_capture.h"
#include "audio/alsa_sink.h"
#include "config/config_env.h"
#include "config/config_parser.h"
#include "config/config_validate.h"
#include "config/parley_config.h"
#include "logging_bridge.h"
#include "logging_common.h"
#include "network/ws_transport.h"
#include "session/session_controller.h"

#define SERVICE_TIMEOUT_MS 20
#define MAX_REPORTED_ERRORS 32

static volatile sig_atomic_t g_running = 1;

static void signal_handler(int sig) {
   (void)sig;
   g_running = 0;
}

static void print_usage(const char *prog) {
   printf("Usage: %s [options]\n\n", prog);
   printf("Options:\n");
   printf("  --config=PATH     Configuration file (default: search %s, %s, %s)\n",
          CONFIG_PATH_LOCAL, CONFIG_PATH_HOME, CONFIG_PATH_ETC);
   printf("  --url=URL         Server endpoint (ws:// or wss://)\n");
   printf("  --device=NAME     ALSA device for both capture and playback\n");
   printf("  --one-shot        Return to idle after one reply instead of listening again\n");
   printf("  --dump-config     Print the effective configuration and exit\n");
   printf("  --help            Show this help\n\n");
   printf("While running: Enter ends your turn while listening, interrupts while\n");
   printf("speaking, or starts a new interaction when idle. q + Enter quits.\n");
}

/* Log status sink: the display layer lives outside this program */
static void log_status(void *ctx, session_state_t state, const char *detail) {
   (void)ctx;
   if (state == SESSION_STATE_ERROR || state == SESSION_STATE_CLOSED) {
      PARLEY_LOG_WARNING("[%s] %s", session_state_name(state), detail ? detail : "");
   } else {
      PARLEY_LOG_INFO("[%s] %s", session_state_name(state), detail ? detail : "");
   }
}

/**
 * @brief Handle one line typed on stdin
 * @return false when the user asked to quit
 */
static bool handle_command(session_controller_t *ctrl, const std::string &line) {
   if (line == "q" || line == "quit")
      return false;

   int rc = SESSION_SUCCESS;
   switch (session_controller_get_state(ctrl)) {
      case SESSION_STATE_LISTENING:
         rc = session_controller_end_of_utterance(ctrl);
         break;
      case SESSION_STATE_SPEAKING:
         rc = session_controller_interrupt(ctrl);
         break;
      case SESSION_STATE_IDLE:
      case SESSION_STATE_CLOSED:
         rc = session_controller_start(ctrl);
         break;
      default:
         PARLEY_LOG_INFO("Busy (%s), input ignored",
                         session_state_name(session_controller_get_state(ctrl)));
         return true;
   }

   if (rc != SESSION_SUCCESS)
      PARLEY_LOG_WARNING("Command rejected: %s", session_error_string(rc));
   return true;
}

/**
 * @brief Drain complete lines from stdin without blocking
 * @return false on quit
 */
static bool poll_stdin(session_controller_t *ctrl, std::string &pending, bool &stdin_open) {
   if (!stdin_open)
      return true;

   struct pollfd pfd;
   pfd.fd = STDIN_FILENO;
   pfd.events = POLLIN;
   pfd.revents = 0;
   if (poll(&pfd, 1, 0) <= 0 || !(pfd.revents & (POLLIN | POLLHUP)))
      return true;

   char buf[256];
   ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
   if (n <= 0) {
      stdin_open = false;
      return true;
   }
   pending.append(buf, static_cast<size_t>(n));

   size_t pos;
   while ((pos = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, pos);
      pending.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r')
         line.pop_back();
      if (!handle_command(ctrl, line))
         return false;
   }
   return true;
}

int main(int argc, char *argv[]) {
   const char *config_path = NULL;
   const char *url = NULL;
   const char *device = NULL;
   bool one_shot = false;
   bool dump_config = false;

   static const struct option long_options[] = {
      { "config", required_argument, NULL, 'c' },
      { "url", required_argument, NULL, 'u' },
      { "device", required_argument, NULL, 'd' },
      { "one-shot", no_argument, NULL, '1' },
      { "dump-config", no_argument, NULL, 'D' },
      { "help", no_argument, NULL, 'h' },
      { NULL, 0, NULL, 0 },
   };

   int opt;
   while ((opt = getopt_long(argc, argv, "c:u:d:h", long_options, NULL)) != -1) {
      switch (opt) {
         case 'c':
            config_path = optarg;
            break;
         case 'u':
            url = optarg;
            break;
         case 'd':
            device = optarg;
            break;
         case '1':
            one_shot = true;
            break;
         case 'D':
            dump_config = true;
            break;
         case 'h':
            print_usage(argv[0]);
            return 0;
         default:
            print_usage(argv[0]);
            return 1;
      }
   }

   /* Warnings from config loading go to stderr before the level is known */
   logging_bridge_init(PARLEY_LOG_INFO);

   parley_config_t config;
   parley_config_init_defaults(&config);
   if (config_load_from_search(config_path, &config) != 0) {
      fprintf(stderr, "Failed to load configuration\n");
      return 1;
   }
   config_apply_env(&config);

   if (url)
      snprintf(config.server.url, sizeof(config.server.url), "%s", url);
   if (device) {
      snprintf(config.audio.capture_device, sizeof(config.audio.capture_device), "%s", device);
      snprintf(config.audio.playback_device, sizeof(config.audio.playback_device), "%s", device);
   }
   if (one_shot)
      config.session.continuous = false;

   config_error_t errors[MAX_REPORTED_ERRORS];
   int error_count = parley_config_validate(&config, errors, MAX_REPORTED_ERRORS);
   if (error_count > 0) {
      config_print_errors(errors,
                          error_count < MAX_REPORTED_ERRORS ? error_count : MAX_REPORTED_ERRORS);
      return 1;
   }

   if (dump_config) {
      config_dump_toml(&config, stdout);
      return 0;
   }

   parley_log_level_t level = PARLEY_LOG_INFO;
   parley_log_level_parse(config.logging.level, &level);
   logging_bridge_set_level(level);

   if (config_get_loaded_path())
      PARLEY_LOG_INFO("Configuration: %s", config_get_loaded_path());

   struct sigaction sa;
   memset(&sa, 0, sizeof(sa));
   sa.sa_handler = signal_handler;
   sigemptyset(&sa.sa_mask);
   sigaction(SIGINT, &sa, NULL);
   sigaction(SIGTERM, &sa, NULL);

   ws_transport_t *transport = ws_transport_create(&config);
   alsa_capture_t *capture = alsa_capture_create(&config);
   alsa_sink_t *sink = alsa_sink_create(&config);
   if (!transport || !capture || !sink) {
      PARLEY_LOG_ERROR("Failed to create host adapters");
      alsa_sink_destroy(sink);
      alsa_capture_destroy(capture);
      ws_transport_destroy(transport);
      return 1;
   }

   session_capabilities_t caps;
   memset(&caps, 0, sizeof(caps));
   ws_transport_bind(transport, &caps.transport);
   alsa_capture_bind(capture, &caps.capture);
   alsa_sink_bind(sink, &caps.sink);
   caps.status.notify = log_status;

   int err = SESSION_SUCCESS;
   session_controller_t *ctrl = session_controller_create(&config, &caps, &err);
   if (!ctrl) {
      PARLEY_LOG_ERROR("Failed to create session controller: %s", session_error_string(err));
      alsa_sink_destroy(sink);
      alsa_capture_destroy(capture);
      ws_transport_destroy(transport);
      return 1;
   }

   int exit_code = 0;
   err = session_controller_start(ctrl);
   if (err != SESSION_SUCCESS) {
      PARLEY_LOG_ERROR("Failed to start session: %s", session_error_string(err));
      exit_code = 1;
      g_running = 0;
   }

   std::string pending;
   bool stdin_open = isatty(STDIN_FILENO) != 0;
   while (g_running) {
      if (!poll_stdin(ctrl, pending, stdin_open))
         break;

      int rc = session_controller_service(ctrl, SERVICE_TIMEOUT_MS);
      if (rc == SESSION_ERR_CLOSED) {
         voice_session_t *session = session_controller_get_session(ctrl);
         PARLEY_LOG_ERROR("Session closed: %s",
                          session ? voice_session_get_error(session) : "no session");
         const char *ws_error = ws_transport_get_error(transport);
         if (ws_error[0])
            PARLEY_LOG_ERROR("Last connection error: %s", ws_error);
         exit_code = 1;
         break;
      }
   }

   PARLEY_LOG_INFO("Shutting down");
   session_controller_stop(ctrl);
   session_controller_destroy(ctrl);
   alsa_sink_destroy(sink);
   alsa_capture_destroy(capture);
   ws_transport_destroy(transport);

   return exit_code;
}
