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

#include "session/session_controller.h"

#include <time.h>

#include <new>

#include "config/config_validate.h"
#include "logging_common.h"

struct session_controller {
   parley_config_t config;
   session_capabilities_t caps;
   voice_session_t *session;

   bool stopped;        /* Explicit stop: never restart */
   uint64_t restart_at; /* 0 = no restart scheduled */
   int restarts;
};

namespace {

void sleep_ms(uint64_t ms) {
   if (ms == 0)
      return;
   struct timespec ts;
   ts.tv_sec = static_cast<time_t>(ms / 1000);
   ts.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
   nanosleep(&ts, NULL);
}

/**
 * @brief Wait for a scheduled restart, at most timeout_ms
 */
void wait_for_restart(session_controller_t *c, int timeout_ms) {
   uint64_t now = session_clock_now_ms(&c->caps.clock);
   uint64_t remaining = c->restart_at > now ? c->restart_at - now : 0;
   uint64_t limit = timeout_ms > 0 ? static_cast<uint64_t>(timeout_ms) : 0;
   sleep_ms(remaining < limit ? remaining : limit);
}

int create_session(session_controller_t *c) {
   int err = SESSION_SUCCESS;
   voice_session_t *session = voice_session_create(&c->config, &c->caps, &err);
   if (!session) {
      PARLEY_LOG_ERROR("Controller: cannot create session: %s", session_error_string(err));
      return err;
   }

   voice_session_destroy(c->session);
   c->session = session;
   return SESSION_SUCCESS;
}

/**
 * @brief Schedule or perform an automatic restart of a closed session
 */
void apply_restart_policy(session_controller_t *c) {
   if (!c->session || c->stopped || !c->config.controller.auto_restart)
      return;
   if (voice_session_get_state(c->session) != SESSION_STATE_CLOSED)
      return;

   uint64_t now = session_clock_now_ms(&c->caps.clock);
   if (c->restart_at == 0) {
      c->restart_at = now + static_cast<uint64_t>(c->config.controller.restart_delay_ms);
      PARLEY_LOG_INFO("Controller: session closed (%s), restarting in %d ms",
                      voice_session_get_error(c->session), c->config.controller.restart_delay_ms);
      return;
   }
   if (now < c->restart_at)
      return;

   c->restart_at = 0;
   if (create_session(c) != SESSION_SUCCESS)
      return;
   c->restarts++;
   voice_session_start(c->session);
}

}  // namespace

extern "C" {

session_controller_t *session_controller_create(const parley_config_t *config,
                                                const session_capabilities_t *caps,
                                                int *err_out) {
   if (err_out)
      *err_out = SESSION_SUCCESS;

   if (!config || !caps) {
      if (err_out)
         *err_out = SESSION_ERR_INVALID;
      return NULL;
   }

   config_error_t errors[16];
   int count = parley_config_validate(config, errors, 16);
   if (count > 0) {
      for (int i = 0; i < count && i < 16; i++)
         PARLEY_LOG_ERROR("Config: %s: %s", errors[i].field, errors[i].message);
      if (err_out)
         *err_out = SESSION_ERR_CONFIG;
      return NULL;
   }

   session_controller_t *c = new (std::nothrow) session_controller_t();
   if (!c) {
      if (err_out)
         *err_out = SESSION_ERR_NO_MEMORY;
      return NULL;
   }

   c->config = *config;
   c->caps = *caps;
   return c;
}

void session_controller_destroy(session_controller_t *ctrl) {
   if (!ctrl)
      return;

   voice_session_destroy(ctrl->session);
   delete ctrl;
}

int session_controller_start(session_controller_t *ctrl) {
   if (!ctrl)
      return SESSION_ERR_INVALID;

   if (ctrl->session) {
      session_state_t state = voice_session_get_state(ctrl->session);
      if (state != SESSION_STATE_IDLE && state != SESSION_STATE_CLOSED)
         return SESSION_ERR_STATE;
   }

   if (!ctrl->session || voice_session_get_state(ctrl->session) == SESSION_STATE_CLOSED) {
      int rc = create_session(ctrl);
      if (rc != SESSION_SUCCESS)
         return rc;
   }

   ctrl->stopped = false;
   ctrl->restart_at = 0;
   return voice_session_start(ctrl->session);
}

void session_controller_stop(session_controller_t *ctrl) {
   if (!ctrl)
      return;

   ctrl->stopped = true;
   ctrl->restart_at = 0;
   voice_session_stop(ctrl->session);
}

int session_controller_interrupt(session_controller_t *ctrl) {
   if (!ctrl)
      return SESSION_ERR_INVALID;
   if (!ctrl->session)
      return SESSION_ERR_STATE;
   return voice_session_interrupt(ctrl->session);
}

int session_controller_end_of_utterance(session_controller_t *ctrl) {
   if (!ctrl)
      return SESSION_ERR_INVALID;
   if (!ctrl->session)
      return SESSION_ERR_STATE;
   return voice_session_end_of_utterance(ctrl->session);
}

int session_controller_service(session_controller_t *ctrl, int timeout_ms) {
   if (!ctrl)
      return SESSION_ERR_INVALID;
   if (!ctrl->session) {
      if (ctrl->stopped)
         return SESSION_ERR_CLOSED;
      sleep_ms(timeout_ms > 0 ? static_cast<uint64_t>(timeout_ms) : 0);
      return SESSION_SUCCESS;
   }

   int rc = voice_session_service(ctrl->session, timeout_ms);
   if (rc == SESSION_SUCCESS)
      return rc;

   /* A closed session returns at once, so the pending restart is the wait */
   apply_restart_policy(ctrl);
   if (ctrl->restart_at != 0) {
      wait_for_restart(ctrl, timeout_ms);
      return SESSION_SUCCESS;
   }
   if (voice_session_get_state(ctrl->session) != SESSION_STATE_CLOSED)
      return SESSION_SUCCESS;
   return SESSION_ERR_CLOSED;
}

int session_controller_run(session_controller_t *ctrl,
                           volatile sig_atomic_t *running,
                           int timeout_ms) {
   if (!ctrl || !running)
      return SESSION_ERR_INVALID;

   while (*running) {
      int rc = session_controller_service(ctrl, timeout_ms);
      if (rc == SESSION_ERR_CLOSED)
         return rc;
   }
   return SESSION_SUCCESS;
}

session_state_t session_controller_get_state(const session_controller_t *ctrl) {
   if (!ctrl || !ctrl->session)
      return SESSION_STATE_IDLE;
   return voice_session_get_state(ctrl->session);
}

voice_session_t *session_controller_get_session(session_controller_t *ctrl) {
   return ctrl ? ctrl->session : NULL;
}

int session_controller_get_restarts(const session_controller_t *ctrl) {
   return ctrl ? ctrl->restarts : 0;
}

} /* extern "C" */
