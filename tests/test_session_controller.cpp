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

#include <signal.h>
#include <string.h>

#include <chrono>

#include "session/session_controller.h"
#include "session_fakes.h"

namespace {

class SessionControllerTest : public ::testing::Test {
 protected:
   void SetUp() override {
      config_ = fakes::test_config();
      memset(&caps_, 0, sizeof(caps_));
      transport_.bind(&caps_.transport);
      capture_.bind(&caps_.capture);
      sink_.bind(&caps_.sink);
      clock_.bind(&caps_.clock);
   }

   void TearDown() override { session_controller_destroy(ctrl_); }

   void create() {
      int err = SESSION_SUCCESS;
      ctrl_ = session_controller_create(&config_, &caps_, &err);
      ASSERT_NE(ctrl_, nullptr);
      ASSERT_EQ(err, SESSION_SUCCESS);
   }

   session_state_t state() const { return session_controller_get_state(ctrl_); }

   parley_config_t config_;
   session_capabilities_t caps_;
   fakes::FakeTransport transport_;
   fakes::FakeCapture capture_;
   fakes::FakeSink sink_;
   fakes::FakeClock clock_;
   session_controller_t *ctrl_ = nullptr;
};

}  // namespace

TEST_F(SessionControllerTest, RejectsInvalidConfig) {
   config_.session.max_reconnect_attempts = 0;
   int err = SESSION_SUCCESS;
   EXPECT_EQ(session_controller_create(&config_, &caps_, &err), nullptr);
   EXPECT_EQ(err, SESSION_ERR_CONFIG);
}

TEST_F(SessionControllerTest, NoSessionBeforeStart) {
   create();
   EXPECT_EQ(session_controller_get_session(ctrl_), nullptr);
   EXPECT_EQ(state(), SESSION_STATE_IDLE);
   EXPECT_EQ(session_controller_service(ctrl_, 0), SESSION_SUCCESS);
   EXPECT_EQ(session_controller_interrupt(ctrl_), SESSION_ERR_STATE);
   EXPECT_EQ(session_controller_end_of_utterance(ctrl_), SESSION_ERR_STATE);
}

TEST_F(SessionControllerTest, StartCreatesAndConnects) {
   create();
   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);
   EXPECT_NE(session_controller_get_session(ctrl_), nullptr);
   EXPECT_EQ(state(), SESSION_STATE_CONNECTING);
   EXPECT_EQ(transport_.open_calls, 1);

   transport_.push_control("chat.created");
   transport_.push_control("chat.updated");
   EXPECT_EQ(session_controller_service(ctrl_, 0), SESSION_SUCCESS);
   EXPECT_EQ(state(), SESSION_STATE_LISTENING);

   EXPECT_EQ(session_controller_end_of_utterance(ctrl_), SESSION_SUCCESS);
   EXPECT_EQ(state(), SESSION_STATE_WAITING);
}

TEST_F(SessionControllerTest, SecondStartWhileActiveIsRejected) {
   create();
   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);
   voice_session_t *first = session_controller_get_session(ctrl_);

   EXPECT_EQ(session_controller_start(ctrl_), SESSION_ERR_STATE);
   EXPECT_EQ(session_controller_get_session(ctrl_), first);
}

TEST_F(SessionControllerTest, StopIsFinal) {
   config_.controller.auto_restart = true;
   create();
   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);

   session_controller_stop(ctrl_);
   EXPECT_EQ(state(), SESSION_STATE_CLOSED);

   clock_.now += 10000;
   EXPECT_EQ(session_controller_service(ctrl_, 0), SESSION_ERR_CLOSED);
   EXPECT_EQ(session_controller_service(ctrl_, 0), SESSION_ERR_CLOSED);
   EXPECT_EQ(session_controller_get_restarts(ctrl_), 0);
   EXPECT_EQ(transport_.open_calls, 1);
}

TEST_F(SessionControllerTest, StartAfterStopReplacesClosedSession) {
   create();
   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);
   voice_session_t *first = session_controller_get_session(ctrl_);
   session_controller_stop(ctrl_);

   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);
   EXPECT_NE(session_controller_get_session(ctrl_), first);
   EXPECT_EQ(state(), SESSION_STATE_CONNECTING);
}

TEST_F(SessionControllerTest, ClosedWithoutAutoRestartEndsService) {
   transport_.open_result = TRANSPORT_ERR_CONNECT;
   config_.session.max_reconnect_attempts = 1;
   create();

   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);
   EXPECT_EQ(state(), SESSION_STATE_CLOSED);
   EXPECT_EQ(session_controller_service(ctrl_, 0), SESSION_ERR_CLOSED);
}

TEST_F(SessionControllerTest, AutoRestartAfterDelay) {
   transport_.open_result = TRANSPORT_ERR_CONNECT;
   config_.controller.auto_restart = true;
   create();

   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);
   voice_session_t *first = session_controller_get_session(ctrl_);

   /* Backoff 100 ms then 200 ms, third failure closes the session */
   clock_.now += 100;
   EXPECT_EQ(session_controller_service(ctrl_, 0), SESSION_SUCCESS);
   clock_.now += 200;
   EXPECT_EQ(session_controller_service(ctrl_, 0), SESSION_SUCCESS);
   EXPECT_EQ(state(), SESSION_STATE_CLOSED);
   EXPECT_EQ(transport_.open_calls, 3);

   /* Restart is scheduled but not due */
   clock_.now += 1999;
   EXPECT_EQ(session_controller_service(ctrl_, 0), SESSION_SUCCESS);
   EXPECT_EQ(session_controller_get_restarts(ctrl_), 0);

   transport_.open_result = TRANSPORT_SUCCESS;
   clock_.now += 1;
   EXPECT_EQ(session_controller_service(ctrl_, 0), SESSION_SUCCESS);
   EXPECT_EQ(session_controller_get_restarts(ctrl_), 1);
   EXPECT_NE(session_controller_get_session(ctrl_), first);
   EXPECT_EQ(state(), SESSION_STATE_CONNECTING);
   EXPECT_EQ(transport_.open_calls, 4);
}

TEST_F(SessionControllerTest, RunReturnsWhenFlagCleared) {
   create();
   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);

   volatile sig_atomic_t running = 0;
   EXPECT_EQ(session_controller_run(ctrl_, &running, 0), SESSION_SUCCESS);
   EXPECT_EQ(state(), SESSION_STATE_CONNECTING);
}

TEST_F(SessionControllerTest, RunReturnsWhenSessionCloses) {
   transport_.open_result = TRANSPORT_ERR_CONNECT;
   config_.session.max_reconnect_attempts = 1;
   create();
   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);

   volatile sig_atomic_t running = 1;
   EXPECT_EQ(session_controller_run(ctrl_, &running, 0), SESSION_ERR_CLOSED);
}

TEST_F(SessionControllerTest, PendingRestartBlocksForTheTimeout) {
   caps_.clock.now_ms = nullptr; /* Monotonic clock */
   transport_.open_result = TRANSPORT_ERR_CONNECT;
   config_.session.max_reconnect_attempts = 1;
   config_.controller.auto_restart = true;
   config_.controller.restart_delay_ms = 60000;
   create();
   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);
   ASSERT_EQ(state(), SESSION_STATE_CLOSED);

   int calls = 0;
   auto begin = std::chrono::steady_clock::now();
   while (std::chrono::steady_clock::now() - begin < std::chrono::milliseconds(100)) {
      EXPECT_EQ(session_controller_service(ctrl_, 20), SESSION_SUCCESS);
      calls++;
   }

   EXPECT_GE(calls, 1);
   EXPECT_LE(calls, 10);
   EXPECT_EQ(session_controller_get_restarts(ctrl_), 0);
   EXPECT_EQ(transport_.open_calls, 1);
}

TEST_F(SessionControllerTest, RestartWaitEndsAtTheRestartTime) {
   caps_.clock.now_ms = nullptr;
   transport_.open_result = TRANSPORT_ERR_CONNECT;
   config_.session.max_reconnect_attempts = 1;
   config_.controller.auto_restart = true;
   config_.controller.restart_delay_ms = 30;
   create();
   ASSERT_EQ(session_controller_start(ctrl_), SESSION_SUCCESS);

   /* Schedules the restart, then waits about 30 ms rather than 5 s */
   auto begin = std::chrono::steady_clock::now();
   EXPECT_EQ(session_controller_service(ctrl_, 5000), SESSION_SUCCESS);
   auto elapsed = std::chrono::steady_clock::now() - begin;
   EXPECT_LT(elapsed, std::chrono::milliseconds(1000));

   transport_.open_result = TRANSPORT_SUCCESS;
   for (int i = 0; i < 10 && session_controller_get_restarts(ctrl_) == 0; i++)
      EXPECT_EQ(session_controller_service(ctrl_, 50), SESSION_SUCCESS);
   EXPECT_EQ(session_controller_get_restarts(ctrl_), 1);
   EXPECT_EQ(state(), SESSION_STATE_CONNECTING);
}
