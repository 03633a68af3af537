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

#include <string>

#include "network/ws_url.h"

TEST(WsUrl, SecureDefaultsToPort443) {
   ws_url_t url;
   ASSERT_EQ(ws_url_parse("wss://ws.coze.cn/v1/chat", "", &url), 0);
   EXPECT_TRUE(url.tls);
   EXPECT_STREQ(url.host, "ws.coze.cn");
   EXPECT_EQ(url.port, 443);
   EXPECT_STREQ(url.path, "/v1/chat");
}

TEST(WsUrl, PlainWithPortAndNoPath) {
   ws_url_t url;
   ASSERT_EQ(ws_url_parse("ws://127.0.0.1:9001", nullptr, &url), 0);
   EXPECT_FALSE(url.tls);
   EXPECT_STREQ(url.host, "127.0.0.1");
   EXPECT_EQ(url.port, 9001);
   EXPECT_STREQ(url.path, "/");
}

TEST(WsUrl, AppendsBotId) {
   ws_url_t url;
   ASSERT_EQ(ws_url_parse("wss://h/v1/chat", "7342", &url), 0);
   EXPECT_STREQ(url.path, "/v1/chat?bot_id=7342");

   ASSERT_EQ(ws_url_parse("wss://h/v1/chat?region=eu", "7342", &url), 0);
   EXPECT_STREQ(url.path, "/v1/chat?region=eu&bot_id=7342");

   ASSERT_EQ(ws_url_parse("ws://h?x=1", "7", &url), 0);
   EXPECT_STREQ(url.path, "/?x=1&bot_id=7");
}

TEST(WsUrl, KeepsExistingBotId) {
   ws_url_t url;
   ASSERT_EQ(ws_url_parse("wss://h/chat?bot_id=1", "2", &url), 0);
   EXPECT_STREQ(url.path, "/chat?bot_id=1");
}

TEST(WsUrl, RejectsMalformed) {
   ws_url_t url;
   EXPECT_NE(ws_url_parse("http://h/chat", nullptr, &url), 0);
   EXPECT_NE(ws_url_parse("wss:///chat", nullptr, &url), 0);
   EXPECT_NE(ws_url_parse("ws://h:0/", nullptr, &url), 0);
   EXPECT_NE(ws_url_parse("ws://h:70000/", nullptr, &url), 0);
   EXPECT_NE(ws_url_parse("ws://h:80x/", nullptr, &url), 0);
   EXPECT_NE(ws_url_parse("ws://:80/", nullptr, &url), 0);
   EXPECT_NE(ws_url_parse(nullptr, nullptr, &url), 0);

   std::string long_host = "ws://" + std::string(300, 'a');
   EXPECT_NE(ws_url_parse(long_host.c_str(), nullptr, &url), 0);
}
