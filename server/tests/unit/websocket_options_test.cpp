#include <chrono>

#include <gtest/gtest.h>

#include "relay/websocket_session.hpp"

TEST(WebSocketOptionsTest, OnlyHandshakeIsTimed) {
  auto opt = relay::ServerTimeoutOptions();
  EXPECT_TRUE(opt.handshake_timeout == std::chrono::seconds(30));
  EXPECT_TRUE(opt.idle_timeout == boost::beast::websocket::stream_base::none());
  EXPECT_FALSE(opt.keep_alive_pings);
}
