#include <gtest/gtest.h>

#include <wscoro/event.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace events = wscoro::events;
using wscoro::close_code;
using wscoro::event;

TEST(event_test, connected_and_payload_events_imply_open_connection) {
  EXPECT_TRUE(wscoro::is_connected(event{events::connected{}}));
  EXPECT_TRUE(wscoro::is_connected(event{events::text{"x"}}));
  EXPECT_TRUE(wscoro::is_connected(event{events::pong{}}));
  EXPECT_FALSE(wscoro::is_connected(event{events::disconnected{}}));
  EXPECT_FALSE(wscoro::is_connected(event{events::error{}}));
}

TEST(event_test, abnormal_classification) {
  EXPECT_FALSE(wscoro::is_abnormal_closed(
    event{events::disconnected{.reason = std::nullopt, .code = close_code::normal_closure}}));
  EXPECT_FALSE(wscoro::is_abnormal_closed(
    event{events::disconnected{.reason = "bye", .code = close_code::going_away}}));
  EXPECT_TRUE(wscoro::is_abnormal_closed(
    event{events::disconnected{.reason = std::nullopt, .code = close_code::abnormal_closure}}));
  EXPECT_TRUE(wscoro::is_abnormal_closed(event{events::error{}}));
  EXPECT_TRUE(wscoro::is_abnormal_closed(event{events::cancelled{}}));
  EXPECT_TRUE(wscoro::is_abnormal_closed(event{events::peer_closed{}}));
  EXPECT_FALSE(wscoro::is_abnormal_closed(event{events::pong{}}));
}

TEST(event_test, reconnect_suggested_requires_true_flag) {
  EXPECT_TRUE(wscoro::is_reconnect_suggested(event{events::reconnect_suggested{true}}));
  EXPECT_FALSE(wscoro::is_reconnect_suggested(event{events::reconnect_suggested{false}}));
  EXPECT_FALSE(wscoro::is_reconnect_suggested(event{events::peer_closed{}}));
}

TEST(event_test, to_string_describes_payload) {
  events::connected c{};
  c.headers["server"] = "test";
  EXPECT_EQ(wscoro::to_string(event{c}), "connected with headers: {server: test}");

  EXPECT_EQ(wscoro::to_string(event{events::disconnected{.reason = "gone",
                                                          .code = close_code::going_away}}),
            "disconnected with close code: 1001, reason: gone");

  events::data d{};
  d.payload = std::vector<std::byte>(3);
  EXPECT_EQ(wscoro::to_string(event{d}), "data of 3 bytes");

  EXPECT_EQ(wscoro::to_string(event{events::reconnect_suggested{true}}),
            "reconnect suggested: true");
}
