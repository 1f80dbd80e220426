#include <gtest/gtest.h>

#include <wscoro/error.hpp>
#include <wscoro/reconnect_strategy.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <variant>

using namespace std::chrono_literals;

namespace {

auto abnormal_reason() -> wscoro::reconnect_reason {
  return wscoro::reconnect_reasons::suggested_by_event{
    wscoro::event{wscoro::events::disconnected{.reason = std::nullopt,
                                               .code = wscoro::close_code::abnormal_closure}}};
}

auto delay_of(wscoro::reconnect_method const& m) -> std::chrono::milliseconds {
  auto const* d = std::get_if<wscoro::reconnect_methods::delay>(&m);
  if (d == nullptr) {
    ADD_FAILURE() << "expected delay, got " << wscoro::to_string(m);
    return std::chrono::milliseconds{-1};
  }
  return d->interval;
}

auto none_reason_of(wscoro::reconnect_method const& m) -> std::string {
  auto const* n = std::get_if<wscoro::reconnect_methods::none>(&m);
  if (n == nullptr) {
    ADD_FAILURE() << "expected none, got " << wscoro::to_string(m);
    return {};
  }
  return n->reason;
}

auto no_jitter() -> wscoro::exponential_reconnect_strategy {
  wscoro::exponential_reconnect_strategy::options opts{};
  opts.jitter = 0.0;
  return wscoro::exponential_reconnect_strategy{opts};
}

}  // namespace

// === Exponential ===

TEST(reconnect_strategy_test, exponential_doubles_from_half_second) {
  auto s = no_jitter();
  auto const path = wscoro::satisfied_path();

  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 0, path)), 500ms);
  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 1, path)), 1000ms);
  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 2, path)), 2000ms);
  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 3, path)), 4000ms);
}

TEST(reconnect_strategy_test, exponential_clips_at_max_interval) {
  wscoro::exponential_reconnect_strategy::options opts{};
  opts.jitter = 0.0;
  opts.max_retry_interval = 3s;
  wscoro::exponential_reconnect_strategy s{opts};

  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 3, wscoro::satisfied_path())), 3s);
  EXPECT_EQ(s.base_delay(30), 3s);
  EXPECT_EQ(s.base_delay(1), 1s);
}

TEST(reconnect_strategy_test, exponential_default_cap_is_ten_minutes) {
  auto s = no_jitter();
  EXPECT_EQ(s.base_delay(40), std::chrono::minutes{10});
}

TEST(reconnect_strategy_test, exponential_jitter_stays_within_fraction) {
  wscoro::exponential_reconnect_strategy s{};  // jitter = 0.2
  ASSERT_DOUBLE_EQ(s.get_options().jitter, 0.2);

  for (std::uint32_t attempt = 0; attempt < 6; ++attempt) {
    auto const base = s.base_delay(attempt);
    for (int i = 0; i < 50; ++i) {
      auto d = delay_of(s.reconnect_method_for(abnormal_reason(), attempt, wscoro::satisfied_path()));
      EXPECT_GE(d.count(), static_cast<std::int64_t>(base.count() * 0.8) - 1);
      EXPECT_LE(d.count(), static_cast<std::int64_t>(base.count() * 1.2) + 1);
    }
  }
}

TEST(reconnect_strategy_test, unsatisfied_network_yields_none) {
  auto s = no_jitter();
  auto m = s.reconnect_method_for(abnormal_reason(), 0, wscoro::unsatisfied_path());
  EXPECT_EQ(none_reason_of(m), "Network not satisfied");
  EXPECT_EQ(m, wscoro::none_for_unsatisfied_network());
}

TEST(reconnect_strategy_test, max_retry_count_yields_none) {
  wscoro::exponential_reconnect_strategy::options opts{};
  opts.jitter = 0.0;
  opts.max_retry_count = 3;
  wscoro::exponential_reconnect_strategy s{opts};

  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 2, wscoro::satisfied_path())), 2s);
  auto m = s.reconnect_method_for(abnormal_reason(), 3, wscoro::satisfied_path());
  EXPECT_EQ(none_reason_of(m), "Max retry count reached");
}

TEST(reconnect_strategy_test, network_gate_is_checked_before_retry_budget) {
  wscoro::fixed_delay_reconnect_strategy s{{.delay = 1s, .max_retry_count = 0}};
  auto m = s.reconnect_method_for(abnormal_reason(), 5, wscoro::unsatisfied_path());
  EXPECT_EQ(m, wscoro::none_for_unsatisfied_network());
}

TEST(reconnect_strategy_test, invalid_options_throw) {
  wscoro::exponential_reconnect_strategy::options bad_jitter{};
  bad_jitter.jitter = 1.5;
  EXPECT_THROW(wscoro::exponential_reconnect_strategy{bad_jitter}, std::system_error);

  wscoro::exponential_reconnect_strategy::options bad_scale{};
  bad_scale.scale = -1ms;
  EXPECT_THROW(wscoro::exponential_reconnect_strategy{bad_scale}, std::system_error);

  EXPECT_THROW(wscoro::fixed_delay_reconnect_strategy({.delay = -1ms}), std::system_error);
  EXPECT_THROW(wscoro::linear_delay_reconnect_strategy({.delay = -1ms}), std::system_error);

  try {
    wscoro::fixed_delay_reconnect_strategy s{{.delay = -5ms}};
    ADD_FAILURE() << "expected throw";
  } catch (std::system_error const& e) {
    EXPECT_EQ(e.code(), wscoro::make_error_code(wscoro::error::invalid_configuration));
  }
}

// === Fixed / Linear / None ===

TEST(reconnect_strategy_test, fixed_returns_constant_delay) {
  wscoro::fixed_delay_reconnect_strategy s{{.delay = 750ms}};
  for (std::uint32_t attempt : {0u, 1u, 7u, 100u}) {
    EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), attempt, wscoro::satisfied_path())),
              750ms);
  }
}

TEST(reconnect_strategy_test, linear_grows_with_attempt_and_clips) {
  wscoro::linear_delay_reconnect_strategy s{{.delay = 1s, .max_retry_interval = 3s}};
  auto const path = wscoro::satisfied_path();

  // Attempt 0 yields a zero delay, which the client treats as "no reconnect".
  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 0, path)), 0ms);
  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 1, path)), 1s);
  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 2, path)), 2s);
  EXPECT_EQ(delay_of(s.reconnect_method_for(abnormal_reason(), 5, path)), 3s);
}

TEST(reconnect_strategy_test, none_strategy_never_reconnects) {
  wscoro::no_reconnect_strategy s{};
  auto m = s.reconnect_method_for(abnormal_reason(), 0, wscoro::satisfied_path());
  EXPECT_EQ(none_reason_of(m), "Reconnect disabled");
  EXPECT_FALSE(s.should_reconnect_immediately_when_network_recovered(wscoro::satisfied_path()));
  EXPECT_FALSE(s.should_reconnect_when_receiving_event(
    wscoro::event{wscoro::events::error{}}));
}

// === Default hooks ===

TEST(reconnect_strategy_test, default_event_hook_reacts_to_abnormal_and_suggested) {
  auto s = no_jitter();
  namespace ev = wscoro::events;

  EXPECT_TRUE(s.should_reconnect_when_receiving_event(
    wscoro::event{ev::disconnected{.reason = std::nullopt, .code = wscoro::close_code::policy_violation}}));
  EXPECT_TRUE(s.should_reconnect_when_receiving_event(wscoro::event{ev::error{}}));
  EXPECT_TRUE(s.should_reconnect_when_receiving_event(wscoro::event{ev::reconnect_suggested{true}}));

  EXPECT_FALSE(s.should_reconnect_when_receiving_event(
    wscoro::event{ev::disconnected{.reason = std::nullopt, .code = wscoro::close_code::normal_closure}}));
  EXPECT_FALSE(s.should_reconnect_when_receiving_event(wscoro::event{ev::connected{}}));
  EXPECT_FALSE(s.should_reconnect_when_receiving_event(wscoro::event{ev::text{"hello"}}));
}

TEST(reconnect_strategy_test, default_network_hook_reconnects_immediately_when_satisfied) {
  auto s = no_jitter();
  EXPECT_TRUE(s.should_reconnect_immediately_when_network_recovered(wscoro::satisfied_path()));
  EXPECT_FALSE(s.should_reconnect_immediately_when_network_recovered(wscoro::unsatisfied_path()));
}

TEST(reconnect_strategy_test, to_string_describes_reason_and_method) {
  EXPECT_EQ(wscoro::to_string(wscoro::reconnect_method{wscoro::reconnect_methods::delay{250ms}}),
            "delay 250ms");
  EXPECT_EQ(wscoro::to_string(wscoro::none_for_max_retry_count()),
            "none (Max retry count reached)");

  wscoro::reconnect_reason r = wscoro::reconnect_reasons::network_recovery{wscoro::satisfied_path()};
  EXPECT_EQ(wscoro::to_string(r).rfind("network recovery", 0), 0u);
}
