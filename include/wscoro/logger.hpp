#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <string>
#include <string_view>

#if defined(__cpp_lib_format) && __has_include(<format>)
#include <format>
namespace wscoro {
namespace format_impl = std;
#else
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>
namespace wscoro {
namespace format_impl = fmt;
#endif

enum class log_level {
  verbose,
  debug,
  info,
  warning,
  error,
  off,
};

constexpr auto to_string(log_level level) noexcept -> char const* {
  switch (level) {
    case log_level::verbose:
      return "verbose";
    case log_level::debug:
      return "debug";
    case log_level::info:
      return "info";
    case log_level::warning:
      return "warning";
    case log_level::error:
      return "error";
    case log_level::off:
      return "off";
    default:
      return "unknown";
  }
}

struct log_context {
  log_level level;
  std::string_view message;
  std::string_view file;
  int line;
  std::chrono::system_clock::time_point timestamp;
};

using log_function = void (*)(void*, log_context const&);

class logger {
 public:
  static auto instance() -> logger& {
    static logger inst;
    return inst;
  }

  // Not synchronized with concurrent log() calls; install the sink before any client runs.
  void set_log_function(log_function fn, void* user_data = nullptr) {
    if (fn != nullptr) {
      log_fn_ = fn;
      log_user_data_ = user_data;
      return;
    }

    log_fn_ = &default_log_function;
    log_user_data_ = nullptr;
  }

  void set_log_level(log_level level) { min_level_.store(level, std::memory_order_relaxed); }

  auto get_log_level() const -> log_level { return min_level_.load(std::memory_order_relaxed); }

  [[nodiscard]] auto should_log(log_level level) const -> bool {
    return level != log_level::off && level >= min_level_.load(std::memory_order_relaxed);
  }

  void log(log_level level, std::string_view message, std::string_view file, int line) {
    if (!should_log(level)) {
      return;
    }

    if (log_fn_) {
      log_context ctx{
        .level = level,
        .message = message,
        .file = file,
        .line = line,
        .timestamp = std::chrono::system_clock::now()
      };
      log_fn_(log_user_data_, ctx);
    }
  }

  template <typename... Args>
  void log(log_level level, std::string_view file, int line,
           format_impl::format_string<Args...> fmt, Args&&... args) {
    if (!should_log(level)) {
      return;
    }

    auto message = format_impl::format(fmt, std::forward<Args>(args)...);
    log(level, message, file, line);
  }

 private:
  // Silent by default; users opt in with set_log_level().
  logger() : log_fn_(&default_log_function), log_user_data_(nullptr), min_level_(log_level::off) {}

  static void default_log_function(void*, log_context const& ctx) {
    auto time = std::chrono::system_clock::to_time_t(ctx.timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      ctx.timestamp.time_since_epoch()) % 1000;

    // Show the path below `wscoro/` when the file lives in the library tree.
    auto file = [&]() -> std::string_view {
      auto path = ctx.file;

      constexpr std::string_view k_prefix_posix = "wscoro/";
      constexpr std::string_view k_prefix_win = "wscoro\\";
      if (auto pos = path.find(k_prefix_posix); pos != std::string_view::npos) {
        return path.substr(pos + k_prefix_posix.size());
      }
      if (auto pos = path.find(k_prefix_win); pos != std::string_view::npos) {
        return path.substr(pos + k_prefix_win.size());
      }

      if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
        return path.substr(pos + 1);
      }
      return path;
    }();

    auto formatted = format_impl::format(
      "[{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}] [wscoro] [{}] [{}:{}] {}",
      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()),
      to_string(ctx.level), file, ctx.line, ctx.message
    );

    std::cerr << formatted << std::endl;
  }

  log_function log_fn_;
  void* log_user_data_;
  std::atomic<log_level> min_level_;
};

inline auto get_logger() -> logger& { return logger::instance(); }

inline void set_log_function(log_function fn, void* user_data = nullptr) {
  logger::instance().set_log_function(fn, user_data);
}

inline void set_log_level(log_level level) { logger::instance().set_log_level(level); }

}  // namespace wscoro

#define WSCORO_LOG_VERBOSE(fmt, ...) \
  ::wscoro::get_logger().log(::wscoro::log_level::verbose, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)

#define WSCORO_LOG_DEBUG(fmt, ...) \
  ::wscoro::get_logger().log(::wscoro::log_level::debug, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)

#define WSCORO_LOG_INFO(fmt, ...) \
  ::wscoro::get_logger().log(::wscoro::log_level::info, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)

#define WSCORO_LOG_WARNING(fmt, ...) \
  ::wscoro::get_logger().log(::wscoro::log_level::warning, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)

#define WSCORO_LOG_ERROR(fmt, ...) \
  ::wscoro::get_logger().log(::wscoro::log_level::error, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)
