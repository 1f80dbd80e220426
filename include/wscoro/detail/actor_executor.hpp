#pragma once

#include <iocoro/io_executor.hpp>
#include <iocoro/strand.hpp>

#include <utility>

namespace wscoro::detail {

/// Strand binding shared by a client actor and everything it owns.
///
/// Responsibilities:
/// - Serialize every mutation of client state (status, reconnect count, timer handles)
/// - Provide the io_executor needed to construct steady timers
///
/// Critical constraints:
/// 1. All controller coroutines run on ONE strand
///    - event loop, network loop, reconnect/auto-ping timers, user entry points
///    - user entry points switch onto the strand before touching state
///    - check-then-act sequences are atomic as long as no co_await separates them
///
/// 2. Copies share the strand
///    - timers and the network watcher hold copies; all of them serialize with the client
///
/// Correct patterns:
///   co_await iocoro::this_coro::switch_to(executor_.strand().executor());
///   iocoro::co_spawn(executor_.strand().executor(), tok, loop(), iocoro::use_awaitable);
class actor_executor {
 public:
  explicit actor_executor(iocoro::io_executor ex)
      : io_executor_(ex), strand_(iocoro::make_strand(iocoro::any_executor{ex})) {}

  /// Strand executor facade.
  ///
  /// Not implicitly convertible to iocoro::any_executor; call .executor() explicitly.
  class strand_facade {
   public:
    explicit strand_facade(iocoro::any_executor ex) : ex_(std::move(ex)) {}

    [[nodiscard]] auto executor() const noexcept -> iocoro::any_executor { return ex_; }

   private:
    iocoro::any_executor ex_;
  };

  [[nodiscard]] auto strand() const noexcept -> strand_facade { return strand_facade{strand_}; }

  /// Underlying io_executor (timer construction).
  [[nodiscard]] auto get_io_executor() const -> iocoro::io_executor { return io_executor_; }

 private:
  iocoro::io_executor io_executor_{};
  iocoro::any_executor strand_;
};

}  // namespace wscoro::detail
