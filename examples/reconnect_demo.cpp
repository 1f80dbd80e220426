#include <wscoro/wscoro.hpp>

#include <iocoro/iocoro.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

using namespace std::chrono_literals;

namespace {

/// In-process stand-in for a WebSocket transport: the handshake takes 50ms and every frame is
/// accepted. drop() simulates the server vanishing.
class simulated_backend final : public wscoro::backend {
 public:
  auto connect(wscoro::request const& req) -> iocoro::awaitable<void> override {
    std::cout << "  [backend] connecting to " << req.url << "\n";
    co_await iocoro::co_sleep(50ms);
    (void)stream_.push(wscoro::events::connected{.headers = {{"server", "simulated"}}});
  }

  auto disconnect(wscoro::close_code code, std::optional<std::string> reason)
    -> iocoro::awaitable<void> override {
    (void)stream_.push(wscoro::events::disconnected{.reason = std::move(reason), .code = code});
    co_return;
  }

  auto write(wscoro::frame f) -> iocoro::awaitable<wscoro::write_result> override {
    std::cout << "  [backend] write " << wscoro::to_string(f) << "\n";
    co_return wscoro::write_result{};
  }

  auto events() -> wscoro::event_stream& override { return stream_; }

  void drop() {
    (void)stream_.push(wscoro::events::disconnected{.reason = "server vanished",
                                                    .code = wscoro::close_code::abnormal_closure});
  }

 private:
  wscoro::event_stream stream_{};
};

/// Always-online network.
class online_monitor final : public wscoro::path_monitor {
 public:
  auto current_path() const -> wscoro::network_path override { return wscoro::satisfied_path(); }
  void start(update_handler handler) override { handler(wscoro::satisfied_path()); }
  void cancel() override {}
};

class printing_delegate final : public wscoro::client_delegate {
 public:
  void did_update_status(wscoro::status s) override {
    std::cout << "status: " << wscoro::to_string(s) << "\n";
  }
  void did_receive_event(wscoro::event const& ev) override {
    std::cout << "event: " << wscoro::to_string(ev) << "\n";
  }
  void will_reconnect(wscoro::reconnect_reason const& reason,
                      std::chrono::milliseconds delay) override {
    std::cout << "will reconnect in " << delay.count() << "ms (" << wscoro::to_string(reason)
              << ")\n";
  }
  void did_reconnect(wscoro::reconnect_reason const&, std::uint32_t attempt) override {
    std::cout << "reconnect attempt #" << attempt << "\n";
  }
  void did_send_auto_ping() override { std::cout << "auto ping sent\n"; }
};

auto demo_task(iocoro::io_executor ex) -> iocoro::awaitable<void> {
  auto be = std::make_unique<simulated_backend>();
  auto* transport = be.get();

  wscoro::config cfg{};
  cfg.target.url = "wss://echo.example.org/socket";
  cfg.auto_ping_interval = 200ms;

  wscoro::exponential_reconnect_strategy::options opts{};
  opts.scale = 100ms;
  opts.max_retry_count = 5;

  printing_delegate delegate{};
  wscoro::client c{ex, cfg, std::move(be), std::make_unique<online_monitor>(),
                   std::make_shared<wscoro::exponential_reconnect_strategy>(opts)};
  c.set_delegate(&delegate);

  std::cout << "wscoro " << wscoro::version << "\n";
  (void)co_await c.connect();
  co_await iocoro::co_sleep(300ms);

  auto r = co_await c.send(wscoro::frames::text{"hello"});
  if (!r) {
    std::cerr << "send failed: " << r.error().to_string() << "\n";
  }

  transport->drop();
  co_await iocoro::co_sleep(500ms);

  co_await c.disconnect();
  co_await iocoro::co_sleep(50ms);
  c.set_delegate(nullptr);
}

}  // namespace

int main() {
  iocoro::io_context ctx;
  iocoro::co_spawn(ctx.get_executor(), demo_task(ctx.get_executor()), iocoro::detached);
  ctx.run();
  return 0;
}
