#include "keepsake/core/Async.hh"
#include "keepsake/core/Log.hh"

#include <optional>

namespace keepsake::async {

static asio::io_context io_ctx;
static std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard;

asio::io_context& context() {
  return io_ctx;
}

void init() {
  work_guard.emplace(asio::make_work_guard(io_ctx));
  KEEPSAKE_LOG_INFO("Async: subsystem initialized");
}

void shutdown() {
  KEEPSAKE_LOG_INFO("Async: subsystem shutting down");
  work_guard.reset();
  io_ctx.run();
}

void poll() {
  poll(io_ctx);
}

void poll(asio::io_context& io) {
  io.poll();
  io.restart();
}

void run() {
  io_ctx.run();
  io_ctx.restart();
}

asio::steady_timer makeTimer() {
  return asio::steady_timer(io_ctx);
}

asio::steady_timer makeTimer(std::chrono::steady_clock::duration duration) {
  return asio::steady_timer(io_ctx, duration);
}

asio::awaitable<bool> sleepFor(asio::steady_timer& timer, std::chrono::steady_clock::duration duration) {
  timer.expires_after(duration);
  auto [ec] = co_await timer.async_wait(use_nothrow);
  co_return !ec;
}

} // namespace keepsake::async
