#include "tradecalc/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>

namespace tradecalc {

namespace {

// Idle wait before the worker re-checks running_. Bounds stop() latency when
// the notify is missed.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  // Set before spawning so the worker's first check sees true.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  stop_cv_.notify_all();

  // No lock is held here, so the worker can always finish.
  thread_.join();

  // Unprocessed events are dropped; a restarted loop starts empty.
  const std::size_t dropped = queue_.clear();
  if (dropped > 0) {
    std::cerr << "[EventLoopThread] stopped with " << dropped
              << " unprocessed event(s); dropped.\n";
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    // try_pop keeps the loop responsive to stop(); a blocking pop() would
    // not wake on stop_cv_.
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      bus_.publish(*event);
      processed_.fetch_add(1);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace tradecalc
