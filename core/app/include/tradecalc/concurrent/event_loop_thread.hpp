#pragma once

#include "tradecalc/concurrent/thread_safe_queue.hpp"
#include "tradecalc/eventbus/event_bus.hpp"
#include "tradecalc/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace tradecalc {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Whatever subscribes to that
// bus runs on the worker, so handlers never race each other.
//
// TradeEntrySession routes every price tick and every user edit through one
// of these, which is what serializes access to the two TradeValues.
//
// Thread model: start(), stop() and push() may be called from any thread.
// All subscriber callbacks on eventBus() run on the loop thread. Events
// still queued when stop() is called are dropped (and counted on
// std::cerr).
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Stops and joins the worker.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Spawns the worker. No-op if already running.
  void start();

  // Signals the worker, then joins it. No-op if not running. start() may be
  // called again afterwards.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  // Subscribe here to handle events on the loop thread.
  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

  // Events published since construction, across restarts.
  std::uint64_t processedCount() const { return processed_.load(); }

 private:
  // Worker body: pop and publish until running_ goes false.
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> processed_{0};

  // Lets stop() cut the idle wait short.
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::thread thread_;
};

}  // namespace tradecalc
