#pragma once
/** @file  CountdownTimer.hpp
 *  @brief Cancellable tick-down task on its own worker thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace poegate {
  namespace core {

    /**
 * @class CountdownTimer
 * @brief `start(n)` ticks n times at a fixed interval, then fires once.
 *
 *  * Starting again supersedes the pending run.
 *  * `cancel()` is idempotent, safe after the run fired, and safe to call from
 *    inside the tick/fire callbacks (it never joins).
 *  * Callbacks run on the worker thread without any timer lock held.
 */
    class CountdownTimer {
    public:
      using TickFn = std::function<void(std::uint32_t remaining)>;
      using FireFn = std::function<void()>;

      explicit CountdownTimer(std::chrono::milliseconds interval = std::chrono::seconds{ 1 });
      ~CountdownTimer(); ///< cancel + join

      void start(std::uint32_t ticks, TickFn onTick, FireFn onFire);
      void cancel();

      bool pending() const;
      void setInterval(std::chrono::milliseconds interval);

      CountdownTimer(const CountdownTimer&) = delete;
      CountdownTimer& operator=(const CountdownTimer&) = delete;

    private:
      void run(std::uint64_t generation, std::uint32_t ticks, std::chrono::milliseconds interval,
               TickFn onTick, FireFn onFire);
      void reap(std::thread& t);

      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::uint64_t generation_{ 0 }; ///< bumped by start()/cancel()
      bool pending_{ false };
      std::chrono::milliseconds interval_;
      std::thread worker_;
    };

  } // namespace core
} // namespace poegate
