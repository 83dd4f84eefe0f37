/* @file CountdownTimer.cpp
 * @brief generation-counted countdown; stale workers notice and exit on their own
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/CountdownTimer.hpp"

using namespace poegate::core;

CountdownTimer::CountdownTimer(std::chrono::milliseconds interval) : interval_{ interval } {}

CountdownTimer::~CountdownTimer() {
  cancel();
  std::thread last;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    last = std::move(worker_);
  }
  reap(last);
}

void CountdownTimer::start(std::uint32_t ticks, TickFn onTick, FireFn onFire) {
  std::thread previous;
  std::uint64_t generation = 0;
  std::chrono::milliseconds interval{};
  {
    std::lock_guard<std::mutex> lock(mtx_);
    generation = ++generation_;
    pending_ = true;
    interval = interval_;
    previous = std::move(worker_);
  }
  cv_.notify_all();
  // the superseded worker wakes, sees a newer generation and returns
  reap(previous);

  std::unique_lock<std::mutex> lock(mtx_);
  // a concurrent start() may have parked its worker here meanwhile
  while (worker_.joinable()) {
    std::thread other = std::move(worker_);
    lock.unlock();
    reap(other);
    lock.lock();
  }
  if (generation_ != generation)
    return; // cancelled or superseded while we were joining
  worker_ = std::thread(&CountdownTimer::run, this, generation, ticks, interval,
                        std::move(onTick), std::move(onFire));
}

void CountdownTimer::cancel() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++generation_;
    pending_ = false;
  }
  cv_.notify_all();
}

bool CountdownTimer::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pending_;
}

void CountdownTimer::setInterval(std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(mtx_);
  interval_ = interval;
}

void CountdownTimer::run(std::uint64_t generation, std::uint32_t ticks,
                         std::chrono::milliseconds interval, TickFn onTick, FireFn onFire) {
  for (std::uint32_t remaining = ticks; remaining > 0;) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      if (cv_.wait_for(lock, interval, [&] { return generation_ != generation; }))
        return; // superseded or cancelled
    }
    --remaining;
    if (onTick)
      onTick(remaining);
  }

  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (generation_ != generation)
      return;
    pending_ = false;
  }
  if (onFire)
    onFire();
}

void CountdownTimer::reap(std::thread& t) {
  if (!t.joinable())
    return;
  // start() from inside our own callback: can't join ourselves
  if (t.get_id() == std::this_thread::get_id())
    t.detach();
  else
    t.join();
}
