/* @file ErrorMonitor.cpp
 * @brief De-duplicating fault escalation.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

using namespace poegate::core;

ErrorMonitor::ErrorMonitor(std::size_t capacity) : capacity_{ capacity == 0 ? 1 : capacity } {}

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

void ErrorMonitor::reset() {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.clear();
}

std::vector<std::string> ErrorMonitor::failures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_;
}

void ErrorMonitor::forwardIfNew(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
      return;
    if (seen_.size() >= capacity_)
      seen_.erase(seen_.begin());
    seen_.push_back(message);
    cb = escalation_;
  }
  // called outside the lock so the callback may report further failures
  if (cb)
    cb(message);
}
