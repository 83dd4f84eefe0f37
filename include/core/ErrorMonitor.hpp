#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace poegate {
  namespace core {

    /**
 * @class ErrorMonitor
 * @brief Other threads call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a flapping switch doesn't spam the operator.
 * * Remembers at most `capacity` distinct messages; the oldest is forgotten
 *   first and escalates again if it recurs.
 */
    class ErrorMonitor {
    public:
      explicit ErrorMonitor(std::size_t capacity = 256);
      virtual ~ErrorMonitor() = default;

      /// Register a lambda that escalates a fault to the application layer.
      void registerEscalation(std::function<void(const std::string&)> cb);

      /// Called by subsystems on fault; will forward to the escalation callback.
      virtual void notifyFailure(const std::string& message);

      /// Forget seen messages (new monitoring session).
      void reset();

      std::vector<std::string> failures() const;

    private:
      void forwardIfNew(const std::string& message);

      std::function<void(const std::string&)> escalation_{};
      std::size_t capacity_;
      std::vector<std::string> seen_; ///< de-dupe list, oldest first
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace poegate
