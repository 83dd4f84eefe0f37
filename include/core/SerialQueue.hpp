#pragma once
/** @file  SerialQueue.hpp
 *  @brief Ticket-ordered mutual exclusion: callers run strictly one at a time, FIFO.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <utility>

namespace poegate {
  namespace core {

    /**
 * @class SerialQueue
 * @brief `run(fn)` blocks until every earlier caller has finished, then runs fn.
 *
 *  * Plain std::mutex gives no ordering guarantee; tickets do.
 *  * The slot is released even if fn throws.
 */
    class SerialQueue {
    public:
      SerialQueue() = default;

      template <typename Fn> decltype(auto) run(Fn&& fn) {
        Slot slot(*this);
        return std::forward<Fn>(fn)();
      }

      /// Number of callers queued or running.
      std::uint64_t depth() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return nextTicket_ - nowServing_;
      }

      SerialQueue(const SerialQueue&) = delete;
      SerialQueue& operator=(const SerialQueue&) = delete;

    private:
      class Slot {
      public:
        explicit Slot(SerialQueue& q) : q_{ q } {
          std::unique_lock<std::mutex> lock(q_.mtx_);
          const auto ticket = q_.nextTicket_++;
          q_.cv_.wait(lock, [&] { return q_.nowServing_ == ticket; });
        }
        ~Slot() {
          {
            std::lock_guard<std::mutex> lock(q_.mtx_);
            ++q_.nowServing_;
          }
          q_.cv_.notify_all();
        }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

      private:
        SerialQueue& q_;
      };

      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::uint64_t nextTicket_{ 0 };
      std::uint64_t nowServing_{ 0 };
    };

  } // namespace core
} // namespace poegate
