#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity, mutex-protected FIFO that overwrites its oldest entry.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace poegate {
  namespace core {

    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be > 0");
      }

      /// Returns false if the buffer was full and the oldest entry got dropped.
      bool push(T value) {
        std::lock_guard<std::mutex> lock(mtx_);
        bool kept = true;
        if (count_ == slots_.size()) {
          head_ = (head_ + 1) % slots_.size();
          --count_;
          kept = false;
        }
        slots_[(head_ + count_) % slots_.size()] = std::move(value);
        ++count_;
        return kept;
      }

      std::optional<T> pop() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (count_ == 0)
          return std::nullopt;
        std::optional<T> out{ std::move(slots_[head_]) };
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return out;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }

      bool empty() const { return size() == 0; }
      std::size_t capacity() const { return slots_.size(); }

    private:
      mutable std::mutex mtx_;
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
    };

  } // namespace core
} // namespace poegate
