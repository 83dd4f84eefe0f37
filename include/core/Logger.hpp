#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous event logger (runs its own worker thread, CSV + sinks).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace poegate {
  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    enum class LogLevel { Debug, Info, Warning, Error };

    inline const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string source; ///< e.g. "PoE", "PoE Bulk", "KeepAlive"
      std::string message;
    };

    /**
 * @class Logger
 * @brief Producers call `log()` from any thread; a worker drains the ring buffer,
 *        appends CSV lines to the run file and fans events out to sinks.
 *
 *  * Outside a run, events are delivered to the sinks synchronously.
 *  * When the buffer overflows the oldest event is dropped and counted.
 */
    class Logger {

    public:
      using Sink = std::function<void(const LogEvent&)>;

      explicit Logger(std::size_t capacity = 1024);
      ~Logger(); ///< finishRun()

      // --- public API ---
      void startNewRun(const std::string& csvPath = {}); ///< open file + launch worker thread
      void log(const LogEvent& event);                   ///< enqueue event (non-blocking)
      void finishRun();                                  ///< flush + join worker thread

      void addSink(Sink sink);

      void debug(const std::string& source, const std::string& message);
      void info(const std::string& source, const std::string& message);
      void warn(const std::string& source, const std::string& message);
      void error(const std::string& source, const std::string& message);

      std::size_t dropped() const { return dropped_.load(); }
      bool running() const { return running_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void dispatch(const LogEvent& event);

      std::ofstream csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };

      std::mutex wakeMtx_;
      std::condition_variable wake_;

      mutable std::mutex outputMtx_; ///< guards csvFile_ and sinks_
      std::vector<Sink> sinks_;
    };

    /// Null-safe helper for components holding an optional logger.
    inline void logTo(const std::shared_ptr<Logger>& logger, LogLevel level,
                      const std::string& source, const std::string& message) {
      if (logger)
        logger->log(LogEvent{ std::chrono::system_clock::now(), level, source, message });
    }

  } // namespace core
} // namespace poegate
