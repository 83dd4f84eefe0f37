/* @file Logger.cpp
 * @brief Ring-buffered async logger - producers never block on file I/O.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// poegate headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace poegate::core;

namespace {

  // CSV field escaping: quote when needed, double embedded quotes
  std::string csvField(const std::string& raw) {
    if (raw.find_first_of(",\"\n") == std::string::npos)
      return raw;
    std::string out = "\"";
    for (char c : raw) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

} // namespace

Logger::Logger(std::size_t capacity)
    : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  if (running_)
    finishRun();

  if (!csvPath.empty()) {
    std::lock_guard<std::mutex> lock(outputMtx_);
    csvFile_.open(csvPath, std::ios::out | std::ios::app);
    if (!csvFile_)
      throw std::runtime_error("[Logger] cannot open log file: " + csvPath);
  }

  running_ = true;
  worker_ = std::thread(&Logger::workerLoop, this);
}

void Logger::log(const LogEvent& event) {
  if (!running_) {
    dispatch(event);
    return;
  }
  if (!buffer_->push(event))
    ++dropped_;
  wake_.notify_one();
}

void Logger::finishRun() {
  {
    std::lock_guard<std::mutex> lock(wakeMtx_);
    if (!running_)
      return;
    running_ = false;
  }
  wake_.notify_all();
  if (worker_.joinable())
    worker_.join();

  // anything that raced in after the worker exited
  while (auto ev = buffer_->pop())
    dispatch(*ev);

  std::lock_guard<std::mutex> lock(outputMtx_);
  if (csvFile_.is_open()) {
    csvFile_.flush();
    csvFile_.close();
  }
}

void Logger::addSink(Sink sink) {
  std::lock_guard<std::mutex> lock(outputMtx_);
  sinks_.push_back(std::move(sink));
}

void Logger::debug(const std::string& source, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Debug, source, message });
}

void Logger::info(const std::string& source, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Info, source, message });
}

void Logger::warn(const std::string& source, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Warning, source, message });
}

void Logger::error(const std::string& source, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Error, source, message });
}

void Logger::workerLoop() {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(wakeMtx_);
      wake_.wait_for(lock, std::chrono::milliseconds{ 100 },
                     [this] { return !running_ || !buffer_->empty(); });
    }
    while (auto ev = buffer_->pop())
      dispatch(*ev);
    if (!running_)
      return;
  }
}

// synchronous callers after finishRun() overlap the final drain
void Logger::dispatch(const LogEvent& event) {
  std::lock_guard<std::mutex> lock(outputMtx_);
  if (csvFile_.is_open()) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        event.when.time_since_epoch())
                        .count();
    csvFile_ << ms << ',' << toString(event.level) << ',' << csvField(event.source) << ','
             << csvField(event.message) << '\n';
  }

  for (const auto& sink : sinks_)
    sink(event);
}
