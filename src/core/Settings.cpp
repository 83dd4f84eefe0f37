/* @file Settings.cpp
 * @brief "poe" config section -> Settings
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/Settings.hpp"

using namespace poegate::core;
using nlohmann::json;

namespace {

  void readMillis(const json& section, const char* key, std::chrono::milliseconds& out) {
    if (!section.contains(key))
      return;
    const auto& v = section.at(key);
    if (!v.is_number_integer() || v.get<long long>() < 0)
      throw std::runtime_error(std::string("[Settings] poe.") + key +
                               " must be a non-negative integer (ms)");
    out = std::chrono::milliseconds{ v.get<long long>() };
  }

  void readBool(const json& section, const char* key, bool& out) {
    if (!section.contains(key))
      return;
    const auto& v = section.at(key);
    if (!v.is_boolean())
      throw std::runtime_error(std::string("[Settings] poe.") + key + " must be a boolean");
    out = v.get<bool>();
  }

} // namespace

Settings Settings::fromJson(const json& root) {
  Settings s;
  if (!root.contains("poe"))
    return s;

  const auto& poe = root.at("poe");
  if (!poe.is_object())
    throw std::runtime_error("[Settings] 'poe' must be an object");

  readMillis(poe, "keepAliveMs", s.keepAlive);
  readBool(poe, "parallelMode", s.parallelMode);
  readMillis(poe, "toggleDelayMs", s.toggleDelay);
  readBool(poe, "simulation", s.simulation);
  readMillis(poe, "requestTimeoutMs", s.requestTimeout);
  readMillis(poe, "logoutTimeoutMs", s.logoutTimeout);
  readMillis(poe, "loginPacingMs", s.loginPacing);
  readMillis(poe, "retryBackoffMs", s.retryBackoff);
  readMillis(poe, "tickMs", s.tick);
  if (poe.contains("logFile")) {
    if (!poe.at("logFile").is_string())
      throw std::runtime_error("[Settings] poe.logFile must be a string");
    s.logFile = poe.at("logFile").get<std::string>();
  }

  if (s.tick.count() == 0)
    throw std::runtime_error("[Settings] poe.tickMs must be > 0");
  return s;
}

SessionTiming Settings::sessionTiming() const {
  return SessionTiming{ requestTimeout, logoutTimeout, loginPacing, retryBackoff };
}

KeepAliveOptions Settings::keepAliveOptions() const {
  return KeepAliveOptions{ keepAlive,
                           parallelMode ? ExecutionMode::Parallel : ExecutionMode::Sequential,
                           toggleDelay, simulation, tick };
}
