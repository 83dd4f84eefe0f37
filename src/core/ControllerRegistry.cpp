/* @file ControllerRegistry.cpp
 * @brief keyed client cache + best-effort global logout
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <future>
#include <vector>

// poegate headers
#include "core/ControllerRegistry.hpp"
#include "core/Logger.hpp"
#include "core/SwitchClient.hpp"

using namespace poegate::core;

ControllerRegistry::ControllerRegistry(SwitchClientFactory factory, std::shared_ptr<Logger> logger)
    : factory_(std::move(factory)), logger_(std::move(logger)) {}

std::shared_ptr<SwitchClient>
ControllerRegistry::getOrCreate(const std::string& switchType,
                                const protocols::SwitchCredentials& creds) {
  std::shared_ptr<SwitchClient> client;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto key = keyFor(switchType, creds.ipAddress);
    auto it = clients_.find(key);
    if (it == clients_.end()) {
      client = factory_.create(switchType, creds); // throws for unknown types
      clients_.emplace(key, client);
      logTo(logger_, LogLevel::Debug, "PoE", "Registered controller " + key);
      return client;
    }
    client = it->second;
  }
  // never blocks: a stale session is logged out in the background
  client->updateCredentials(creds);
  return client;
}

void ControllerRegistry::clearAll() {
  std::vector<std::shared_ptr<SwitchClient>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    snapshot.reserve(clients_.size());
    for (const auto& [_, client] : clients_)
      snapshot.push_back(client);
  }

  std::vector<std::future<void>> logouts;
  logouts.reserve(snapshot.size());
  for (const auto& client : snapshot)
    logouts.push_back(std::async(std::launch::async, [client] { client->clearSession(); }));

  std::size_t failed = 0;
  for (std::size_t i = 0; i < logouts.size(); ++i) {
    try {
      logouts[i].get();
    } catch (const std::exception& e) {
      ++failed;
      logTo(logger_, LogLevel::Warning, "PoE",
            "Clearing session for " + snapshot[i]->credentials().ipAddress + " failed: " +
                e.what());
    }
  }
  logTo(logger_, LogLevel::Info, "PoE",
        "Cleared " + std::to_string(snapshot.size() - failed) + "/" +
            std::to_string(snapshot.size()) + " switch sessions");
}

std::size_t ControllerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return clients_.size();
}
