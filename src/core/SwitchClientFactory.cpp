/* @file SwitchClientFactory.cpp
 * @brief type-string dispatch for switch clients
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/GS308EPClient.hpp"
#include "core/SwitchClientFactory.hpp"
#include "protocols/PoeErrors.hpp"

using namespace poegate::core;

bool SwitchClientFactory::registerType(const std::string& type, Creator maker) {
  if (!maker)
    return false;
  return creators_.emplace(type, std::move(maker)).second;
}

std::shared_ptr<SwitchClient>
SwitchClientFactory::create(const std::string& type,
                            const protocols::SwitchCredentials& creds) const {
  auto it = creators_.find(type);
  if (it == creators_.end())
    throw protocols::UnsupportedSwitchTypeError(type);
  return it->second(creds);
}

bool SwitchClientFactory::supports(const std::string& type) const {
  return creators_.count(type) != 0;
}

std::vector<std::string> SwitchClientFactory::types() const {
  std::vector<std::string> out;
  for (const auto& [type, _] : creators_)
    out.push_back(type);
  std::sort(out.begin(), out.end());
  return out;
}

SwitchClientFactory SwitchClientFactory::withBuiltins(std::shared_ptr<io::HttpTransport> transport,
                                                      std::shared_ptr<Logger> logger,
                                                      SessionTiming timing) {
  SwitchClientFactory factory;
  factory.registerType(GS308EPClient::kType,
                       [transport, logger, timing](const protocols::SwitchCredentials& creds) {
                         return std::make_shared<GS308EPClient>(creds, transport, logger, timing);
                       });
  return factory;
}
