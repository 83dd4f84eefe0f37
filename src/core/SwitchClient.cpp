/* @file SwitchClient.cpp
 * @brief shared helpers for every switch client.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/SwitchClient.hpp"
#include "protocols/PoeErrors.hpp"

using namespace poegate::core;

bool SwitchClient::getPortStatus(int port) {
  const auto statuses = getPortStatuses();
  auto it = std::find_if(statuses.begin(), statuses.end(),
                         [port](const protocols::PortStatus& s) { return s.port == port; });
  if (it == statuses.end())
    throw protocols::ProtocolError("Port " + std::to_string(port) + " not found");
  return it->enabled;
}
