#pragma once
/** @file  SwitchClientFactory.hpp
 *  @brief Runtime registry that maps switch type names to client creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/GS308EPClient.hpp" // SessionTiming + the built-in family
#include "core/SwitchClient.hpp"
#include "io/HttpTransport.hpp"
#include "protocols/PortCommand.hpp"

namespace poegate::core {

  /**
 * @class SwitchClientFactory
 * @brief Register & instantiate switch clients by type key (e.g. "netgear_gs308ep").
 *
 *  * Keeps ControllerRegistry decoupled from concrete switch families.
 *  * Creators are lambdas returning `shared_ptr<SwitchClient>`.
 */
  class SwitchClientFactory {
  public:
    using Creator =
        std::function<std::shared_ptr<SwitchClient>(const protocols::SwitchCredentials&)>;

    /// Register a creator under \p type.  Returns false on duplicate.
    bool registerType(const std::string& type, Creator maker);

    /// Create a fresh client or throw `UnsupportedSwitchTypeError` if unknown.
    std::shared_ptr<SwitchClient> create(const std::string& type,
                                         const protocols::SwitchCredentials& creds) const;

    bool supports(const std::string& type) const;
    std::vector<std::string> types() const;

    /// Factory with every built-in switch family registered.
    static SwitchClientFactory withBuiltins(std::shared_ptr<io::HttpTransport> transport,
                                            std::shared_ptr<Logger> logger = nullptr,
                                            SessionTiming timing = {});

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace poegate::core
