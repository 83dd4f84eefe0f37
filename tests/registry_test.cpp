// STL headers
#include <memory>
#include <vector>

// poegate headers
#include "core/ControllerRegistry.hpp"
#include "core/GS308EPClient.hpp"
#include "core/SwitchClientFactory.hpp"
#include "protocols/PoeErrors.hpp"

// poegate fakes
#include "fakes/FakeHttpTransport.hpp"
#include "fakes/MockSwitchClient.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace poegate::test {

  using poegate::core::ControllerRegistry;
  using poegate::core::SwitchClientFactory;
  using poegate::protocols::SwitchCredentials;
  using poegate::protocols::UnsupportedSwitchTypeError;
  using ::testing::NiceMock;

  class ControllerRegistryTest : public ::testing::Test {
  protected:
    void SetUp() override {
      SwitchClientFactory factory;
      factory.registerType("mock", [this](const SwitchCredentials& creds) {
        auto m = std::make_shared<NiceMock<MockSwitchClient>>();
        ON_CALL(*m, credentials()).WillByDefault(::testing::Return(creds));
        created.push_back(m);
        return m;
      });
      registry = std::make_unique<ControllerRegistry>(std::move(factory));
    }

    std::vector<std::shared_ptr<NiceMock<MockSwitchClient>>> created;
    std::unique_ptr<ControllerRegistry> registry;
  };

  TEST_F(ControllerRegistryTest, getOrCreate_UnknownTypeThrows) {
    try {
      registry->getOrCreate("cisco_sg350", { "10.0.0.1", "pw" });
      FAIL() << "expected UnsupportedSwitchTypeError";
    } catch (const UnsupportedSwitchTypeError& e) {
      EXPECT_STREQ(e.what(), "Unsupported PoE switch type: cisco_sg350");
    }
    EXPECT_EQ(registry->size(), 0u);
  }

  TEST_F(ControllerRegistryTest, getOrCreate_ReusesClientPerTypeAndAddress) {
    auto a = registry->getOrCreate("mock", { "10.0.0.1", "pw" });
    ASSERT_EQ(created.size(), 1u);

    const SwitchCredentials changed{ "10.0.0.1", "new-pw" };
    EXPECT_CALL(*created[0], updateCredentials(changed)).Times(1);
    auto again = registry->getOrCreate("mock", changed);

    auto other = registry->getOrCreate("mock", { "10.0.0.2", "pw" });

    EXPECT_EQ(a, again);
    EXPECT_NE(a, other);
    EXPECT_EQ(created.size(), 2u);
    EXPECT_EQ(registry->size(), 2u);
  }

  TEST_F(ControllerRegistryTest, clearAll_ReachesEveryClientEvenIfOneThrows) {
    registry->getOrCreate("mock", { "10.0.0.1", "pw" });
    registry->getOrCreate("mock", { "10.0.0.2", "pw" });
    registry->getOrCreate("mock", { "10.0.0.3", "pw" });
    ASSERT_EQ(created.size(), 3u);

    EXPECT_CALL(*created[0], clearSession()).Times(1);
    EXPECT_CALL(*created[1], clearSession())
        .WillOnce(::testing::Throw(protocols::NetworkError("logout timed out", true)));
    EXPECT_CALL(*created[2], clearSession()).Times(1);

    EXPECT_NO_THROW(registry->clearAll());
    EXPECT_EQ(registry->size(), 3u); // clients stay cached, only sessions go
  }

  TEST(SwitchClientFactory, builtins_KnowTheGS308EP) {
    auto factory = SwitchClientFactory::withBuiltins(std::make_shared<FakeHttpTransport>());
    EXPECT_TRUE(factory.supports("netgear_gs308ep"));
    EXPECT_FALSE(factory.supports("netgear_gs305ep"));
    EXPECT_EQ(factory.types(), std::vector<std::string>{ "netgear_gs308ep" });
    EXPECT_FALSE(factory.registerType("netgear_gs308ep", [](const SwitchCredentials&) {
      return std::shared_ptr<core::SwitchClient>{};
    }));
  }

  TEST(ControllerRegistry, clearAll_LogsOutRealSessions) {
    auto fake = std::make_shared<FakeHttpTransport>("pw");
    core::SessionTiming timing;
    timing.loginPacing = std::chrono::milliseconds{ 0 };
    ControllerRegistry registry(SwitchClientFactory::withBuiltins(fake, nullptr, timing));

    auto client = registry.getOrCreate("netgear_gs308ep", { "192.168.0.20", "pw" });
    client->login();
    ASSERT_EQ(fake->liveSessions(), 1u);

    registry.clearAll();

    EXPECT_EQ(fake->logouts(), 1);
    EXPECT_EQ(fake->liveSessions(), 0u);
  }

} // namespace poegate::test
