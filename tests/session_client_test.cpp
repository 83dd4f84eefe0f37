// STL headers
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

// poegate headers
#include "core/GS308EPClient.hpp"
#include "protocols/PoeErrors.hpp"

// poegate fakes
#include "fakes/FakeHttpTransport.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace poegate::test {

  using poegate::core::GS308EPClient;
  using poegate::core::SessionTiming;
  using poegate::protocols::AuthError;
  using poegate::protocols::InvalidPortError;
  using poegate::protocols::NetworkError;
  using poegate::protocols::PortCommand;
  using poegate::protocols::ProtocolError;
  using poegate::protocols::ToggleError;
  using ::testing::ElementsAre;

  namespace {

    // no pacing or backoff in tests
    SessionTiming fastTiming() {
      SessionTiming t;
      t.loginPacing = std::chrono::milliseconds{ 0 };
      t.retryBackoff = std::chrono::milliseconds{ 0 };
      return t;
    }

    template <typename Pred> bool eventually(Pred pred) {
      const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{ 2 };
      while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
          return true;
        std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
      }
      return pred();
    }

  } // namespace

  class GS308EPClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
      fake = std::make_shared<FakeHttpTransport>("secret");
      client = std::make_unique<GS308EPClient>(
          protocols::SwitchCredentials{ "192.168.0.10", "secret" }, fake, nullptr, fastTiming());
    }

    std::shared_ptr<FakeHttpTransport> fake;
    std::unique_ptr<GS308EPClient> client;
  };

  TEST(GS308EPClient, ctor_RejectsNullTransport) {
    EXPECT_THROW(GS308EPClient({ "1.2.3.4", "pw" }, nullptr), std::invalid_argument);
  }

  TEST_F(GS308EPClientTest, invalidPorts_NeverTouchTheNetwork) {
    EXPECT_THROW(client->togglePort(0, true), InvalidPortError);
    EXPECT_THROW(client->togglePort(9, false), InvalidPortError);
    EXPECT_THROW(client->togglePortsBatch({ { 1, true }, { 12, true } },
                                          std::chrono::milliseconds{ 0 }, nullptr),
                 InvalidPortError);

    const auto results = client->togglePortsParallel({ { 0, true }, { 9, true } });
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].errorMessage.value_or(""), "Invalid port number: 0. Must be 1-8.");
    EXPECT_FALSE(results[1].success);

    EXPECT_EQ(fake->totalRequests(), 0);
  }

  TEST_F(GS308EPClientTest, login_ConcurrentCallersShareOneExchange) {
    fake->loginDelay = std::chrono::milliseconds{ 100 };

    std::vector<std::future<std::string>> callers;
    for (int i = 0; i < 8; ++i)
      callers.push_back(std::async(std::launch::async, [this] { return client->login(); }));

    std::vector<std::string> tokens;
    for (auto& f : callers)
      tokens.push_back(f.get());

    EXPECT_EQ(fake->loginPosts(), 1);
    for (const auto& t : tokens)
      EXPECT_EQ(t, tokens.front());
    EXPECT_EQ(tokens.front(), "SID=sess1");
  }

  TEST_F(GS308EPClientTest, login_CachedSessionIsReused) {
    client->togglePort(1, true);
    client->togglePort(2, true);
    client->getPortStatuses();

    EXPECT_EQ(fake->loginPosts(), 1);
    EXPECT_EQ(fake->count("GET /login.cgi"), 1);
    EXPECT_EQ(fake->togglePosts(), 2);
    EXPECT_TRUE(client->hasSession());
  }

  TEST_F(GS308EPClientTest, login_WrongPasswordIsAuthError) {
    fake->setPassword("something-else");
    EXPECT_THROW(client->login(), AuthError);
    EXPECT_FALSE(client->hasSession());
  }

  TEST_F(GS308EPClientTest, login_LoginPageErrorIsProtocolError) {
    fake->loginPageStatus = 503;
    EXPECT_THROW(client->login(), ProtocolError);
  }

  TEST_F(GS308EPClientTest, login_WorksWithoutPreLoginCookie) {
    fake->setInitialSid = false;
    EXPECT_EQ(client->login(), "SID=sess1");
  }

  TEST_F(GS308EPClientTest, requests_GoToSwitchAddressOnPort80) {
    client->login();
    EXPECT_EQ(fake->lastPort(), 80);
    for (const auto& h : fake->hosts())
      EXPECT_EQ(h, "192.168.0.10");
  }

  TEST_F(GS308EPClientTest, togglePort_RetriesOnceOnFreshSession) {
    fake->failNextToggles = 1;

    client->togglePort(4, true);

    EXPECT_TRUE(fake->portEnabled(4));
    EXPECT_EQ(fake->loginPosts(), 2);
    EXPECT_EQ(fake->logouts(), 1);
    EXPECT_EQ(fake->togglePosts(), 2);
  }

  TEST_F(GS308EPClientTest, togglePort_SecondFailurePropagates) {
    fake->failNextToggles = 2;

    EXPECT_THROW(client->togglePort(4, true), NetworkError);
    EXPECT_FALSE(fake->portEnabled(4));
    EXPECT_EQ(fake->togglePosts(), 2);
  }

  TEST_F(GS308EPClientTest, togglePort_RejectedPostIsToggleError) {
    fake->rejectPorts = { 6 };
    try {
      client->togglePort(6, true);
      FAIL() << "expected ToggleError";
    } catch (const ToggleError& e) {
      EXPECT_STREQ(e.what(), "Failed to toggle port 6: 500");
    }
  }

  TEST_F(GS308EPClientTest, togglePort_ThenStatusRoundTrip) {
    fake->setPortEnabled(7, true);

    client->togglePort(3, true);
    const auto statuses = client->getPortStatuses();

    ASSERT_EQ(statuses.size(), 8u);
    for (const auto& s : statuses)
      EXPECT_EQ(s.enabled, s.port == 3 || s.port == 7) << "port " << s.port;
    EXPECT_TRUE(client->getPortStatus(3));
    EXPECT_FALSE(client->getPortStatus(1));
  }

  TEST_F(GS308EPClientTest, enableDisableHelpers_MapToTogglePort) {
    client->enablePort(2);
    EXPECT_TRUE(fake->portEnabled(2));
    client->disablePort(2);
    EXPECT_FALSE(fake->portEnabled(2));
  }

  TEST_F(GS308EPClientTest, getPortStatuses_FailureDropsSession) {
    client->login();
    fake->failConfigPage = true;

    EXPECT_THROW(client->getPortStatuses(), ProtocolError);
    EXPECT_FALSE(client->hasSession());
    EXPECT_EQ(fake->logouts(), 1);
  }

  TEST_F(GS308EPClientTest, togglePort_ConcurrentCallersRunInSubmissionOrder) {
    fake->loginDelay = std::chrono::milliseconds{ 150 };

    // port 1 holds the slot through a slow login; the rest queue up behind it
    std::vector<std::future<void>> callers;
    for (int port = 1; port <= 6; ++port) {
      callers.push_back(std::async(std::launch::async, [this, port] {
        client->togglePort(port, port % 2 == 1);
      }));
      std::this_thread::sleep_for(std::chrono::milliseconds{ 15 });
    }
    for (auto& f : callers)
      f.get();

    EXPECT_THAT(fake->toggleLog(), ElementsAre("1:1", "2:0", "3:1", "4:0", "5:1", "6:0"));
    EXPECT_EQ(fake->loginPosts(), 1);
  }

  TEST_F(GS308EPClientTest, batch_AppliesInOrderOnOneSession) {
    std::vector<int> applied;
    client->togglePortsBatch({ { 3, true }, { 1, true }, { 5, false } },
                             std::chrono::milliseconds{ 1 },
                             [&](const PortCommand& c) { applied.push_back(c.portNumber); });

    EXPECT_THAT(applied, ElementsAre(3, 1, 5));
    EXPECT_THAT(fake->toggleLog(), ElementsAre("3:1", "1:1", "5:0"));
    EXPECT_EQ(fake->loginPosts(), 1);
  }

  TEST_F(GS308EPClientTest, batch_StopsAtFirstPersistentFailure) {
    fake->rejectPorts = { 2 };
    std::vector<int> applied;

    EXPECT_THROW(client->togglePortsBatch(
                     { { 1, true }, { 2, true }, { 3, true } }, std::chrono::milliseconds{ 0 },
                     [&](const PortCommand& c) { applied.push_back(c.portNumber); }),
                 ToggleError);

    EXPECT_THAT(applied, ElementsAre(1));
    EXPECT_THAT(fake->toggleLog(), ElementsAre("1:1"));
    EXPECT_FALSE(fake->portEnabled(3));
    EXPECT_EQ(fake->loginPosts(), 2); // one retry on a fresh session
  }

  TEST_F(GS308EPClientTest, batch_RetryResumesAtFailedCommand) {
    std::vector<int> applied;
    client->togglePortsBatch({ { 1, true }, { 2, true } }, std::chrono::milliseconds{ 0 },
                             [&](const PortCommand& c) {
                               applied.push_back(c.portNumber);
                               if (c.portNumber == 1)
                                 fake->failNextToggles = 1;
                             });

    EXPECT_THAT(applied, ElementsAre(1, 2));
    EXPECT_THAT(fake->toggleLog(), ElementsAre("1:1", "2:1"));
  }

  TEST_F(GS308EPClientTest, parallel_OneFailureDoesNotSinkTheOthers) {
    fake->rejectPorts = { 2 };

    const auto results = client->togglePortsParallel({ { 1, true }, { 2, true }, { 3, true } });

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].errorMessage.value_or(""), "Failed to toggle port 2: 500");
    EXPECT_TRUE(results[2].success);
    EXPECT_EQ(results[2].portNumber, 3);

    EXPECT_EQ(fake->loginPosts(), 1);
    EXPECT_TRUE(fake->portEnabled(1));
    EXPECT_TRUE(fake->portEnabled(3));
    EXPECT_FALSE(client->hasSession()); // failure invalidates the shared session
  }

  TEST_F(GS308EPClientTest, parallel_FailureWaitsForQueuedBatchBeforeLogout) {
    client->login();
    fake->rejectPorts = { 2 };

    std::promise<void> firstApplied;
    auto batch = std::async(std::launch::async, [&] {
      client->togglePortsBatch({ { 4, true }, { 5, true } }, std::chrono::milliseconds{ 100 },
                               [&](const PortCommand& c) {
                                 if (c.portNumber == 4)
                                   firstApplied.set_value();
                               });
    });
    firstApplied.get_future().wait();

    // port 2 fails while the batch sits between its two commands
    const auto results = client->togglePortsParallel({ { 1, true }, { 2, true } });
    batch.get();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[1].success);
    EXPECT_THAT(fake->toggleLog(), ::testing::Contains("5:1"));
    EXPECT_EQ(fake->loginPosts(), 1); // the batch never lost its session mid-way
    EXPECT_EQ(fake->logouts(), 1);
    EXPECT_FALSE(client->hasSession());
  }

  TEST_F(GS308EPClientTest, parallel_LoginFailureThrows) {
    fake->omitSessionCookie = true;
    EXPECT_THROW(client->togglePortsParallel({ { 1, true }, { 2, true } }), AuthError);
    EXPECT_EQ(fake->togglePosts(), 0);
  }

  TEST_F(GS308EPClientTest, updateCredentials_DropsSessionAndLogsOutInBackground) {
    client->login();
    fake->setPassword("rotated");

    client->updateCredentials({ "192.168.0.10", "rotated" });

    EXPECT_FALSE(client->hasSession());
    EXPECT_EQ(client->credentials().password, "rotated");
    EXPECT_TRUE(eventually([&] { return fake->logouts() == 1; }));

    EXPECT_EQ(client->login(), "SID=sess2");
  }

  TEST_F(GS308EPClientTest, updateCredentials_SameValuesKeepSession) {
    client->login();
    client->updateCredentials({ "192.168.0.10", "secret" });

    EXPECT_TRUE(client->hasSession());
    std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
    EXPECT_EQ(fake->logouts(), 0);
  }

  TEST_F(GS308EPClientTest, clearSession_LogsOutOnceAndIsIdempotent) {
    client->login();

    client->clearSession();
    client->clearSession();

    EXPECT_FALSE(client->hasSession());
    EXPECT_EQ(fake->logouts(), 1);
    EXPECT_EQ(fake->liveSessions(), 0u);
  }

  TEST_F(GS308EPClientTest, clearSession_SwallowsLogoutFailure) {
    client->login();
    fake->unreachable = true;
    EXPECT_NO_THROW(client->clearSession());
    EXPECT_FALSE(client->hasSession());
  }

  TEST_F(GS308EPClientTest, testConnection_ProbesLoginPageOnly) {
    EXPECT_TRUE(client->testConnection());
    EXPECT_EQ(fake->totalRequests(), 1);
    EXPECT_FALSE(client->hasSession());

    fake->unreachable = true;
    EXPECT_FALSE(client->testConnection());
  }

} // namespace poegate::test
