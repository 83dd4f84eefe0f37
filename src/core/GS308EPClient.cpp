/* @file GS308EPClient.cpp
 * @brief login / hash / toggle exchanges against a GS308EP, serialized per switch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <thread>

// poegate headers
#include "core/GS308EPClient.hpp"
#include "core/Logger.hpp"
#include "protocols/GS308EPCodec.hpp"
#include "protocols/PoeErrors.hpp"

using namespace poegate::core;
namespace codec = poegate::protocols::gs308ep;
using poegate::protocols::PortCommand;
using poegate::protocols::SwitchCredentials;
using poegate::protocols::ToggleResult;

namespace {

  constexpr const char* kSource = "PoE";

  void pause(std::chrono::milliseconds d) {
    if (d.count() > 0)
      std::this_thread::sleep_for(d);
  }

} // namespace

GS308EPClient::GS308EPClient(SwitchCredentials creds, std::shared_ptr<io::HttpTransport> transport,
                             std::shared_ptr<Logger> logger, SessionTiming timing)
    : creds_(std::move(creds)), transport_(std::move(transport)), logger_(std::move(logger)),
      timing_(timing) {
  if (!transport_)
    throw std::invalid_argument("[GS308EPClient] transport is nullptr");
}

// -------------------------------------------------------------------
// GS308EPClient::login
// Single-flight: the first caller without a cached SID performs the
// exchange, everyone arriving meanwhile waits on the same shared_future
// and receives the same SID (or the same exception).
// -------------------------------------------------------------------
std::string GS308EPClient::login() {
  std::promise<std::string> promise;
  std::shared_future<std::string> pending;
  SwitchCredentials creds;
  std::uint64_t epoch = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (cachedSid_)
      return *cachedSid_;
    if (loginInFlight_.valid()) {
      pending = loginInFlight_;
    } else {
      loginInFlight_ = promise.get_future().share();
      creds = creds_;
      epoch = sessionEpoch_;
    }
  }

  if (pending.valid())
    return pending.get();

  try {
    auto sid = performLogin(creds);
    {
      std::lock_guard<std::mutex> lock(mtx_);
      // a clear/credential change while we were logging in wins
      if (epoch == sessionEpoch_) {
        cachedSid_ = sid;
        loginInFlight_ = {};
      }
    }
    promise.set_value(sid);
    return sid;
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (epoch == sessionEpoch_)
        loginInFlight_ = {};
    }
    promise.set_exception(std::current_exception());
    throw;
  }
}

std::string GS308EPClient::performLogin(const SwitchCredentials& creds) {
  log(LogLevel::Info, "Performing fresh login to " + creds.ipAddress + "...");

  const auto page = fetchLoginPage(creds.ipAddress);
  log(LogLevel::Debug,
      std::string("Got rand value, initial SID: ") + (page.initialSid.empty() ? "no" : "yes"));

  // the switch closes every connection; it needs a moment before the next one
  pause(timing_.loginPacing);

  auto res = exchange(creds.ipAddress,
                      codec::loginPostRequest(creds.ipAddress, page.nonce, creds.password,
                                              page.initialSid),
                      timing_.requestTimeout);
  if (res.status != 200)
    throw protocols::AuthError("Login failed: " + std::to_string(res.status));

  auto sid = codec::findSessionToken(res.headerValues("Set-Cookie"));
  if (sid.empty()) {
    const auto snippet = res.body.substr(0, 200);
    log(LogLevel::Error, "Login POST returned no session cookie. Status: " +
                             std::to_string(res.status) + ", Body: " + snippet);
    throw protocols::AuthError("No session cookie received from login (body: " + snippet + ")");
  }
  return sid;
}

GS308EPClient::LoginPage GS308EPClient::fetchLoginPage(const std::string& host) {
  auto res = exchange(host, codec::loginPageRequest(), timing_.requestTimeout);
  if (res.status != 200)
    throw protocols::ProtocolError("Failed to fetch login page: " + std::to_string(res.status));

  LoginPage page;
  page.nonce = codec::extractNonce(res.body);
  page.initialSid = codec::findSessionToken(res.headerValues("Set-Cookie"));
  return page;
}

std::string GS308EPClient::fetchHashToken(const std::string& host, const std::string& sid) {
  auto res = exchange(host, codec::configPageRequest(sid), timing_.requestTimeout);
  if (res.status != 200)
    throw protocols::ProtocolError("Failed to get PoE config page: " +
                                   std::to_string(res.status));
  return codec::extractHashToken(res.body);
}

void GS308EPClient::applyCommand(const std::string& host, const std::string& sid,
                                 const PortCommand& cmd) {
  // the hash is single-use, so every command scrapes a fresh one
  const auto hash = fetchHashToken(host, sid);
  auto res = exchange(host, codec::togglePostRequest(sid, hash, cmd), timing_.requestTimeout);
  if (res.status != 200)
    throw protocols::ToggleError("Failed to toggle port " + std::to_string(cmd.portNumber) + ": " +
                                 std::to_string(res.status));
}

void GS308EPClient::doTogglePort(const PortCommand& cmd) {
  const auto sid = login();
  applyCommand(credentials().ipAddress, sid, cmd);
}

void GS308EPClient::togglePort(int port, bool enabled) {
  codec::validatePort(port);
  const PortCommand cmd{ port, enabled };

  queue_.run([&] {
    try {
      doTogglePort(cmd);
    } catch (const std::exception& e) {
      log(LogLevel::Error, "Toggle port " + std::to_string(port) + " failed: " + e.what());

      // session might have expired - start clean and retry exactly once
      invalidateSession();
      pause(timing_.retryBackoff);

      log(LogLevel::Info, "Retrying port " + std::to_string(port) + "...");
      doTogglePort(cmd);
    }
  });
}

void GS308EPClient::togglePortsBatch(const std::vector<PortCommand>& commands,
                                     std::chrono::milliseconds interCommandDelay,
                                     const AppliedFn& onApplied) {
  for (const auto& cmd : commands)
    codec::validatePort(cmd.portNumber);
  if (commands.empty())
    return;

  queue_.run([&] {
    std::size_t next = 0;

    auto applyRemaining = [&] {
      const auto sid = login();
      const auto host = credentials().ipAddress;
      for (; next < commands.size(); ++next) {
        applyCommand(host, sid, commands[next]);
        if (onApplied)
          onApplied(commands[next]);
        if (interCommandDelay.count() > 0 && next + 1 < commands.size())
          pause(interCommandDelay);
      }
    };

    try {
      applyRemaining();
    } catch (const std::exception& e) {
      const auto failedPort = std::to_string(commands[next].portNumber);
      log(LogLevel::Error, "Batch aborted at port " + failedPort + ": " + e.what());

      // completed commands stay applied; resume from the one that failed
      invalidateSession();
      pause(timing_.retryBackoff);

      log(LogLevel::Info, "Retrying batch from port " + failedPort + "...");
      applyRemaining();
    }
  });
}

std::vector<ToggleResult>
GS308EPClient::togglePortsParallel(const std::vector<PortCommand>& commands) {
  std::vector<ToggleResult> results(commands.size());
  std::vector<std::size_t> valid;

  for (std::size_t i = 0; i < commands.size(); ++i) {
    results[i].portNumber = commands[i].portNumber;
    if (!protocols::isValidPort(commands[i].portNumber)) {
      results[i].success = false;
      results[i].errorMessage = protocols::InvalidPortError(commands[i].portNumber).what();
    } else {
      valid.push_back(i);
    }
  }
  if (valid.empty())
    return results;

  // shared session; the only step allowed to fail the whole call
  const auto sid = login();
  const auto host = credentials().ipAddress;

  std::vector<std::future<void>> inFlight;
  inFlight.reserve(valid.size());
  for (auto i : valid)
    inFlight.push_back(std::async(std::launch::async,
                                  [this, &host, &sid, &commands, i] {
                                    applyCommand(host, sid, commands[i]);
                                  }));

  bool anyFailed = false;
  for (std::size_t k = 0; k < valid.size(); ++k) {
    auto& result = results[valid[k]];
    try {
      inFlight[k].get();
      result.success = true;
    } catch (const std::exception& e) {
      result.success = false;
      result.errorMessage = e.what();
      anyFailed = true;
      log(LogLevel::Error,
          "Parallel toggle port " + std::to_string(result.portNumber) + " failed: " + e.what());
    }
  }

  // don't let a half-broken session poison the next call; queued behind any
  // toggle that is still using it
  if (anyFailed)
    queue_.run([this] { invalidateSession(); });

  return results;
}

std::vector<poegate::protocols::PortStatus> GS308EPClient::getPortStatuses() {
  return queue_.run([&] {
    try {
      const auto sid = login();
      auto res = exchange(credentials().ipAddress, codec::configPageRequest(sid),
                          timing_.requestTimeout);
      if (res.status != 200)
        throw protocols::ProtocolError("Failed to get PoE config page: " +
                                       std::to_string(res.status));
      return codec::parsePortStatuses(res.body);
    } catch (const std::exception&) {
      invalidateSession();
      throw;
    }
  });
}

void GS308EPClient::updateCredentials(const SwitchCredentials& creds) {
  std::optional<std::string> oldSid;
  std::string oldHost;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (creds_ == creds)
      return;
    oldSid = std::move(cachedSid_);
    oldHost = creds_.ipAddress;
    creds_ = creds;
    cachedSid_.reset();
    loginInFlight_ = {};
    ++sessionEpoch_;
  }
  log(LogLevel::Info, "Credentials changed for " + oldHost + ", session dropped");

  if (!oldSid)
    return;

  // fire and forget: the caller must not wait on the old switch
  std::thread([transport = transport_, logger = logger_, host = oldHost, sid = *oldSid,
               timeout = timing_.logoutTimeout] {
    try {
      transport->send(host, codec::kHttpPort, codec::logoutRequest(sid), timeout);
    } catch (const std::exception& e) {
      logTo(logger, LogLevel::Debug, kSource,
            "Background logout from " + host + " failed: " + e.what());
    }
  }).detach();
}

SwitchCredentials GS308EPClient::credentials() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return creds_;
}

bool GS308EPClient::hasSession() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return cachedSid_.has_value();
}

void GS308EPClient::clearSession() { invalidateSession(); }

bool GS308EPClient::testConnection() {
  try {
    fetchLoginPage(credentials().ipAddress);
    return true;
  } catch (const std::exception& e) {
    log(LogLevel::Warning, std::string("Switch connection test failed: ") + e.what());
    return false;
  }
}

void GS308EPClient::invalidateSession() {
  std::optional<std::string> sid;
  std::string host;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    sid = std::move(cachedSid_);
    cachedSid_.reset();
    loginInFlight_ = {};
    ++sessionEpoch_;
    host = creds_.ipAddress;
  }
  if (sid)
    logout(host, *sid);
}

void GS308EPClient::logout(const std::string& host, const std::string& sid) {
  try {
    exchange(host, codec::logoutRequest(sid), timing_.logoutTimeout);
  } catch (const std::exception& e) {
    // frees a session slot on the switch when it works; nothing to do when it doesn't
    log(LogLevel::Debug, "Logout from " + host + " failed: " + e.what());
  }
}

poegate::io::HttpResponse GS308EPClient::exchange(const std::string& host,
                                                  const io::HttpRequest& req,
                                                  std::chrono::milliseconds timeout) {
  return transport_->send(host, codec::kHttpPort, req, timeout);
}

void GS308EPClient::log(LogLevel level, const std::string& msg) const {
  logTo(logger_, level, kSource, msg);
}
