#pragma once
/** @file  FakeHttpTransport.hpp
 *  @brief In-memory GS308EP web UI behind the HttpTransport seam, with fault injection.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "io/HttpTransport.hpp"
#include "protocols/GS308EPCodec.hpp"
#include "protocols/PoeErrors.hpp"

namespace poegate {
  namespace test {

    /**
 * @class FakeHttpTransport
 * @brief Answers login / PoEPortConfig / logout like the real switch does.
 *
 *  * Port state is kept per port and rendered into the status page.
 *  * Every request is counted by "METHOD path" and recorded with its host.
 *  * Knobs below inject the failures the client has to survive.
 */
    class FakeHttpTransport : public io::HttpTransport {
    public:
      explicit FakeHttpTransport(std::string password = "secret") : password_(std::move(password)) {}

      //---fault injection (set before the exchange under test)----------
      std::string nonce = "1234567890";
      bool setInitialSid = true;                   ///< login page hands out a pre-login cookie
      bool unreachable = false;                    ///< every request throws NetworkError
      int loginPageStatus = 200;
      bool omitSessionCookie = false;              ///< login POST answers 200 without SID
      std::chrono::milliseconds loginDelay{ 0 };   ///< widens the login race window
      int failNextToggles = 0;                     ///< next N toggle POSTs throw NetworkError
      std::set<int> rejectPorts;                   ///< toggle POSTs for these ports answer 500
      bool failConfigPage = false;                 ///< status page answers 500

      io::HttpResponse send(const std::string& host, unsigned short port,
                            const io::HttpRequest& req, std::chrono::milliseconds) override {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          ++counts_[req.method + " " + req.path];
          hosts_.push_back(host);
          lastPort_ = port;
          if (unreachable)
            throw protocols::NetworkError("connect: connection refused (" + host + ")", false);
        }

        if (req.path == protocols::gs308ep::kLoginPath)
          return req.method == "GET" ? loginPage() : loginPost(req);
        if (req.path == protocols::gs308ep::kPortConfigPath)
          return req.method == "GET" ? configPage(req) : togglePost(req);
        if (req.path == protocols::gs308ep::kLogoutPath)
          return logout(req);
        return io::HttpResponse{ 404, {}, "not found" };
      }

      //---inspection-------------------------------------------------------
      int count(const std::string& methodAndPath) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = counts_.find(methodAndPath);
        return it == counts_.end() ? 0 : it->second;
      }
      int loginPosts() const { return count("POST /login.cgi"); }
      int togglePosts() const { return count("POST /PoEPortConfig.cgi"); }
      int logouts() const { return count("GET /logout.cgi"); }
      int totalRequests() const {
        std::lock_guard<std::mutex> lock(mtx_);
        int n = 0;
        for (const auto& [_, c] : counts_)
          n += c;
        return n;
      }

      std::vector<std::string> hosts() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return hosts_;
      }
      unsigned short lastPort() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return lastPort_;
      }

      bool portEnabled(int port) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return ports_.at(port - 1);
      }
      void setPortEnabled(int port, bool on) {
        std::lock_guard<std::mutex> lock(mtx_);
        ports_.at(port - 1) = on;
      }

      /// Order in which ports were switched, as "port:0|1".
      std::vector<std::string> toggleLog() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return toggleLog_;
      }

      std::size_t liveSessions() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return sessions_.size();
      }

      void setPassword(std::string pw) {
        std::lock_guard<std::mutex> lock(mtx_);
        password_ = std::move(pw);
      }

    private:
      static std::string cookieOf(const io::HttpRequest& req) {
        for (const auto& [k, v] : req.headers)
          if (k == "Cookie")
            return v;
        return {};
      }

      static std::map<std::string, std::string> parseForm(const std::string& body) {
        std::map<std::string, std::string> out;
        std::size_t pos = 0;
        while (pos <= body.size()) {
          auto amp = body.find('&', pos);
          if (amp == std::string::npos)
            amp = body.size();
          const auto pair = body.substr(pos, amp - pos);
          const auto eq = pair.find('=');
          if (eq != std::string::npos)
            out[pair.substr(0, eq)] = pair.substr(eq + 1);
          pos = amp + 1;
        }
        return out;
      }

      io::HttpResponse loginPage() {
        std::lock_guard<std::mutex> lock(mtx_);
        io::HttpResponse res{ loginPageStatus, {}, {} };
        res.body = "<html><form><input type='hidden' id='rand' value='" + nonce +
                   "' disabled></form></html>";
        if (setInitialSid)
          res.headers.emplace_back("Set-Cookie", "SID=prelogin; path=/");
        return res;
      }

      io::HttpResponse loginPost(const io::HttpRequest& req) {
        if (loginDelay.count() > 0)
          std::this_thread::sleep_for(loginDelay);

        std::lock_guard<std::mutex> lock(mtx_);
        const auto expected = protocols::gs308ep::buildLoginRequest(nonce, password_);
        if (req.body != expected || omitSessionCookie)
          return io::HttpResponse{ 200, {}, "<html>Login failed</html>" };

        const auto sid = "sess" + std::to_string(++sidCounter_);
        sessions_.insert("SID=" + sid);
        return io::HttpResponse{
          200, { { "Set-Cookie", "SID=" + sid + "; SameSite=Lax; HttpOnly" } }, "<html></html>"
        };
      }

      io::HttpResponse configPage(const io::HttpRequest& req) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (sessions_.count(cookieOf(req)) == 0)
          return io::HttpResponse{ 200, {}, "<html>redirect to login</html>" };
        if (failConfigPage)
          return io::HttpResponse{ 500, {}, {} };

        std::string body = "<html><form><input type=hidden name='hash' id='hash' value=\"" +
                           kHash + "\"><ul>";
        for (int p = 1; p <= 8; ++p) {
          body += "<li class=\"poe_port_list_item\"><input type=\"hidden\" class=\"port\" value=\"" +
                  std::to_string(p) + "\"><span>Port " + std::to_string(p) +
                  "</span><input type=\"hidden\" class=\"hidPortPwr\" id=\"hidPortPwr\" value=\"" +
                  (ports_[p - 1] ? "1" : "0") + "\"></li>";
        }
        body += "</ul></form></html>";
        return io::HttpResponse{ 200, {}, body };
      }

      io::HttpResponse togglePost(const io::HttpRequest& req) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (failNextToggles > 0) {
          --failNextToggles;
          throw protocols::NetworkError("read: connection reset by peer", false);
        }
        if (sessions_.count(cookieOf(req)) == 0)
          return io::HttpResponse{ 401, {}, {} };

        auto form = parseForm(req.body);
        if (form["hash"] != kHash)
          return io::HttpResponse{ 400, {}, "bad hash" };
        const int port = std::stoi(form["portID"]) + 1;
        if (rejectPorts.count(port) != 0)
          return io::HttpResponse{ 500, {}, {} };

        ports_.at(port - 1) = form["ADMIN_MODE"] == "1";
        toggleLog_.push_back(std::to_string(port) + ":" + form["ADMIN_MODE"]);
        return io::HttpResponse{ 200, {}, "SUCCESS" };
      }

      io::HttpResponse logout(const io::HttpRequest& req) {
        std::lock_guard<std::mutex> lock(mtx_);
        sessions_.erase(cookieOf(req));
        return io::HttpResponse{ 200, {}, {} };
      }

      inline static const std::string kHash = "4f2a9c";

      mutable std::mutex mtx_;
      std::string password_;
      std::array<bool, 8> ports_{};
      std::set<std::string> sessions_;
      int sidCounter_{ 0 };
      std::map<std::string, int> counts_;
      std::vector<std::string> hosts_;
      std::vector<std::string> toggleLog_;
      unsigned short lastPort_{ 0 };
    };

  } // namespace test
} // namespace poegate
