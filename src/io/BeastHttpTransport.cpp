/* @file BeastHttpTransport.cpp
 * @brief Plain HTTP client for the switch web UI - resolve, connect, one request, one response.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// Boost headers
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

// poegate headers
#include "io/BeastHttpTransport.hpp"
#include "protocols/PoeErrors.hpp"

using namespace poegate::io;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

  http::verb toVerb(const std::string& method) {
    auto verb = http::string_to_verb(method);
    if (verb == http::verb::unknown)
      throw std::invalid_argument("[BeastHttpTransport] unsupported method: " + method);
    return verb;
  }

  [[noreturn]] void throwNetworkError(const std::string& host, const char* step,
                                      const beast::error_code& ec) {
    const bool timedOut = ec == beast::error::timeout;
    std::string msg = "[BeastHttpTransport] " + std::string(step) + " " + host + " failed: " +
                      (timedOut ? std::string("request timeout") : ec.message());
    throw poegate::protocols::NetworkError(msg, timedOut);
  }

} // namespace

HttpResponse BeastHttpTransport::send(const std::string& host, unsigned short port,
                                      const HttpRequest& request,
                                      std::chrono::milliseconds timeout) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::error_code ec;

  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec)
    throwNetworkError(host, "resolve", ec);

  // tcp_stream deadlines only apply to async ops, so the exchange runs on the local
  // io_context and a single run() drives it to completion or timeout
  stream.expires_after(timeout);

  http::request<http::string_body> req{ toVerb(request.method), request.path, 11 };
  req.set(http::field::host, host);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  for (const auto& [name, value] : request.headers)
    req.set(name, value);
  if (!request.body.empty() || req.method() == http::verb::post) {
    req.body() = request.body;
    req.prepare_payload();
  }

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  beast::error_code opError;
  const char* failedStep = nullptr;

  stream.async_connect(endpoints, [&](beast::error_code cec, const tcp::endpoint&) {
    if (cec) {
      opError = cec;
      failedStep = "connect";
      return;
    }
    http::async_write(stream, req, [&](beast::error_code wec, std::size_t) {
      if (wec) {
        opError = wec;
        failedStep = "write";
        return;
      }
      http::async_read(stream, buffer, res, [&](beast::error_code rec, std::size_t) {
        if (rec) {
          opError = rec;
          failedStep = "read";
        }
      });
    });
  });

  ioc.run();

  if (opError)
    throwNetworkError(host, failedStep, opError);

  HttpResponse out;
  out.status = static_cast<int>(res.result_int());
  for (const auto& field : res)
    out.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
  out.body = std::move(res.body());

  stream.socket().shutdown(tcp::socket::shutdown_both, ec); // not_connected is fine here
  return out;
}
