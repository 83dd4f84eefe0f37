#pragma once
/** @file  BeastHttpTransport.hpp
 *  @brief HttpTransport over a Boost.Beast tcp_stream with a per-call deadline.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "io/HttpTransport.hpp"

namespace poegate {
  namespace io {

    /**
 * @class BeastHttpTransport
 * @brief Resolves, connects, writes and reads one message per call.
 *
 *  * Each call owns its own io_context + socket, so concurrent calls share nothing.
 *  * The switch answers with `Connection: close`; no keep-alive pooling.
 */
    class BeastHttpTransport : public HttpTransport {
    public:
      BeastHttpTransport() = default;
      ~BeastHttpTransport() override = default;

      HttpResponse send(const std::string& host, unsigned short port, const HttpRequest& request,
                        std::chrono::milliseconds timeout) override;

      //---non-copyable-----------------------------------------
      BeastHttpTransport(const BeastHttpTransport&) = delete;
      BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;
    };

  } // namespace io
} // namespace poegate
