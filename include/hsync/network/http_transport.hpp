#pragma once

#include "hsync/core/result.hpp"
#include "hsync/network/http_types.hpp"
#include "hsync/sync/transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace hsync::network {

/// Parsed form of "http://host[:port][/base]"
struct Endpoint {
    std::string host;
    std::uint16_t port = 80;
    std::string base_path;   ///< Without trailing slash, may be empty
};

Result<Endpoint> parse_endpoint(const std::string& url);

/**
 * @brief Delta sync over HTTP/1.1 using Boost.Asio
 *
 * Each exchange opens a fresh connection, POSTs the request to
 * `<base>/sync/delta` and reads the response until Content-Length or EOF.
 * The whole round trip is bounded by the timeout passed to exchange().
 *
 * Status mapping:
 *   2xx          -> decoded DeltaResponse
 *   408, 429     -> TransientTransport
 *   other 4xx    -> PermanentRejection
 *   5xx          -> TransientTransport
 *   unresolvable host / unreachable network -> Offline
 */
class HttpTransport : public sync::Transport {
public:
    explicit HttpTransport(Endpoint endpoint);

    Result<sync::DeltaResponse> exchange(const sync::DeltaRequest& request,
                                         std::chrono::milliseconds timeout) override;

    /// One raw round trip. Exposed for tests.
    Result<HttpResponse> round_trip(const HttpRequest& request, std::chrono::milliseconds timeout);

    const Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    Endpoint endpoint_;
};

} // namespace hsync::network
