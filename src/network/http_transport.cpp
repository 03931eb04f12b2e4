#include "hsync/network/http_transport.hpp"
#include "hsync/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <optional>

namespace hsync::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

Result<Endpoint> parse_endpoint(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return Err<Endpoint>(ErrorKind::Validation, "endpoint must start with http://: " + url);
    }

    std::string rest = url.substr(scheme.size());
    Endpoint endpoint;

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.base_path = rest.substr(slash);
        while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
            endpoint.base_path.pop_back();
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (port.empty() || port.size() > 5 ||
            port.find_first_not_of("0123456789") != std::string::npos) {
            return Err<Endpoint>(ErrorKind::Validation, "invalid port in endpoint: " + url);
        }
        unsigned long value = std::stoul(port);
        if (value == 0 || value > 65535) {
            return Err<Endpoint>(ErrorKind::Validation, "port out of range in endpoint: " + url);
        }
        endpoint.port = static_cast<std::uint16_t>(value);
    }

    if (authority.empty()) {
        return Err<Endpoint>(ErrorKind::Validation, "endpoint has no host: " + url);
    }
    endpoint.host = authority;
    return Ok(std::move(endpoint));
}

HttpTransport::HttpTransport(Endpoint endpoint)
    : endpoint_(std::move(endpoint)) {
}

namespace {

ErrorKind classify_socket_error(const boost::system::error_code& ec) {
    if (ec == asio::error::host_not_found ||
        ec == asio::error::host_not_found_try_again ||
        ec == asio::error::network_unreachable ||
        ec == asio::error::host_unreachable ||
        ec == asio::error::network_down) {
        return ErrorKind::Offline;
    }
    return ErrorKind::TransientTransport;
}

/// State shared by the async chain of one round trip
struct Exchange {
    explicit Exchange(asio::io_context& io) : resolver(io), socket(io) {}

    tcp::resolver resolver;
    tcp::socket socket;
    std::string outgoing;
    std::array<char, 8192> buffer{};
    HttpResponseParser parser;
    bool done = false;
    std::optional<Error> error;

    void fail(const boost::system::error_code& ec, const char* stage) {
        done = true;
        error = Error(classify_socket_error(ec), std::string(stage) + ": " + ec.message());
    }
};

void do_read(const std::shared_ptr<Exchange>& ex) {
    ex->socket.async_read_some(
        asio::buffer(ex->buffer),
        [ex](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec == asio::error::eof) {
                auto finished = ex->parser.finish();
                ex->done = true;
                if (finished.is_error()) {
                    ex->error = finished.error();
                }
                return;
            }
            if (ec) {
                ex->fail(ec, "read");
                return;
            }

            auto parsed = ex->parser.parse(ex->buffer.data(), bytes_transferred);
            if (parsed.is_error()) {
                ex->done = true;
                ex->error = parsed.error();
                return;
            }
            if (parsed.value()) {
                ex->done = true;
                return;
            }
            do_read(ex);
        });
}

} // namespace

Result<HttpResponse> HttpTransport::round_trip(const HttpRequest& request, std::chrono::milliseconds timeout) {
    asio::io_context io;
    auto ex = std::make_shared<Exchange>(io);
    ex->outgoing = request.serialize();

    ex->resolver.async_resolve(
        endpoint_.host, std::to_string(endpoint_.port),
        [ex](boost::system::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                ex->fail(ec, "resolve");
                return;
            }
            asio::async_connect(
                ex->socket, results,
                [ex](boost::system::error_code ec, const tcp::endpoint&) {
                    if (ec) {
                        ex->fail(ec, "connect");
                        return;
                    }
                    asio::async_write(
                        ex->socket, asio::buffer(ex->outgoing),
                        [ex](boost::system::error_code ec, size_t) {
                            if (ec) {
                                ex->fail(ec, "write");
                                return;
                            }
                            do_read(ex);
                        });
                });
        });

    io.run_for(timeout);

    if (!ex->done) {
        boost::system::error_code ignored;
        ex->socket.close(ignored);
        io.stop();
        return Err<HttpResponse>(ErrorKind::Timeout,
                                 "no response from " + endpoint_.host + " within " +
                                     std::to_string(timeout.count()) + "ms");
    }
    if (ex->error) {
        return Err<HttpResponse, Error>(*ex->error);
    }
    return Ok(ex->parser.get_response());
}

Result<sync::DeltaResponse> HttpTransport::exchange(const sync::DeltaRequest& request,
                                                    std::chrono::milliseconds timeout) {
    HttpRequest http;
    http.method = "POST";
    http.target = endpoint_.base_path + "/sync/delta";
    http.host = endpoint_.host + ":" + std::to_string(endpoint_.port);
    http.set_header("Content-Type", "application/json");
    http.set_header("Accept", "application/json");
    http.body = sync::encode_request(request).dump();

    spdlog::debug("[HttpTransport] POST {} ({} changes, {} bytes)",
                  http.target, request.pending_changes.size(), http.body.size());

    auto result = round_trip(http, timeout);
    if (result.is_error()) {
        spdlog::warn("[HttpTransport] {}: {}", to_string(result.error().kind), result.error().message);
        return Err<sync::DeltaResponse, Error>(result.error());
    }

    const HttpResponse& response = result.value();
    if (response.status_code == 408 || response.status_code == 429) {
        return Err<sync::DeltaResponse>(ErrorKind::TransientTransport,
                                        "authority busy (HTTP " + std::to_string(response.status_code) + ")");
    }
    if (response.is_client_error()) {
        return Err<sync::DeltaResponse>(ErrorKind::PermanentRejection,
                                        "authority rejected request (HTTP " +
                                            std::to_string(response.status_code) + "): " + response.body);
    }
    if (!response.is_success()) {
        return Err<sync::DeltaResponse>(ErrorKind::TransientTransport,
                                        "authority error (HTTP " + std::to_string(response.status_code) + ")");
    }

    try {
        auto doc = nlohmann::json::parse(response.body);
        auto decoded = sync::decode_response(doc);
        if (decoded.is_error()) {
            return Err<sync::DeltaResponse>(ErrorKind::TransientTransport,
                                            "unreadable delta response: " + decoded.error().message);
        }
        return decoded;
    } catch (const nlohmann::json::exception& e) {
        return Err<sync::DeltaResponse>(ErrorKind::TransientTransport,
                                        std::string("delta response is not JSON: ") + e.what());
    }
}

} // namespace hsync::network
