#include "hsync/core/clock.hpp"
#include "hsync/core/error.hpp"
#include "hsync/network/http_parser.hpp"
#include "hsync/network/http_transport.hpp"
#include "hsync/sync/protocol.hpp"

#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>

using hsync::ErrorKind;
using hsync::network::Endpoint;
using hsync::network::HttpRequest;
using hsync::network::HttpResponseParser;
using hsync::network::HttpTransport;
using hsync::network::parse_endpoint;
using hsync::store::Collection;
using hsync::sync::DeltaRequest;
using hsync::sync::DeltaResponse;

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Loopback server that answers exactly one connection
 *
 * Reads one request (headers plus Content-Length body), then either writes
 * the canned bytes and closes or, when silent, holds the connection open
 * until destroyed.
 */
class CannedServer {
public:
    explicit CannedServer(std::string reply, bool silent = false)
        : reply_(std::move(reply)),
          silent_(silent),
          acceptor_(io_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { serve(); });
    }

    ~CannedServer() {
        release_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    Endpoint endpoint(const std::string& base = "") const {
        return Endpoint{"127.0.0.1", port_, base};
    }

    std::string received() const {
        std::lock_guard lock(mutex_);
        return received_;
    }

private:
    void serve() {
        tcp::socket socket(io_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) return;

        asio::streambuf buffer;
        std::size_t header_bytes = asio::read_until(socket, buffer, "\r\n\r\n", ec);
        if (ec) return;

        std::string data(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
        std::size_t content_length = 0;
        auto at = data.find("Content-Length: ");
        if (at != std::string::npos && at < header_bytes) {
            content_length = std::stoul(data.substr(at + std::strlen("Content-Length: ")));
        }
        std::size_t have = data.size() - header_bytes;
        if (have < content_length) {
            asio::read(socket, buffer, asio::transfer_exactly(content_length - have), ec);
            data.assign(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
        }
        {
            std::lock_guard lock(mutex_);
            received_ = data;
        }

        if (silent_) {
            while (!release_) {
                std::this_thread::sleep_for(5ms);
            }
        } else {
            asio::write(socket, asio::buffer(reply_), ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        }
        socket.close(ec);
    }

    std::string reply_;
    bool silent_;
    asio::io_context io_;
    tcp::acceptor acceptor_;
    std::uint16_t port_ = 0;
    std::thread thread_;
    std::atomic<bool> release_{false};
    mutable std::mutex mutex_;
    std::string received_;
};

std::string reply(int status, const std::string& reason, const std::string& body) {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
           "Content-Type: application/json\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "\r\n" + body;
}

DeltaRequest sample_request() {
    DeltaRequest request;
    request.device_id = "fridge-display";
    hsync::sync::EntityChange change;
    change.collection = Collection::Tasks;
    change.op = hsync::outbox::Operation::Create;
    change.entity_id = "t1";
    change.version = 1;
    change.data = {{"title", "Buy milk"}, {"status", "open"}};
    change.updated_at = hsync::core::ManualClock().now();
    request.pending_changes.push_back(change);
    return request;
}

} // namespace

TEST(EndpointTest, ParsesHostPortAndBase) {
    auto full = parse_endpoint("http://sync.home.lan:8080/api/v1/");
    ASSERT_TRUE(full.is_ok());
    EXPECT_EQ(full.value().host, "sync.home.lan");
    EXPECT_EQ(full.value().port, 8080);
    EXPECT_EQ(full.value().base_path, "/api/v1");

    auto bare = parse_endpoint("http://localhost");
    ASSERT_TRUE(bare.is_ok());
    EXPECT_EQ(bare.value().port, 80);
    EXPECT_TRUE(bare.value().base_path.empty());
}

TEST(EndpointTest, RejectsBadUrls) {
    for (const char* url : {"https://secure.example", "sync.home.lan", "http://:8080", "http://host:0",
                            "http://host:99999", "http://host:80a"}) {
        auto parsed = parse_endpoint(url);
        ASSERT_TRUE(parsed.is_error()) << url;
        EXPECT_EQ(parsed.error().kind, ErrorKind::Validation) << url;
    }
}

TEST(HttpRequestTest, SerializeAddsFramingHeaders) {
    HttpRequest request;
    request.target = "/sync/delta";
    request.host = "localhost:8080";
    request.set_header("Content-Type", "application/json");
    request.body = "{}";

    auto wire = request.serialize();
    EXPECT_EQ(wire.rfind("POST /sync/delta HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(wire.find("Host: localhost:8080\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 6), "\r\n\r\n{}");
}

TEST(HttpResponseParserTest, ParsesByteByByte) {
    const std::string wire = "HTTP/1.1 200 OK\r\ncontent-length: 5\r\nX-Trace: abc\r\n\r\nhello";
    HttpResponseParser parser;

    for (std::size_t i = 0; i + 1 < wire.size(); ++i) {
        auto step = parser.parse(&wire[i], 1);
        ASSERT_TRUE(step.is_ok()) << "byte " << i;
        ASSERT_FALSE(step.value()) << "byte " << i;
    }
    auto last = parser.parse(&wire.back(), 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());

    auto response = parser.get_response();
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.reason_phrase, "OK");
    EXPECT_EQ(response.get_header("Content-Length"), "5");
    EXPECT_EQ(response.get_header("x-trace"), "abc");
    EXPECT_EQ(response.body, "hello");
}

TEST(HttpResponseParserTest, BodyWithoutLengthEndsAtEof) {
    const std::string wire = "HTTP/1.0 503 Service Unavailable\r\n\r\ntry later";
    HttpResponseParser parser;

    auto parsed = parser.parse(wire.data(), wire.size());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_FALSE(parsed.value());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_TRUE(finished.value());
    EXPECT_EQ(parser.get_response().status_code, 503);
    EXPECT_EQ(parser.get_response().body, "try later");
}

TEST(HttpResponseParserTest, NoContentCompletesWithoutBody) {
    const std::string wire = "HTTP/1.1 204 No Content\r\n\r\n";
    HttpResponseParser parser;
    auto parsed = parser.parse(wire.data(), wire.size());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value());
    EXPECT_TRUE(parser.get_response().body.empty());
}

TEST(HttpResponseParserTest, TruncatedBodyIsTransient) {
    const std::string wire = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc";
    HttpResponseParser parser;
    ASSERT_TRUE(parser.parse(wire.data(), wire.size()).is_ok());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_error());
    EXPECT_EQ(finished.error().kind, ErrorKind::TransientTransport);
}

TEST(HttpResponseParserTest, RejectsGarbage) {
    const std::string wire = "SMTP/2.0 hello\r\n\r\n";
    HttpResponseParser parser;
    auto parsed = parser.parse(wire.data(), wire.size());
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().kind, ErrorKind::TransientTransport);
    EXPECT_FALSE(parser.is_complete());
}

TEST(HttpTransportTest, PostsDeltaAndDecodesResponse) {
    DeltaResponse canned;
    canned.sync_timestamp = hsync::core::parse_iso8601("2024-03-02T09:00:00.000Z").value();
    hsync::sync::EntityChange change;
    change.collection = Collection::Events;
    change.entity_id = "e1";
    change.version = 2;
    change.data = {{"title", "Dentist"}, {"start", "2024-03-05T15:00:00.000Z"}};
    change.updated_at = canned.sync_timestamp;
    canned.server_changes.push_back(change);

    CannedServer server(reply(200, "OK", hsync::sync::encode_response(canned).dump()));
    HttpTransport transport(server.endpoint("/household"));

    auto response = transport.exchange(sample_request(), 2s);
    ASSERT_TRUE(response.is_ok()) << response.error().message;
    ASSERT_EQ(response.value().server_changes.size(), 1u);
    EXPECT_EQ(response.value().server_changes[0].entity_id, "e1");
    EXPECT_EQ(response.value().sync_timestamp, canned.sync_timestamp);

    auto received = server.received();
    EXPECT_EQ(received.rfind("POST /household/sync/delta HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(received.find("Content-Type: application/json"), std::string::npos);

    auto body = nlohmann::json::parse(received.substr(received.find("\r\n\r\n") + 4));
    EXPECT_EQ(body["deviceId"], "fridge-display");
    EXPECT_EQ(body["pendingChanges"][0]["entityId"], "t1");
}

TEST(HttpTransportTest, ClientErrorIsPermanent) {
    CannedServer server(reply(400, "Bad Request", R"({"error":"unknown entity type"})"));
    HttpTransport transport(server.endpoint());

    auto response = transport.exchange(sample_request(), 2s);
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::PermanentRejection);
    EXPECT_NE(response.error().message.find("unknown entity type"), std::string::npos);
}

TEST(HttpTransportTest, ThrottlingIsTransient) {
    CannedServer server(reply(429, "Too Many Requests", ""));
    HttpTransport transport(server.endpoint());

    auto response = transport.exchange(sample_request(), 2s);
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::TransientTransport);
}

TEST(HttpTransportTest, ServerErrorIsTransient) {
    CannedServer server(reply(503, "Service Unavailable", ""));
    HttpTransport transport(server.endpoint());

    auto response = transport.exchange(sample_request(), 2s);
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::TransientTransport);
    EXPECT_FALSE(hsync::core::is_cancellation(response.error()));
}

TEST(HttpTransportTest, UnreadableBodyIsTransient) {
    CannedServer server(reply(200, "OK", "<html>captive portal</html>"));
    HttpTransport transport(server.endpoint());

    auto response = transport.exchange(sample_request(), 2s);
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::TransientTransport);
}

TEST(HttpTransportTest, SilentServerTimesOut) {
    CannedServer server("", true);
    HttpTransport transport(server.endpoint());

    auto started = std::chrono::steady_clock::now();
    auto response = transport.exchange(sample_request(), 200ms);
    auto waited = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().kind, ErrorKind::Timeout);
    EXPECT_TRUE(hsync::core::is_cancellation(response.error()));
    EXPECT_LT(waited, 2s);
}

TEST(HttpTransportTest, UnknownHostIsCancellation) {
    HttpTransport transport(Endpoint{"hsync-authority.invalid", 80, ""});

    auto response = transport.exchange(sample_request(), 1s);
    ASSERT_TRUE(response.is_error());
    // Offline when the resolver answers, Timeout when it never does
    EXPECT_TRUE(hsync::core::is_cancellation(response.error())) << response.error().message;
}
