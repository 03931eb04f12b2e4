#pragma once

#include "hsync/core/result.hpp"
#include "hsync/network/http_types.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace hsync::network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF     <- Headers (multiple)
 * CRLF                               <- Empty line
 * [Body]                             <- Content-Length bytes, or until EOF
 */
enum class ParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed data chunk by chunk as it arrives from the socket:
 * ```cpp
 * HttpResponseParser parser;
 * auto done = parser.parse(buffer.data(), bytes);
 * if (done.is_ok() && done.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * ```
 * A response without Content-Length is complete when the peer closes the
 * connection; call finish() on EOF.
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /**
     * @return true once the response is complete, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            char c = data[i];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::STATUS_CODE: ok = parse_status(c); break;
                case ParseState::REASON: ok = parse_reason(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ParseState::BODY: parse_body(c); break;
                case ParseState::COMPLETE: return Ok(true);
                case ParseState::PARSE_ERROR:
                    return Err<bool>(ErrorKind::TransientTransport, "parser in error state");
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(ErrorKind::TransientTransport,
                                 "malformed HTTP response at line " + std::to_string(line_));
            }
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    /**
     * @brief Peer closed the connection
     * @return true if that completes the response
     */
    Result<bool> finish() {
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ParseState::BODY && !expected_length_) {
            state_ = ParseState::COMPLETE;
            return Ok(true);
        }
        return Err<bool>(ErrorKind::TransientTransport, "connection closed before the response was complete");
    }

    HttpResponse get_response() const {
        return response_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    void reset() {
        state_ = ParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        expected_length_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ != "HTTP/1.1" && buffer_ != "HTTP/1.0") {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::STATUS_CODE;
            return true;
        }
        buffer_ += c;
        return buffer_.size() <= 8;
    }

    bool parse_status(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return false;
            }
            response_.status_code = std::atoi(buffer_.c_str());
            buffer_.clear();
            state_ = ParseState::REASON;
            last_char_was_cr_ = (c == '\r');
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            // Empty line - headers complete
            last_char_was_cr_ = false;
            std::string content_length = response_.get_header("Content-Length");
            if (!content_length.empty()) {
                char* end = nullptr;
                expected_length_ = std::strtoull(content_length.c_str(), &end, 10);
                if (end == content_length.c_str()) {
                    return false;
                }
                state_ = expected_length_ > 0 ? ParseState::BODY : ParseState::COMPLETE;
                return true;
            }
            if (response_.status_code == 204 || response_.status_code == 304) {
                state_ = ParseState::COMPLETE;
                return true;
            }
            // Body runs until the connection closes
            state_ = ParseState::BODY;
            return true;
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    void parse_body(char c) {
        response_.body.push_back(c);
        if (expected_length_ && response_.body.size() >= expected_length_) {
            state_ = ParseState::COMPLETE;
        }
    }

    ParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    unsigned long long expected_length_;  // 0 = read until close
    size_t line_;
    bool last_char_was_cr_;
};

} // namespace hsync::network
