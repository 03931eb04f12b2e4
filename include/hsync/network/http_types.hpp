#pragma once

#include <map>
#include <sstream>
#include <string>
#include <unordered_map>

#ifndef _WIN32
#include <strings.h>
#endif

namespace hsync::network {

/**
 * @brief Outgoing HTTP/1.1 request
 *
 * Example wire form:
 * POST /sync/delta HTTP/1.1
 * Host: 127.0.0.1:8080
 * Content-Type: application/json
 * Content-Length: 42
 * Connection: close
 *
 * {...}
 */
struct HttpRequest {
    std::string method = "POST";
    std::string target = "/";
    std::string host;
    std::map<std::string, std::string> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string serialize() const {
        std::ostringstream oss;
        oss << method << " " << target << " HTTP/1.1\r\n";
        oss << "Host: " << host << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << body.size() << "\r\n";
        oss << "Connection: close\r\n";
        oss << "\r\n";
        oss << body;
        return oss.str();
    }
};

/**
 * @brief Parsed HTTP response
 *
 * Header lookup is case-insensitive per RFC 7230; names are stored as received.
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    bool is_client_error() const { return status_code >= 400 && status_code < 500; }

private:
    static int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
        return _stricmp(s1, s2);
#else
        return strcasecmp(s1, s2);
#endif
    }
};

} // namespace hsync::network
