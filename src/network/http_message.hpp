#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace cadence::network::http {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

struct Request {
    std::string method;
    std::string target;
    std::string version = "HTTP/1.1";
    Headers headers;
    std::string body;

    bool has_header(const std::string& name) const { return headers.count(name) > 0; }
    std::string header(const std::string& name) const;
};

struct Response {
    int status = 0;
    std::string reason;
    std::string version = "HTTP/1.1";
    Headers headers;
    std::string body;

    bool has_header(const std::string& name) const { return headers.count(name) > 0; }
    std::string header(const std::string& name) const;
};

enum class ParseStatus {
    COMPLETE,
    INCOMPLETE,
    INVALID,
    TOO_LARGE,
    TIMEOUT,
    CLOSED
};

const char* to_string(ParseStatus status);

/**
 * Incremental parsers over a receive buffer. `eof` tells the parser the peer
 * closed its side, which completes a response that carries neither
 * Content-Length nor chunked framing.
 */
ParseStatus parse_request(const std::string& data, size_t max_body, Request& out);
ParseStatus parse_response(const std::string& data, bool eof, Response& out);

std::string serialize(const Request& request);
std::string serialize(const Response& response);

std::string reason_phrase(int status);
Response make_response(int status);

// Blocking socket helpers bounded by a deadline
bool send_all(int fd, const std::string& data, std::chrono::milliseconds timeout, std::string& error);
ParseStatus receive_request(int fd, size_t max_body, std::chrono::milliseconds timeout, Request& out);
ParseStatus receive_response(int fd, std::chrono::milliseconds timeout, Response& out);

std::string trim(const std::string& value);

} // namespace cadence::network::http
