#include "http_message.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace cadence::network::http {

namespace {

constexpr size_t kMaxHeadBytes = 64 * 1024;
constexpr size_t kReadChunk = 4096;

struct Head {
    std::string start_line;
    Headers headers;
    size_t body_offset = 0;
};

// Locates the end of the header block and parses header lines.
ParseStatus parse_head(const std::string& data, Head& head) {
    size_t end = data.find("\r\n\r\n");
    size_t separator = 4;
    if (end == std::string::npos) {
        end = data.find("\n\n");
        separator = 2;
    }
    if (end == std::string::npos) {
        return data.size() > kMaxHeadBytes ? ParseStatus::TOO_LARGE : ParseStatus::INCOMPLETE;
    }

    head.body_offset = end + separator;
    std::istringstream lines(data.substr(0, end));
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (first) {
            head.start_line = line;
            first = false;
            continue;
        }
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return ParseStatus::INVALID;
        }
        std::string name = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        auto it = head.headers.find(name);
        if (it == head.headers.end()) {
            head.headers.emplace(std::move(name), std::move(value));
        } else {
            it->second += ", " + value;
        }
    }
    return head.start_line.empty() ? ParseStatus::INVALID : ParseStatus::COMPLETE;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool is_chunked(const Headers& headers) {
    auto it = headers.find("Transfer-Encoding");
    if (it == headers.end()) {
        return false;
    }
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value.find("chunked") != std::string::npos;
}

ParseStatus decode_chunked(const std::string& data, size_t offset, size_t max_body, std::string& body) {
    body.clear();
    size_t pos = offset;
    while (true) {
        size_t line_end = data.find("\r\n", pos);
        if (line_end == std::string::npos) {
            return ParseStatus::INCOMPLETE;
        }
        std::string size_field = data.substr(pos, line_end - pos);
        auto ext = size_field.find(';');
        if (ext != std::string::npos) {
            size_field.resize(ext);
        }
        size_field = trim(size_field);
        if (size_field.empty()) {
            return ParseStatus::INVALID;
        }

        size_t chunk_size = 0;
        try {
            chunk_size = std::stoul(size_field, nullptr, 16);
        } catch (const std::exception&) {
            return ParseStatus::INVALID;
        }

        pos = line_end + 2;
        if (chunk_size == 0) {
            // Trailers are not used by GENA peers; require the final CRLF.
            return data.size() >= pos + 2 ? ParseStatus::COMPLETE : ParseStatus::INCOMPLETE;
        }
        if (body.size() + chunk_size > max_body) {
            return ParseStatus::TOO_LARGE;
        }
        if (data.size() < pos + chunk_size + 2) {
            return ParseStatus::INCOMPLETE;
        }
        body.append(data, pos, chunk_size);
        pos += chunk_size + 2;
    }
}

ParseStatus parse_body(const std::string& data, const Head& head, size_t max_body, bool eof,
                       bool read_to_close, std::string& body) {
    if (is_chunked(head.headers)) {
        return decode_chunked(data, head.body_offset, max_body, body);
    }

    auto it = head.headers.find("Content-Length");
    if (it != head.headers.end()) {
        size_t length = 0;
        try {
            size_t consumed = 0;
            length = std::stoul(it->second, &consumed);
            if (consumed != it->second.size()) {
                return ParseStatus::INVALID;
            }
        } catch (const std::exception&) {
            return ParseStatus::INVALID;
        }
        if (length > max_body) {
            return ParseStatus::TOO_LARGE;
        }
        if (data.size() - head.body_offset < length) {
            return ParseStatus::INCOMPLETE;
        }
        body = data.substr(head.body_offset, length);
        return ParseStatus::COMPLETE;
    }

    if (!read_to_close) {
        body.clear();
        return ParseStatus::COMPLETE;
    }
    if (data.size() - head.body_offset > max_body) {
        return ParseStatus::TOO_LARGE;
    }
    if (!eof) {
        return ParseStatus::INCOMPLETE;
    }
    body = data.substr(head.body_offset);
    return ParseStatus::COMPLETE;
}

// Total message size when the head declares a plain Content-Length, else 0
size_t declared_message_size(const Head& head) {
    if (is_chunked(head.headers)) {
        return 0;
    }
    auto it = head.headers.find("Content-Length");
    if (it == head.headers.end()) {
        return 0;
    }
    try {
        return head.body_offset + std::stoul(it->second);
    } catch (const std::exception&) {
        return 0;
    }
}

void append_headers(std::ostringstream& out, const Headers& headers, size_t body_size) {
    bool has_length = false;
    for (const auto& [name, value] : headers) {
        if (iequals(name, "Content-Length")) {
            has_length = true;
        }
        out << name << ": " << value << "\r\n";
    }
    if (!has_length) {
        out << "Content-Length: " << body_size << "\r\n";
    }
    out << "\r\n";
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
    });
}

std::string Request::header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

std::string Response::header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

const char* to_string(ParseStatus status) {
    switch (status) {
        case ParseStatus::COMPLETE: return "complete";
        case ParseStatus::INCOMPLETE: return "incomplete";
        case ParseStatus::INVALID: return "invalid";
        case ParseStatus::TOO_LARGE: return "too large";
        case ParseStatus::TIMEOUT: return "timeout";
        case ParseStatus::CLOSED: return "closed";
    }
    return "unknown";
}

ParseStatus parse_request(const std::string& data, size_t max_body, Request& out) {
    Head head;
    ParseStatus status = parse_head(data, head);
    if (status != ParseStatus::COMPLETE) {
        return status;
    }

    std::istringstream start(head.start_line);
    std::string extra;
    if (!(start >> out.method >> out.target >> out.version) || (start >> extra)) {
        return ParseStatus::INVALID;
    }
    if (out.version.compare(0, 5, "HTTP/") != 0) {
        return ParseStatus::INVALID;
    }

    status = parse_body(data, head, max_body, false, false, out.body);
    if (status == ParseStatus::COMPLETE) {
        out.headers = std::move(head.headers);
    }
    return status;
}

ParseStatus parse_response(const std::string& data, bool eof, Response& out) {
    Head head;
    ParseStatus status = parse_head(data, head);
    if (status != ParseStatus::COMPLETE) {
        return status;
    }

    std::istringstream start(head.start_line);
    std::string code;
    if (!(start >> out.version >> code) || out.version.compare(0, 5, "HTTP/") != 0) {
        return ParseStatus::INVALID;
    }
    try {
        out.status = std::stoi(code);
    } catch (const std::exception&) {
        return ParseStatus::INVALID;
    }
    std::getline(start, out.reason);
    out.reason = trim(out.reason);

    const bool bodyless = out.status / 100 == 1 || out.status == 204 || out.status == 304;
    if (bodyless) {
        out.body.clear();
        out.headers = std::move(head.headers);
        return ParseStatus::COMPLETE;
    }

    status = parse_body(data, head, static_cast<size_t>(-1), eof, true, out.body);
    if (status == ParseStatus::COMPLETE) {
        out.headers = std::move(head.headers);
    }
    return status;
}

std::string serialize(const Request& request) {
    std::ostringstream out;
    out << request.method << ' ' << request.target << ' ' << request.version << "\r\n";
    append_headers(out, request.headers, request.body.size());
    out << request.body;
    return out.str();
}

std::string serialize(const Response& response) {
    std::ostringstream out;
    out << response.version << ' ' << response.status << ' '
        << (response.reason.empty() ? reason_phrase(response.status) : response.reason) << "\r\n";
    append_headers(out, response.headers, response.body.size());
    out << response.body;
    return out.str();
}

std::string reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 412: return "Precondition Failed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

Response make_response(int status) {
    Response response;
    response.status = status;
    response.reason = reason_phrase(status);
    response.headers["Connection"] = "close";
    return response;
}

bool send_all(int fd, const std::string& data, std::chrono::milliseconds timeout, std::string& error) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t sent = 0;
    while (sent < data.size()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            error = "send timed out";
            return false;
        }

        pollfd pfd{fd, POLLOUT, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = std::string("poll failed: ") + std::strerror(errno);
            return false;
        }
        if (ready == 0) {
            error = "send timed out";
            return false;
        }

        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            error = std::string("send failed: ") + std::strerror(errno);
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

namespace {

// Reads until `parse` reports something other than Incomplete. The head is
// located once; with a Content-Length body `parse` only runs again when the
// whole message has arrived.
template<typename Parse>
ParseStatus receive_until(int fd, std::chrono::milliseconds timeout, Parse parse) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string buffer;
    char chunk[kReadChunk];
    size_t scanned = 0;
    bool head_seen = false;
    size_t message_size = 0;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ParseStatus::TIMEOUT;
        }

        pollfd pfd{fd, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ParseStatus::CLOSED;
        }
        if (ready == 0) {
            return ParseStatus::TIMEOUT;
        }

        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return ParseStatus::CLOSED;
        }
        if (n == 0) {
            ParseStatus status = buffer.empty() ? ParseStatus::CLOSED : parse(buffer, true);
            return status == ParseStatus::INCOMPLETE ? ParseStatus::CLOSED : status;
        }

        buffer.append(chunk, static_cast<size_t>(n));
        if (!head_seen) {
            const size_t from = scanned > 3 ? scanned - 3 : 0;
            if (buffer.find("\r\n\r\n", from) == std::string::npos &&
                buffer.find("\n\n", from) == std::string::npos) {
                scanned = buffer.size();
                if (buffer.size() > kMaxHeadBytes) {
                    return ParseStatus::TOO_LARGE;
                }
                continue;
            }
            head_seen = true;
            Head head;
            if (parse_head(buffer, head) == ParseStatus::COMPLETE) {
                message_size = declared_message_size(head);
            }
        } else if (message_size > 0 && buffer.size() < message_size) {
            continue;
        }

        ParseStatus status = parse(buffer, false);
        if (status != ParseStatus::INCOMPLETE) {
            return status;
        }
    }
}

} // namespace

ParseStatus receive_request(int fd, size_t max_body, std::chrono::milliseconds timeout, Request& out) {
    return receive_until(fd, timeout, [&](const std::string& buffer, bool) {
        Request candidate;
        ParseStatus status = parse_request(buffer, max_body, candidate);
        if (status == ParseStatus::COMPLETE) {
            out = std::move(candidate);
        }
        return status;
    });
}

ParseStatus receive_response(int fd, std::chrono::milliseconds timeout, Response& out) {
    return receive_until(fd, timeout, [&](const std::string& buffer, bool eof) {
        Response candidate;
        ParseStatus status = parse_response(buffer, eof, candidate);
        if (status == ParseStatus::COMPLETE) {
            out = std::move(candidate);
        }
        return status;
    });
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace cadence::network::http
