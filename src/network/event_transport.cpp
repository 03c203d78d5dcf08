#include "network/event_transport.hpp"
#include "http_message.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace cadence::network {

namespace {

constexpr const char* kUserAgent = "Linux UPnP/1.0 cadence/1.0";

class ScopedSocket {
public:
    ScopedSocket() = default;
    ~ScopedSocket() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    void reset(int fd) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }
    int get() const { return fd_; }

private:
    int fd_ = -1;
};

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

// Non-blocking connect bounded by the deadline; leaves the socket non-blocking.
bool connect_with_deadline(const Endpoint& endpoint, std::chrono::steady_clock::time_point deadline,
                           ScopedSocket& sock, StreamError& error) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const std::string port = std::to_string(endpoint.port);
    int rc = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0 || !result) {
        error = StreamError(ErrorKind::NETWORK, "cannot resolve " + endpoint.host + ": " + gai_strerror(rc));
        return false;
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addresses(result, &freeaddrinfo);

    for (addrinfo* ai = addresses.get(); ai; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        sock.reset(fd);

        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            continue;
        }

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            return true;
        }
        if (errno != EINPROGRESS) {
            error = StreamError(ErrorKind::NETWORK,
                                "connect to " + endpoint.toString() + " failed: " + std::strerror(errno));
            continue;
        }

        pollfd pfd{fd, POLLOUT, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining_until(deadline).count()));
        if (ready <= 0) {
            error = StreamError(ErrorKind::NETWORK, "connect to " + endpoint.toString() + " timed out");
            continue;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            error = StreamError(ErrorKind::NETWORK, "connect to " + endpoint.toString() + " failed: " +
                                                        std::strerror(so_error ? so_error : errno));
            continue;
        }
        return true;
    }

    sock.reset(-1);
    if (error.kind == ErrorKind::NONE) {
        error = StreamError(ErrorKind::NETWORK, "no usable address for " + endpoint.toString());
    }
    return false;
}

bool exchange(const Endpoint& endpoint, const http::Request& request, std::chrono::milliseconds timeout,
              http::Response& response, StreamError& error) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    ScopedSocket sock;
    if (!connect_with_deadline(endpoint, deadline, sock, error)) {
        return false;
    }

    std::string send_error;
    if (!http::send_all(sock.get(), http::serialize(request), remaining_until(deadline), send_error)) {
        error = StreamError(ErrorKind::NETWORK, request.method + " " + endpoint.toString() + ": " + send_error);
        return false;
    }

    http::ParseStatus status = http::receive_response(sock.get(), remaining_until(deadline), response);
    if (status != http::ParseStatus::COMPLETE) {
        error = StreamError(ErrorKind::NETWORK, request.method + " " + endpoint.toString() +
                                                    ": response " + http::to_string(status));
        return false;
    }
    return true;
}

http::Request base_request(const std::string& method, const Endpoint& endpoint, const std::string& path) {
    http::Request request;
    request.method = method;
    request.target = path;
    request.headers["HOST"] = endpoint.toString();
    request.headers["USER-AGENT"] = kUserAgent;
    request.headers["Connection"] = "close";
    return request;
}

bool read_grant(const http::Response& response, std::chrono::seconds requested, LeaseGrant& grant,
                StreamError& error) {
    grant.sid = http::trim(response.header("SID"));
    if (grant.sid.empty()) {
        error = StreamError(ErrorKind::SUBSCRIPTION, "response carries no SID", response.status);
        return false;
    }
    grant.duration = parse_timeout_header(response.header("TIMEOUT"), requested);
    return true;
}

bool check_status(const std::string& what, const Endpoint& endpoint, const http::Response& response,
                  StreamError& error) {
    if (response.status >= 200 && response.status < 300) {
        return true;
    }
    error = StreamError(ErrorKind::SUBSCRIPTION,
                        what + " " + endpoint.toString() + " answered HTTP " + std::to_string(response.status) +
                            " " + response.reason,
                        response.status);
    return false;
}

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

std::chrono::seconds parse_timeout_header(const std::string& value, std::chrono::seconds requested) {
    std::string lower = http::trim(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::string prefix = "second-";
    if (lower.compare(0, prefix.size(), prefix) != 0) {
        return requested;
    }
    std::string amount = lower.substr(prefix.size());
    if (amount == "infinite") {
        return requested;
    }
    try {
        size_t consumed = 0;
        long long seconds = std::stoll(amount, &consumed);
        if (consumed != amount.size() || seconds <= 0) {
            return requested;
        }
        // Longer grants than asked for are renewed on our own schedule
        return std::min(std::chrono::seconds(seconds), requested);
    } catch (const std::exception&) {
        return requested;
    }
}

HttpEventTransport::HttpEventTransport(std::chrono::milliseconds request_timeout)
    : request_timeout_(request_timeout) {
    if (request_timeout_.count() <= 0) {
        throw std::invalid_argument("HttpEventTransport: request timeout must be positive");
    }
}

bool HttpEventTransport::subscribe(const Endpoint& endpoint,
                                   const std::string& event_path,
                                   const std::string& callback_url,
                                   std::chrono::seconds requested,
                                   LeaseGrant& grant,
                                   StreamError& error) {
    auto started = std::chrono::steady_clock::now();
    http::Request request = base_request("SUBSCRIBE", endpoint, event_path);
    request.headers["CALLBACK"] = "<" + callback_url + ">";
    request.headers["NT"] = "upnp:event";
    request.headers["TIMEOUT"] = "Second-" + std::to_string(requested.count());

    http::Response response;
    bool ok = exchange(endpoint, request, request_timeout_, response, error) &&
              check_status("SUBSCRIBE", endpoint, response, error) &&
              read_grant(response, requested, grant, error);

    LOG_LATENCY("SUBSCRIBE", elapsed_ms(started));
    Logger::updatePerformanceMetrics("gena.subscribe", elapsed_ms(started), ok);
    if (ok) {
        Logger::debug("HttpEventTransport: SUBSCRIBE {}{} granted {} for {}s",
                      endpoint.toString(), event_path, grant.sid, grant.duration.count());
    }
    return ok;
}

bool HttpEventTransport::renew(const Endpoint& endpoint,
                               const std::string& event_path,
                               const std::string& sid,
                               std::chrono::seconds requested,
                               LeaseGrant& grant,
                               StreamError& error) {
    auto started = std::chrono::steady_clock::now();
    http::Request request = base_request("SUBSCRIBE", endpoint, event_path);
    request.headers["SID"] = sid;
    request.headers["TIMEOUT"] = "Second-" + std::to_string(requested.count());

    http::Response response;
    bool ok = exchange(endpoint, request, request_timeout_, response, error) &&
              check_status("renewal", endpoint, response, error);
    if (ok) {
        // Some publishers omit SID on renewal; the lease keeps its token then.
        grant.sid = http::trim(response.header("SID"));
        if (grant.sid.empty()) {
            grant.sid = sid;
        }
        grant.duration = parse_timeout_header(response.header("TIMEOUT"), requested);
    }

    LOG_LATENCY("RENEW", elapsed_ms(started));
    Logger::updatePerformanceMetrics("gena.renew", elapsed_ms(started), ok);
    return ok;
}

bool HttpEventTransport::unsubscribe(const Endpoint& endpoint,
                                     const std::string& event_path,
                                     const std::string& sid,
                                     StreamError& error) {
    auto started = std::chrono::steady_clock::now();
    http::Request request = base_request("UNSUBSCRIBE", endpoint, event_path);
    request.headers["SID"] = sid;

    http::Response response;
    bool ok = exchange(endpoint, request, request_timeout_, response, error) &&
              check_status("UNSUBSCRIBE", endpoint, response, error);

    LOG_LATENCY("UNSUBSCRIBE", elapsed_ms(started));
    Logger::updatePerformanceMetrics("gena.unsubscribe", elapsed_ms(started), ok);
    return ok;
}

} // namespace cadence::network
