#pragma once

#include <chrono>
#include <string>

#include "network_types.hpp"
#include "network/stream_errors.hpp"

namespace cadence::network {

// Lease token and duration granted by a device
struct LeaseGrant {
    std::string sid;
    std::chrono::seconds duration{0};
};

/**
 * Outbound lease requests against a device's event publisher.
 *
 * Each call is one bounded attempt; retry policy belongs to the caller.
 * Failures fill `error` (Network for I/O and timeouts, Subscription for a
 * non-2xx answer, with http_status set).
 */
class EventTransport {
public:
    virtual ~EventTransport() = default;

    virtual bool subscribe(const Endpoint& endpoint,
                           const std::string& event_path,
                           const std::string& callback_url,
                           std::chrono::seconds requested,
                           LeaseGrant& grant,
                           StreamError& error) = 0;

    virtual bool renew(const Endpoint& endpoint,
                       const std::string& event_path,
                       const std::string& sid,
                       std::chrono::seconds requested,
                       LeaseGrant& grant,
                       StreamError& error) = 0;

    virtual bool unsubscribe(const Endpoint& endpoint,
                             const std::string& event_path,
                             const std::string& sid,
                             StreamError& error) = 0;
};

/**
 * GENA over plain HTTP/1.1 on POSIX sockets. One connection per request;
 * connect, send and receive share a single per-attempt deadline.
 */
class HttpEventTransport : public EventTransport {
public:
    explicit HttpEventTransport(std::chrono::milliseconds request_timeout);

    bool subscribe(const Endpoint& endpoint,
                   const std::string& event_path,
                   const std::string& callback_url,
                   std::chrono::seconds requested,
                   LeaseGrant& grant,
                   StreamError& error) override;

    bool renew(const Endpoint& endpoint,
               const std::string& event_path,
               const std::string& sid,
               std::chrono::seconds requested,
               LeaseGrant& grant,
               StreamError& error) override;

    bool unsubscribe(const Endpoint& endpoint,
                     const std::string& event_path,
                     const std::string& sid,
                     StreamError& error) override;

    std::chrono::milliseconds request_timeout() const { return request_timeout_; }

private:
    std::chrono::milliseconds request_timeout_;
};

/**
 * Parses a GENA TIMEOUT header ("Second-1800", "Second-infinite").
 * Infinite, missing or malformed values fall back to `requested`, and
 * grants longer than `requested` are capped to it.
 */
std::chrono::seconds parse_timeout_header(const std::string& value, std::chrono::seconds requested);

} // namespace cadence::network
