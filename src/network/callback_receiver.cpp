#include "network/callback_receiver.hpp"
#include "network/stream_errors.hpp"
#include "http_message.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace cadence::network {

namespace {

constexpr int kListenBacklog = 64;
constexpr int kAcceptPollMs = 200;
constexpr size_t kMaxPendingConnections = 256;

void write_status(int fd, int status, std::chrono::milliseconds timeout) {
    std::string error;
    if (!http::send_all(fd, http::serialize(http::make_response(status)), timeout, error)) {
        Logger::debug("CallbackReceiver: could not answer {}: {}", status, error);
    }
}

std::string path_of(const std::string& target) {
    auto query = target.find('?');
    return query == std::string::npos ? target : target.substr(0, query);
}

bool parse_seq(const std::string& text, uint32_t& seq) {
    std::string value = http::trim(text);
    if (value.empty() || value.size() > 10) {
        return false;
    }
    for (char c : value) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    unsigned long long number = std::stoull(value);
    if (number > 0xFFFFFFFFull) {
        return false;
    }
    seq = static_cast<uint32_t>(number);
    return true;
}

} // namespace

CallbackReceiver::CallbackReceiver(const Config& config, LeaseValidator validator, NotificationSink sink)
    : config_(config), validator_(std::move(validator)), sink_(std::move(sink)) {
    if (!validator_ || !sink_) {
        throw std::invalid_argument("CallbackReceiver: validator and sink are required");
    }
    if (config_.port_start > config_.port_end || config_.port_start == 0) {
        throw ConfigurationError("CallbackReceiver: invalid port range " + std::to_string(config_.port_start) +
                                 ".." + std::to_string(config_.port_end));
    }
    if (config_.handler_threads == 0) {
        config_.handler_threads = 1;
    }
}

CallbackReceiver::~CallbackReceiver() {
    stop();
}

void CallbackReceiver::set_warning_callback(WarningCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    warning_callback_ = std::move(callback);
}

void CallbackReceiver::start() {
    if (running_.load()) {
        Logger::warn("CallbackReceiver: already running on port {}", port_);
        return;
    }

    int bound_fd = -1;
    uint16_t bound_port = 0;
    for (uint32_t candidate = config_.port_start; candidate <= config_.port_end; ++candidate) {
        int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            throw InitializationFailed(std::string("CallbackReceiver: socket() failed: ") + std::strerror(errno));
        }

        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(candidate));

        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 && listen(fd, kListenBacklog) == 0) {
            bound_fd = fd;
            bound_port = static_cast<uint16_t>(candidate);
            break;
        }
        Logger::trace("CallbackReceiver: port {} unavailable: {}", candidate, std::strerror(errno));
        close(fd);
    }

    if (bound_fd < 0) {
        throw InitializationFailed("CallbackReceiver: no free port in range " + std::to_string(config_.port_start) +
                                   ".." + std::to_string(config_.port_end));
    }

    listen_fd_ = bound_fd;
    port_ = bound_port;

    if (!config_.host.empty()) {
        host_ = config_.host;
        fallback_address_ = false;
    } else {
        host_ = detect_local_address(fallback_address_);
    }

    running_.store(true);
    accept_thread_ = std::thread(&CallbackReceiver::accept_loop, this);
    for (uint32_t i = 0; i < config_.handler_threads; ++i) {
        handler_threads_.emplace_back(&CallbackReceiver::handler_loop, this);
    }

    Logger::info("CallbackReceiver: listening on port {}, callback URL {}", port_, callback_url());
    if (fallback_address_) {
        emit_warning("no non-loopback address found, callback URL uses " + host_ +
                     "; devices on other hosts cannot deliver events");
    }
}

void CallbackReceiver::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    Logger::info("CallbackReceiver: stopping");

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }

    {
        // Handlers check running_ under this mutex before waiting
        std::lock_guard<std::mutex> lock(pending_mutex_);
    }
    pending_cv_.notify_all();
    for (auto& thread : handler_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    handler_threads_.clear();

    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (const auto& connection : pending_) {
        close(connection.fd);
    }
    pending_.clear();

    Logger::info("CallbackReceiver: stopped");
}

std::string CallbackReceiver::callback_url() const {
    return "http://" + host_ + ":" + std::to_string(port_) + config_.path;
}

CallbackReceiver::Statistics CallbackReceiver::get_statistics() const {
    Statistics stats;
    stats.connections = connections_.load();
    stats.accepted = accepted_.load();
    stats.rejected = rejected_.load();
    stats.malformed = malformed_.load();
    return stats;
}

std::string CallbackReceiver::detect_local_address(bool& fallback) {
    ifaddrs* interfaces = nullptr;
    std::string address;

    if (getifaddrs(&interfaces) == 0) {
        for (ifaddrs* ifa = interfaces; ifa; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
                continue;
            }
            char buffer[INET_ADDRSTRLEN] = {0};
            auto* in = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
            if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)) != nullptr) {
                address = buffer;
                break;
            }
        }
        freeifaddrs(interfaces);
    } else {
        Logger::warn("CallbackReceiver: getifaddrs failed: {}", std::strerror(errno));
    }

    fallback = address.empty();
    return fallback ? std::string("127.0.0.1") : address;
}

void CallbackReceiver::accept_loop() {
    Logger::debug("CallbackReceiver: accept thread started");

    while (running_.load()) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, kAcceptPollMs);
        if (ready <= 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        sockaddr_in client{};
        socklen_t length = sizeof(client);
        int client_fd = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client), &length, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                Logger::debug("CallbackReceiver: accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        char buffer[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client.sin_addr, buffer, sizeof(buffer));
        connections_.fetch_add(1);

        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            if (pending_.size() >= kMaxPendingConnections) {
                write_status(client_fd, 503, config_.read_timeout);
                close(client_fd);
                continue;
            }
            pending_.push_back({client_fd, buffer});
        }
        pending_cv_.notify_one();
    }

    Logger::debug("CallbackReceiver: accept thread stopped");
}

void CallbackReceiver::handler_loop() {
    while (true) {
        PendingConnection connection;
        {
            std::unique_lock<std::mutex> lock(pending_mutex_);
            pending_cv_.wait(lock, [this] { return !running_.load() || !pending_.empty(); });
            if (!running_.load()) {
                return;
            }
            connection = std::move(pending_.front());
            pending_.pop_front();
        }

        try {
            handle_connection(connection.fd, connection.remote);
        } catch (const std::exception& e) {
            Logger::error("CallbackReceiver: handler error from {}: {}", connection.remote, e.what());
        }
        close(connection.fd);
    }
}

void CallbackReceiver::handle_connection(int client_fd, const std::string& remote) {
    http::Request request;
    http::ParseStatus status =
        http::receive_request(client_fd, config_.max_body_bytes, config_.read_timeout, request);

    switch (status) {
        case http::ParseStatus::COMPLETE:
            break;
        case http::ParseStatus::TOO_LARGE:
            malformed_.fetch_add(1);
            Logger::warn("CallbackReceiver: notification from {} exceeds {} bytes", remote, config_.max_body_bytes);
            write_status(client_fd, 413, config_.read_timeout);
            return;
        case http::ParseStatus::TIMEOUT:
            malformed_.fetch_add(1);
            write_status(client_fd, 408, config_.read_timeout);
            return;
        case http::ParseStatus::CLOSED:
            return;
        default:
            malformed_.fetch_add(1);
            Logger::debug("CallbackReceiver: unreadable request from {}: {}", remote, http::to_string(status));
            write_status(client_fd, 400, config_.read_timeout);
            return;
    }

    if (request.method != "NOTIFY") {
        write_status(client_fd, 405, config_.read_timeout);
        return;
    }
    if (path_of(request.target) != config_.path) {
        write_status(client_fd, 404, config_.read_timeout);
        return;
    }

    if (!request.has_header("SID") || !request.has_header("NT") || !request.has_header("NTS") ||
        !request.has_header("SEQ")) {
        malformed_.fetch_add(1);
        Logger::debug("CallbackReceiver: NOTIFY from {} is missing GENA headers", remote);
        write_status(client_fd, 400, config_.read_timeout);
        return;
    }

    RawNotification notification;
    if (!parse_seq(request.header("SEQ"), notification.seq)) {
        malformed_.fetch_add(1);
        write_status(client_fd, 400, config_.read_timeout);
        return;
    }

    if (http::trim(request.header("NT")) != "upnp:event" ||
        http::trim(request.header("NTS")) != "upnp:propchange") {
        rejected_.fetch_add(1);
        write_status(client_fd, 412, config_.read_timeout);
        return;
    }

    notification.sid = http::trim(request.header("SID"));
    if (!validator_(notification.sid)) {
        rejected_.fetch_add(1);
        Logger::debug("CallbackReceiver: rejecting NOTIFY from {} for unknown lease {}", remote, notification.sid);
        write_status(client_fd, 412, config_.read_timeout);
        return;
    }

    notification.body = std::move(request.body);
    notification.received_at = SystemClock::now();
    notification.remote_address = remote;
    sink_(std::move(notification));
    accepted_.fetch_add(1);

    write_status(client_fd, 200, config_.read_timeout);
}

void CallbackReceiver::emit_warning(const std::string& message) {
    Logger::warn("CallbackReceiver: {}", message);
    WarningCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = warning_callback_;
    }
    if (callback) {
        callback(message);
    }
}

} // namespace cadence::network
