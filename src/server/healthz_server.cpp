/*******************************************************************************
    Project: Volcano Controller Manager

    File: healthz_server.cpp

    Description:
        Blocking accept loop behind the health endpoint. One request is read
        per connection and answered with a fixed 200 "ok" response.
*******************************************************************************/

#include "server/healthz_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace volcano {

namespace {

const char kHealthzResponse[] =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: text/plain; charset=utf-8\r\n"
    "Content-Length: 2\r\n"
    "Connection: close\r\n"
    "\r\n"
    "ok";

// Bounds how long stop() waits on the accept thread.
constexpr int kAcceptPollMs = 100;
constexpr int kClientTimeoutMs = 1000;

void set_socket_timeouts(int socket_fd, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(socket_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(socket_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // anonymous namespace

bool parse_bind_address(const std::string& address, std::string& host, uint16_t& port) {
    size_t colon = address.rfind(':');
    if (colon == std::string::npos) {
        return false;
    }

    std::string port_text = address.substr(colon + 1);
    if (port_text.empty() || port_text.find_first_not_of("0123456789") != std::string::npos ||
        port_text.size() > 5) {
        return false;
    }
    int value = std::stoi(port_text);
    if (value > 65535) {
        return false;
    }

    host = address.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

HealthzServer::HealthzServer(const std::string& bind_address, std::shared_ptr<Logger> logger)
    : bind_address_(bind_address),
      logger_(logger->with_component("healthz")),
      server_socket_(-1),
      port_(0),
      running_(false) {
}

HealthzServer::~HealthzServer() {
    stop();
}

bool HealthzServer::start() {
    if (running_) {
        return true;
    }
    if (!setup_server_socket()) {
        return false;
    }

    running_ = true;
    accept_thread_ = std::thread(&HealthzServer::accept_loop, this, server_socket_);
    logger_->info("serving health checks on " + bind_address_ +
                  " (port " + std::to_string(port_) + ")");
    return true;
}

void HealthzServer::stop() {
    if (!running_) return;
    running_ = false;

    // The accept thread polls running_, so the socket is closed only after
    // it has exited.
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    close(server_socket_);
    server_socket_ = -1;
    logger_->info("health endpoint stopped");
}

bool HealthzServer::setup_server_socket() {
    std::string host;
    uint16_t port = 0;
    if (!parse_bind_address(bind_address_, host, port)) {
        logger_->error("invalid bind address \"" + bind_address_ + "\"");
        return false;
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        address.sin_addr.s_addr = INADDR_ANY;
    } else if (host == "localhost") {
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    } else if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
        logger_->error("invalid bind host \"" + host + "\"");
        return false;
    }

    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        logger_->error("failed to create socket: " + std::string(strerror(errno)));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        logger_->warning("failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
    }

    if (bind(server_socket_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        logger_->error("failed to bind " + bind_address_ + ": " + strerror(errno));
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 16) < 0) {
        logger_->error("failed to listen: " + std::string(strerror(errno)));
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    socklen_t len = sizeof(address);
    if (getsockname(server_socket_, (struct sockaddr*)&address, &len) == 0) {
        port_ = ntohs(address.sin_port);
    } else {
        port_ = port;
    }
    return true;
}

void HealthzServer::accept_loop(int listen_socket) {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = listen_socket;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger_->warning("poll failed: " + std::string(strerror(errno)));
            continue;
        }
        if (ready == 0) {
            continue;
        }

        struct sockaddr_in client_address;
        socklen_t client_len = sizeof(client_address);
        int client_socket = accept(listen_socket, (struct sockaddr*)&client_address, &client_len);
        if (client_socket < 0) {
            if (!running_) break;
            if (errno == EINTR) continue;
            logger_->warning("accept failed: " + std::string(strerror(errno)));
            continue;
        }
        // An idle client must not hold up later checks or shutdown.
        set_socket_timeouts(client_socket, kClientTimeoutMs);
        handle_connection(client_socket);
    }
}

void HealthzServer::handle_connection(int client_socket) {
    char buffer[1024];
    // Drain what the client sent so close() does not reset the connection.
    ssize_t received = recv(client_socket, buffer, sizeof(buffer), 0);
    if (received < 0) {
        logger_->debug("recv failed: " + std::string(strerror(errno)));
    }

    size_t total = sizeof(kHealthzResponse) - 1;
    size_t sent = 0;
    while (sent < total) {
        ssize_t n = send(client_socket, kHealthzResponse + sent, total - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            logger_->debug("send failed: " + std::string(strerror(errno)));
            break;
        }
        sent += static_cast<size_t>(n);
    }
    close(client_socket);
}

} // namespace volcano
