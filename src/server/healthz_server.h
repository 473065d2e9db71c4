/*******************************************************************************
    Project: Volcano Controller Manager

    File: healthz_server.h

    Description:
        Minimal liveness endpoint. Binds "host:port", answers every
        connection with "HTTP/1.1 200 OK" and body "ok", then closes it.
        Requests are not parsed.

        Port 0 binds an ephemeral port; port() reports the one chosen.
*******************************************************************************/

#ifndef HEALTHZ_SERVER_H
#define HEALTHZ_SERVER_H

#include "common/logger.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace volcano {

class HealthzServer {
private:
    std::string bind_address_;
    std::shared_ptr<Logger> logger_;

    int server_socket_;
    uint16_t port_;
    std::atomic<bool> running_;
    std::thread accept_thread_;

    bool setup_server_socket();
    void accept_loop(int listen_socket);
    void handle_connection(int client_socket);

public:
    HealthzServer(const std::string& bind_address, std::shared_ptr<Logger> logger);
    ~HealthzServer();

    HealthzServer(const HealthzServer&) = delete;
    HealthzServer& operator=(const HealthzServer&) = delete;

    // Returns false (and logs why) if the address is invalid or cannot be bound.
    bool start();
    void stop();

    bool is_running() const { return running_; }
    uint16_t port() const { return port_; }
};

// Splits "host:port". An empty host or "0.0.0.0" means every interface.
bool parse_bind_address(const std::string& address, std::string& host, uint16_t& port);

} // namespace volcano

#endif // HEALTHZ_SERVER_H
