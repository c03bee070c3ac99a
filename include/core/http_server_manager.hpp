#pragma once

#include <httplib.h>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "logging/logger.hpp"

/**
 * @brief Owns the cpp-httplib server and the thread it listens on.
 *
 * start() binds synchronously, so a taken port is reported to the caller
 * instead of surfacing later on the listener thread.
 */
class HttpServerManager
{
public:
    static HttpServerManager &getInstance();

    using RouteSetupCallback = std::function<void(httplib::Server &)>;
    void setRouteSetupCallback(RouteSetupCallback callback);

    // Worker threads for request handling; takes effect on the next start()
    void setThreadCount(size_t threads);

    /**
     * @brief Bind and start listening. Port 0 binds an ephemeral port.
     * @return false if the address cannot be bound
     */
    bool start(const std::string &host, int port);
    void stop();
    bool isRunning() const;

    std::string getCurrentHost() const;
    // Actual bound port, also when started with port 0
    int getCurrentPort() const;

private:
    HttpServerManager();
    ~HttpServerManager();
    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    void serverThread();
    void stopLocked();

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    std::string current_host_;
    int current_port_;
    size_t thread_count_;

    RouteSetupCallback route_setup_callback_;

    mutable std::mutex server_mutex_;
    mutable std::mutex config_mutex_;
};
