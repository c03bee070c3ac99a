#include "core/http_server_manager.hpp"
#include <chrono>

HttpServerManager::HttpServerManager() : current_host_("0.0.0.0"), current_port_(5000), thread_count_(8)
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

HttpServerManager &HttpServerManager::getInstance()
{
    static HttpServerManager instance;
    return instance;
}

void HttpServerManager::setRouteSetupCallback(RouteSetupCallback callback)
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    route_setup_callback_ = std::move(callback);
}

void HttpServerManager::setThreadCount(size_t threads)
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    thread_count_ = threads == 0 ? 1 : threads;
}

bool HttpServerManager::start(const std::string &host, int port)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running. Stopping current instance first.");
        stopLocked();
    }

    size_t threads;
    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        threads = thread_count_;
    }

    server_ = std::make_unique<httplib::Server>();
    server_->new_task_queue = [threads]
    { return new httplib::ThreadPool(threads); };

    if (route_setup_callback_)
    {
        route_setup_callback_(*server_);
    }
    else
    {
        Logger::warn("HttpServerManager: no routes configured");
    }

    int bound_port = port;
    if (port == 0)
    {
        bound_port = server_->bind_to_any_port(host);
    }
    else if (!server_->bind_to_port(host, port))
    {
        bound_port = -1;
    }
    if (bound_port <= 0)
    {
        Logger::error("HttpServerManager: Failed to bind " + host + ":" + std::to_string(port));
        server_.reset();
        return false;
    }

    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        current_host_ = host;
        current_port_ = bound_port;
    }

    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this);

    Logger::info("HttpServerManager: Server started on " + host + ":" + std::to_string(bound_port) +
                 " with " + std::to_string(threads) + " worker threads");
    return true;
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    stopLocked();
}

void HttpServerManager::stopLocked()
{
    if (!server_)
    {
        return;
    }

    // stop() is a no-op until the listener loop is up
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (running_.load() && !server_->is_running() && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    running_.store(false);
    server_->stop();
    if (server_thread_.joinable())
    {
        server_thread_.join();
    }
    server_.reset();

    Logger::info("HttpServerManager: Server stopped");
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

std::string HttpServerManager::getCurrentHost() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_host_;
}

int HttpServerManager::getCurrentPort() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_port_;
}

void HttpServerManager::serverThread()
{
    try
    {
        if (!server_->listen_after_bind())
        {
            Logger::error("HttpServerManager: listener on port " + std::to_string(getCurrentPort()) + " exited with an error");
        }
        Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
    }
    running_.store(false);
}
