#include "core/capability_registry.hpp"
#include "core/http_server_manager.hpp"
#include "core/poco_config_manager.hpp"
#include "core/request_dispatcher.hpp"
#include "core/response_envelope.hpp"
#include "core/shutdown_manager.hpp"
#include "core/staging_area_manager.hpp"
#include "handlers/capability_catalog.hpp"
#include "logging/logger.hpp"
#include "tools/external_tools.hpp"
#include "web/route_handlers.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

static void printUsage(const char *program)
{
    std::cout << "File Gateway - unified file processing service" << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config, -c <path>   Configuration file (default: config/config.json)" << std::endl;
    std::cout << "  --help, -h            Show this help message" << std::endl;
}

int main(int argc, char *argv[])
{
    std::string config_path = "config/config.json";
    bool config_explicit = false;
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
            config_explicit = true;
        }
        else
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    // Logging first, at the default level, so config problems are visible
    Logger::init("INFO");
    ShutdownManager::getInstance().installSignalHandlers();

    auto &config = PocoConfigManager::getInstance();
    if (std::filesystem::exists(config_path))
    {
        if (!config.load(config_path))
        {
            Logger::error("Failed to load configuration from " + config_path);
            return 1;
        }
    }
    else if (config_explicit)
    {
        Logger::error("Configuration file not found: " + config_path);
        return 1;
    }
    else
    {
        Logger::info("No configuration file at " + config_path + ", using defaults");
    }
    config.applyEnvironmentOverrides();

    if (!config.validateConfig())
    {
        Logger::error("Invalid configuration, refusing to start");
        return 1;
    }
    Logger::setLevel(config.getLogLevel());
    Logger::info("Starting file gateway (PID: " + std::to_string(getpid()) + ", environment: " +
                 config.getEnvironment() + ")");

    StagingOptions staging_options;
    staging_options.root = config.getStagingRoot();
    staging_options.stale_age_seconds = config.getStagingStaleAgeSeconds();
    staging_options.release_grace_ms = config.getStagingReleaseGraceMs();
    staging_options.min_free_bytes = config.getStagingMinFreeBytes();

    std::unique_ptr<StagingAreaManager> staging;
    try
    {
        staging = std::make_unique<StagingAreaManager>(staging_options);
    }
    catch (const std::exception &e)
    {
        Logger::error("Cannot initialize staging area: " + std::string(e.what()));
        return 1;
    }
    size_t swept = staging->sweepStale();
    if (swept > 0)
    {
        Logger::info("Removed " + std::to_string(swept) + " stale staging directories");
    }

    ExternalTools::getInstance().discover();

    CapabilityRegistry registry;
    try
    {
        CapabilityCatalog::registerAll(registry);
        registry.freeze();
    }
    catch (const std::exception &e)
    {
        Logger::error("Capability registration failed: " + std::string(e.what()));
        return 1;
    }

    DispatcherOptions dispatcher_options;
    dispatcher_options.max_upload_bytes = config.getMaxUploadBytes();
    dispatcher_options.handler_timeout = std::chrono::seconds(config.getHandlerTimeoutSeconds());
    dispatcher_options.max_handler_threads = static_cast<size_t>(config.getMaxHandlerThreads());
    RequestDispatcher dispatcher(registry, *staging, dispatcher_options);

    GatewayContext context{registry,
                           dispatcher,
                           *staging,
                           ResponseEnvelopeBuilder(!config.isProduction()),
                           config.getAllowedOrigin(),
                           "File Gateway",
                           static_cast<size_t>(config.getMaxUploadBytes())};

    auto &server = HttpServerManager::getInstance();
    server.setThreadCount(static_cast<size_t>(config.getHttpServerThreads()));
    server.setRouteSetupCallback([&context](httplib::Server &svr)
                                 { RouteHandlers::setupRoutes(svr, context); });

    if (!server.start(config.getServerHost(), config.getServerPort()))
    {
        return 1;
    }
    std::cout << "Server listening on http://" << server.getCurrentHost() << ":" << server.getCurrentPort() << std::endl;

    ShutdownManager::getInstance().waitForShutdown();

    Logger::info("Shutting down: " + ShutdownManager::getInstance().getReason());
    server.stop();

    // Handlers abandoned after a timeout may still be running
    if (!dispatcher.waitForHandlers(std::chrono::seconds(config.getShutdownDrainSeconds())))
    {
        Logger::warn("Exiting with " + std::to_string(dispatcher.runningHandlers()) + " handler threads still running");
        Logger::info("File gateway stopped");
        Logger::flush();
        // Skip static destruction, the remaining threads still use the singletons
        std::_Exit(0);
    }
    Logger::info("File gateway stopped");
    return 0;
}
