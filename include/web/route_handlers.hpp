#pragma once

#include "core/capability_registry.hpp"
#include "core/request_dispatcher.hpp"
#include "core/response_envelope.hpp"
#include "core/staging_area_manager.hpp"
#include "logging/logger.hpp"
#include "tools/external_tools.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <exception>
#include <map>
#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * @brief Objects the routes dispatch into. Must outlive the server.
 */
struct GatewayContext
{
    const CapabilityRegistry &registry;
    const RequestDispatcher &dispatcher;
    const StagingAreaManager &staging;
    ResponseEnvelopeBuilder envelopes;
    std::string allowed_origin;
    std::string service_name;
    size_t max_body_bytes;
};

class RouteHandlers
{
public:
    static constexpr const char *API_VERSION = "2.0";

    static void setupRoutes(httplib::Server &svr, const GatewayContext &ctx)
    {
        // Multipart overhead on top of the upload limit
        svr.set_payload_max_length(ctx.max_body_bytes + 1024 * 1024);

        svr.set_post_routing_handler([&ctx](const httplib::Request &, httplib::Response &res)
                                     { applyCors(res, ctx.allowed_origin); });

        svr.Options(R"(.*)", [](const httplib::Request &, httplib::Response &res)
                    { res.set_content(json{{"status", "ok"}}.dump(), "application/json"); });

        svr.Get("/", [&ctx](const httplib::Request &req, httplib::Response &res)
                { handleIndex(req, res, ctx); });

        svr.Get("/health", [&ctx](const httplib::Request &req, httplib::Response &res)
                { handleHealth(req, res, ctx); });

        svr.Get("/status", [&ctx](const httplib::Request &req, httplib::Response &res)
                { handleToolStatus(req, res, ctx); });

        // One POST route per capability alias, plus the generic /process/<key>
        for (const CapabilityDescriptor *descriptor : ctx.registry.list())
        {
            const std::string key = descriptor->key;
            for (const auto &alias : descriptor->aliases)
            {
                svr.Post("/" + alias, [&ctx, key](const httplib::Request &req, httplib::Response &res)
                         { handleDispatch(req, res, ctx, key); });
            }
        }
        svr.Post(R"(/process/([A-Za-z0-9._-]+))", [&ctx](const httplib::Request &req, httplib::Response &res)
                 { handleDispatch(req, res, ctx, req.matches[1]); });

        svr.set_error_handler([&ctx](const httplib::Request &req, httplib::Response &res)
                              { handleError(req, res, ctx); });

        svr.set_exception_handler([&ctx](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                  { handleException(req, res, ctx, ep); });

        Logger::info("RouteHandlers: " + std::to_string(ctx.registry.size()) + " capabilities routed");
    }

    /**
     * @brief Split a request body into uploads (parts named "file" or
     * "files") and options (every other field, form, query or the members
     * of a JSON object body).
     * @return false if a JSON body is not an object
     */
    static bool collectInputs(const httplib::Request &req, std::vector<UploadedArtifact> &uploads, json &options)
    {
        options = json::object();
        for (const auto &param : req.params)
        {
            options[param.first] = param.second;
        }

        if (!req.is_multipart_form_data() && !req.body.empty() &&
            req.get_header_value("Content-Type").rfind("application/json", 0) == 0)
        {
            json body = json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_object())
            {
                return false;
            }
            for (auto it = body.begin(); it != body.end(); ++it)
            {
                options[it.key()] = it.value();
            }
        }

        for (const auto &part : req.files)
        {
            const httplib::MultipartFormData &field = part.second;
            if (field.name == "file" || field.name == "files")
            {
                // An empty file input in a browser form arrives with no filename and no content
                if (field.filename.empty() && field.content.empty())
                    continue;
                uploads.push_back({field.filename, field.content_type, field.content});
            }
            else if (field.filename.empty())
            {
                options[field.name] = field.content;
            }
        }
        return true;
    }

    static void applyCors(httplib::Response &res, const std::string &allowed_origin)
    {
        res.set_header("Access-Control-Allow-Origin", allowed_origin);
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        res.set_header("Access-Control-Expose-Headers", "Content-Disposition, X-Final-Size, X-Returned, X-Method");
        if (allowed_origin != "*")
        {
            res.set_header("Vary", "Origin");
        }
    }

    static void sendEnvelope(httplib::Response &res, const ResponseEnvelope &envelope)
    {
        res.status = envelope.status;
        for (const auto &header : envelope.headers)
        {
            res.set_header(header.first, header.second);
        }
        res.set_content(envelope.body, envelope.content_type);
    }

private:
    static void handleDispatch(const httplib::Request &req, httplib::Response &res, const GatewayContext &ctx,
                               const std::string &key)
    {
        Logger::trace("Received " + req.method + " " + req.path);
        std::vector<UploadedArtifact> uploads;
        json options;
        if (!collectInputs(req, uploads, options))
        {
            sendEnvelope(res, ctx.envelopes.buildFailure(FailureKind::InvalidInput, "Request body must be a JSON object"));
            return;
        }

        ProcessingOutcome outcome = ctx.dispatcher.dispatch(key, uploads, options);
        sendEnvelope(res, ctx.envelopes.build(outcome));
    }

    static void handleIndex(const httplib::Request &, httplib::Response &res, const GatewayContext &ctx)
    {
        json endpoints = {{"image", json::array()},
                          {"video", json::array()},
                          {"audio", json::array()},
                          {"pdf", json::array()},
                          {"conversion", json::array()}};
        for (const CapabilityDescriptor *descriptor : ctx.registry.list())
        {
            json &group = endpoints[descriptor->group];
            if (!group.is_array())
                group = json::array();
            for (const auto &alias : descriptor->aliases)
            {
                group.push_back("/" + alias);
            }
        }
        endpoints["conversion"].push_back("/status");

        json response = {{"status", "ok"},
                         {"message", ctx.service_name + " is running"},
                         {"version", API_VERSION},
                         {"endpoints", endpoints},
                         {"capabilities", ctx.registry.describe()}};
        res.set_content(response.dump(), "application/json");
    }

    static void handleHealth(const httplib::Request &, httplib::Response &res, const GatewayContext &ctx)
    {
        if (!ctx.staging.isRootWritable())
        {
            Logger::warn("Health check: staging root " + ctx.staging.root().string() + " is not writable");
            res.status = 503;
            res.set_content(json{{"status", "unhealthy"}, {"service", ctx.service_name}, {"reason", "staging root not writable"}}.dump(),
                            "application/json");
            return;
        }
        res.set_content(json{{"status", "healthy"}, {"service", ctx.service_name}}.dump(), "application/json");
    }

    static void handleToolStatus(const httplib::Request &, httplib::Response &res, const GatewayContext &ctx)
    {
        auto &tools = ExternalTools::getInstance();
        json response = {{"platform", platformName()},
                         {"tools", tools.availability()},
                         {"soffice", tools.has(ExternalTools::SOFFICE) ? tools.path(ExternalTools::SOFFICE) : "not-found"},
                         {"active_requests", ctx.staging.activeCount()},
                         {"handler_threads", ctx.dispatcher.runningHandlers()}};
        res.set_content(response.dump(), "application/json");
    }

    static void handleError(const httplib::Request &req, httplib::Response &res, const GatewayContext &ctx)
    {
        // Routes set their own bodies; only fill in empty error responses
        if (!res.body.empty())
        {
            return;
        }

        FailureKind kind;
        std::string message;
        if (res.status == 404)
        {
            kind = FailureKind::NotFound;
            message = "Endpoint not found";
        }
        else if (res.status == 413)
        {
            kind = FailureKind::PayloadTooLarge;
            message = "File too large. Maximum upload size is " + std::to_string(ctx.max_body_bytes / (1024 * 1024)) + "MB";
        }
        else if (res.status >= 400 && res.status < 500)
        {
            kind = FailureKind::InvalidInput;
            message = "Malformed request";
        }
        else
        {
            kind = FailureKind::HandlerCrashed;
            message = "Internal server error";
        }

        Logger::debug("RouteHandlers: " + std::to_string(res.status) + " for " + req.method + " " + req.path);
        sendEnvelope(res, ctx.envelopes.buildFailure(kind, message));
    }

    static void handleException(const httplib::Request &req, httplib::Response &res, const GatewayContext &ctx,
                                std::exception_ptr ep)
    {
        std::string detail;
        try
        {
            if (ep)
            {
                std::rethrow_exception(ep);
            }
        }
        catch (const std::exception &e)
        {
            detail = e.what();
        }
        catch (...)
        {
            detail = "unknown exception";
        }
        Logger::error("RouteHandlers: unhandled exception on " + req.path + ": " + detail);
        sendEnvelope(res, ctx.envelopes.buildFailure(FailureKind::HandlerCrashed, "Internal server error", detail));
    }

    static std::string platformName()
    {
#if defined(__linux__)
        return "Linux";
#elif defined(__APPLE__)
        return "Darwin";
#else
        return "Unknown";
#endif
    }
};
