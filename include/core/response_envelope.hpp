#pragma once

#include "core/processing_outcome.hpp"
#include <map>
#include <string>

/**
 * @brief Transport-neutral HTTP response produced from a ProcessingOutcome
 */
struct ResponseEnvelope
{
    int status = 200;
    std::string body;
    std::string content_type;
    std::map<std::string, std::string> headers;
};

class ResponseEnvelopeBuilder
{
public:
    /**
     * @param include_detail when true, failure bodies carry the diagnostic
     *        "detail" member (development mode)
     */
    explicit ResponseEnvelopeBuilder(bool include_detail) : include_detail_(include_detail) {}

    ResponseEnvelope build(const ProcessingOutcome &outcome) const;

    // Error envelope for failures raised outside the dispatcher (routing, body limits)
    ResponseEnvelope buildFailure(FailureKind kind, const std::string &message, const std::string &detail = "") const;

    // Content-Disposition value with the filename quoted and stripped of quotes and control bytes
    static std::string contentDisposition(const std::string &filename);

private:
    bool include_detail_;
};
