#include "core/response_envelope.hpp"
#include <nlohmann/json.hpp>

ResponseEnvelope ResponseEnvelopeBuilder::build(const ProcessingOutcome &outcome) const
{
    if (outcome.isArtifact())
    {
        const OutputArtifact &artifact = outcome.getArtifact();
        ResponseEnvelope envelope;
        envelope.status = 200;
        envelope.body.assign(artifact.data.begin(), artifact.data.end());
        envelope.content_type = artifact.mime_type.empty() ? "application/octet-stream" : artifact.mime_type;
        envelope.headers = artifact.headers;
        envelope.headers["Content-Disposition"] = contentDisposition(artifact.filename);
        envelope.headers["X-Final-Size"] = std::to_string(artifact.data.size());
        return envelope;
    }

    if (outcome.isStatus())
    {
        ResponseEnvelope envelope;
        envelope.status = 200;
        envelope.body = outcome.getStatus().data.dump();
        envelope.content_type = "application/json";
        return envelope;
    }

    const Failure &failure = outcome.getFailure();
    return buildFailure(failure.kind, failure.message, failure.detail);
}

ResponseEnvelope ResponseEnvelopeBuilder::buildFailure(FailureKind kind, const std::string &message, const std::string &detail) const
{
    nlohmann::json body{{"error", failureKindName(kind)}, {"message", message}};
    if (include_detail_ && !detail.empty())
    {
        body["detail"] = detail;
    }

    ResponseEnvelope envelope;
    envelope.status = httpStatusFor(kind);
    // Replace invalid UTF-8 from tool output instead of throwing
    envelope.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    envelope.content_type = "application/json";
    return envelope;
}

std::string ResponseEnvelopeBuilder::contentDisposition(const std::string &filename)
{
    std::string cleaned;
    cleaned.reserve(filename.size());
    for (unsigned char c : filename)
    {
        if (c < 0x20 || c == 0x7f || c == '"' || c == '\\')
            continue;
        cleaned.push_back(static_cast<char>(c));
    }
    if (cleaned.empty())
    {
        cleaned = "download";
    }
    return "attachment; filename=\"" + cleaned + "\"";
}
