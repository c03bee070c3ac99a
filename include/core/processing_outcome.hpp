#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Failure categories produced by the dispatch layer and handlers
 */
enum class FailureKind
{
    NotFound,
    UnsupportedType,
    PayloadTooLarge,
    Timeout,
    HandlerCrashed,
    StagingError,
    InvalidInput,
    ToolUnavailable
};

// Stable wire name, e.g. "UnsupportedType"
std::string failureKindName(FailureKind kind);

// HTTP status the envelope builder uses for `kind`
int httpStatusFor(FailureKind kind);

/**
 * @brief Processed file returned to the client
 */
struct OutputArtifact
{
    std::vector<uint8_t> data;
    std::string filename;
    std::string mime_type;
    std::map<std::string, std::string> headers; // extra response headers, e.g. X-Method

    OutputArtifact() = default;
    OutputArtifact(std::vector<uint8_t> d, std::string name, std::string mime)
        : data(std::move(d)), filename(std::move(name)), mime_type(std::move(mime)) {}
};

/**
 * @brief Structured (JSON) success result with no file attached
 */
struct StatusPayload
{
    nlohmann::json data;
};

struct Failure
{
    FailureKind kind;
    std::string message;
    std::string detail; // diagnostic text, hidden in production responses

    Failure() : kind(FailureKind::HandlerCrashed) {}
    Failure(FailureKind k, std::string msg, std::string d = "")
        : kind(k), message(std::move(msg)), detail(std::move(d)) {}
};

/**
 * @brief Outcome of one capability invocation: exactly one of artifact,
 * status payload or failure.
 */
struct ProcessingOutcome
{
    std::variant<OutputArtifact, StatusPayload, Failure> value;

    static ProcessingOutcome artifact(std::vector<uint8_t> data, std::string filename, std::string mime_type)
    {
        return ProcessingOutcome{OutputArtifact(std::move(data), std::move(filename), std::move(mime_type))};
    }

    static ProcessingOutcome status(nlohmann::json data)
    {
        return ProcessingOutcome{StatusPayload{std::move(data)}};
    }

    static ProcessingOutcome failure(FailureKind kind, std::string message, std::string detail = "")
    {
        return ProcessingOutcome{Failure(kind, std::move(message), std::move(detail))};
    }

    bool isArtifact() const { return std::holds_alternative<OutputArtifact>(value); }
    bool isStatus() const { return std::holds_alternative<StatusPayload>(value); }
    bool isFailure() const { return std::holds_alternative<Failure>(value); }

    const OutputArtifact &getArtifact() const { return std::get<OutputArtifact>(value); }
    const StatusPayload &getStatus() const { return std::get<StatusPayload>(value); }
    const Failure &getFailure() const { return std::get<Failure>(value); }
};

/**
 * @brief Thrown by handlers to report a categorized failure. The dispatcher
 * turns it into a Failure of the same kind.
 */
class ProcessingError : public std::runtime_error
{
public:
    ProcessingError(FailureKind kind, const std::string &message, std::string detail = "")
        : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

    FailureKind kind() const { return kind_; }
    const std::string &detail() const { return detail_; }

private:
    FailureKind kind_;
    std::string detail_;
};
