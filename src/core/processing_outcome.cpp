#include "core/processing_outcome.hpp"

std::string failureKindName(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::NotFound:
        return "NotFound";
    case FailureKind::UnsupportedType:
        return "UnsupportedType";
    case FailureKind::PayloadTooLarge:
        return "PayloadTooLarge";
    case FailureKind::Timeout:
        return "Timeout";
    case FailureKind::HandlerCrashed:
        return "HandlerCrashed";
    case FailureKind::StagingError:
        return "StagingError";
    case FailureKind::InvalidInput:
        return "InvalidInput";
    case FailureKind::ToolUnavailable:
        return "ToolUnavailable";
    }
    return "HandlerCrashed";
}

int httpStatusFor(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::NotFound:
        return 404;
    case FailureKind::UnsupportedType:
        return 422;
    case FailureKind::PayloadTooLarge:
        return 413;
    case FailureKind::Timeout:
        return 504;
    case FailureKind::HandlerCrashed:
    case FailureKind::StagingError:
        return 500;
    case FailureKind::InvalidInput:
        return 400;
    case FailureKind::ToolUnavailable:
        return 503;
    }
    return 500;
}
