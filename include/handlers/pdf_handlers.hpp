#pragma once

#include "core/capability_registry.hpp"
#include "handlers/handler_support.hpp"
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief PDF password protection, unlocking and PDF to Word conversion.
 * Encryption goes through qpdf, conversion through LibreOffice.
 */
class PdfHandlers
{
public:
    static void registerCapabilities(CapabilityRegistry &registry);

    static ProcessingOutcome protect(const HandlerRequest &request);
    static ProcessingOutcome unlock(const HandlerRequest &request);
    static ProcessingOutcome toWord(const HandlerRequest &request);

    /**
     * @brief Run qpdf with `args`. Exit code 3 (warnings) counts as success.
     * A password problem reported for `display_name` becomes InvalidInput.
     */
    static void runQpdf(const HandlerRequest &request, const std::vector<std::string> &args,
                        const std::string &display_name);

    static bool isPasswordError(const std::string &qpdf_output);
};
