#include "handlers/pdf_handlers.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include "tools/external_tools.hpp"
#include "tools/office_converter.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

void PdfHandlers::registerCapabilities(CapabilityRegistry &registry)
{
    registry.registerCapability({"pdf.protect", {"protect-pdf"}, "pdf",
                                 "Encrypt PDFs with a password (AES-256)",
                                 {"pdf", "zip"}, {{"password", ""}}, 1, &PdfHandlers::protect});

    registry.registerCapability({"pdf.unlock", {"unlock-pdf"}, "pdf",
                                 "Remove the password from PDFs",
                                 {"pdf", "zip"}, {{"password", ""}}, 1, &PdfHandlers::unlock});

    registry.registerCapability({"pdf.to_word", {"pdf-to-word"}, "pdf",
                                 "Convert PDFs to Word documents",
                                 {"pdf", "zip"}, nlohmann::json::object(), 1, &PdfHandlers::toWord});
}

bool PdfHandlers::isPasswordError(const std::string &qpdf_output)
{
    std::string lower = qpdf_output;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return lower.find("invalid password") != std::string::npos ||
           lower.find("password incorrect") != std::string::npos;
}

void PdfHandlers::runQpdf(const HandlerRequest &request, const std::vector<std::string> &args,
                          const std::string &display_name)
{
    std::vector<std::string> argv = {ExternalTools::getInstance().require(ExternalTools::QPDF)};
    argv.insert(argv.end(), args.begin(), args.end());

    HandlerSupport::throwIfCancelled(request);
    ToolResult result = ToolRunner::run(argv, request.cancel_token.get());
    if (result.cancelled)
    {
        throw ProcessingError(FailureKind::Timeout, "processing cancelled");
    }
    if (result.exit_code == 0 || result.exit_code == 3)
    {
        return;
    }
    if (isPasswordError(result.output))
    {
        throw ProcessingError(FailureKind::InvalidInput, "password required or incorrect for " + display_name);
    }
    throw ProcessingError(FailureKind::HandlerCrashed, "qpdf failed with exit code " + std::to_string(result.exit_code),
                          ToolRunner::tail(result.output));
}

ProcessingOutcome PdfHandlers::protect(const HandlerRequest &request)
{
    const std::string password = HandlerSupport::optionString(request, "password", "");
    if (password.empty())
    {
        throw ProcessingError(FailureKind::InvalidInput, "password is required");
    }

    WorkBatch batch = HandlerSupport::expandInputs(request, {"pdf"});
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name) + "_protected", ".pdf");
        runQpdf(request, {"--encrypt", password, password, "256", "--", item.path.string(), out.string()}, item.name);
        return out; },
                                              true);
    return HandlerSupport::packageOutputs(request, outputs, batch, "protected");
}

ProcessingOutcome PdfHandlers::unlock(const HandlerRequest &request)
{
    const std::string password = HandlerSupport::optionString(request, "password", "");

    WorkBatch batch = HandlerSupport::expandInputs(request, {"pdf"});
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name) + "_unlocked", ".pdf");
        std::vector<std::string> args;
        if (!password.empty())
        {
            args.push_back("--password=" + password);
        }
        args.insert(args.end(), {"--decrypt", item.path.string(), out.string()});
        runQpdf(request, args, item.name);
        return out; },
                                              true);
    return HandlerSupport::packageOutputs(request, outputs, batch, "unlocked");
}

ProcessingOutcome PdfHandlers::toWord(const HandlerRequest &request)
{
    WorkBatch batch = HandlerSupport::expandInputs(request, {"pdf"});
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        fs::path convert_dir = HandlerSupport::makeSubdir(out_dir, "converted");
        fs::path converted = OfficeConverter::convert(request, item.path, "docx:MS Word 2007 XML", convert_dir, "writer_pdf_import");
        fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name), ".docx");
        fs::rename(converted, out);
        return out; },
                                              false);
    return HandlerSupport::packageOutputs(request, outputs, batch, "docx");
}
