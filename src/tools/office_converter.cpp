#include "tools/office_converter.hpp"
#include "handlers/handler_support.hpp"
#include "logging/logger.hpp"
#include "tools/external_tools.hpp"
#include <vector>

namespace fs = std::filesystem;

std::string OfficeConverter::profileUrl(const HandlerRequest &request)
{
    fs::path profile = HandlerSupport::workDir(request, "lo_profile");
    return "file://" + profile.string();
}

fs::path OfficeConverter::convert(const HandlerRequest &request, const fs::path &input, const std::string &target,
                                  const fs::path &out_dir, const std::string &import_filter)
{
    const std::string soffice = ExternalTools::getInstance().require(ExternalTools::SOFFICE);

    std::vector<std::string> argv = {soffice, "-env:UserInstallation=" + profileUrl(request),
                                     "--headless", "--norestore", "--nolockcheck"};
    if (!import_filter.empty())
    {
        argv.push_back("--infilter=" + import_filter);
    }
    argv.insert(argv.end(), {"--convert-to", target, "--outdir", out_dir.string(), input.string()});

    Logger::debug("OfficeConverter: " + input.filename().string() + " -> " + target);
    HandlerSupport::runTool(request, argv, out_dir);

    // --convert-to takes "ext:filter"; the file extension is the part before ':'
    std::string ext = target.substr(0, target.find(':'));
    fs::path produced = out_dir / (input.stem().string() + "." + ext);
    std::error_code ec;
    if (!fs::exists(produced, ec))
    {
        throw ProcessingError(FailureKind::HandlerCrashed,
                              "LibreOffice did not produce " + produced.filename().string());
    }
    return produced;
}
