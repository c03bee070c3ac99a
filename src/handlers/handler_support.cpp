#include "handlers/handler_support.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include "media/zip_archive.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <fstream>
#include <limits>
#include <map>
#include <mutex>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace fs = std::filesystem;

std::vector<uint8_t> HandlerSupport::readFileBytes(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("cannot read " + path.filename().string());
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void HandlerSupport::writeFileBytes(const fs::path &path, const std::vector<uint8_t> &data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error("cannot write " + path.filename().string());
    }
    out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out.good())
    {
        throw std::runtime_error("short write on " + path.filename().string());
    }
}

std::string HandlerSupport::mimeForExtension(const std::string &extension)
{
    static const std::map<std::string, std::string> mime_map = {
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"webp", "image/webp"},
        {"gif", "image/gif"},
        {"bmp", "image/bmp"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"mp4", "video/mp4"},
        {"mov", "video/quicktime"},
        {"avi", "video/x-msvideo"},
        {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},
        {"mp3", "audio/mpeg"},
        {"m4a", "audio/mp4"},
        {"wav", "audio/wav"},
        {"flac", "audio/flac"},
        {"ogg", "audio/ogg"},
        {"opus", "audio/opus"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"txt", "text/plain"},
        {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    };
    std::string key = extension;
    if (!key.empty() && key.front() == '.')
        key.erase(0, 1);
    auto it = mime_map.find(key);
    return it == mime_map.end() ? "application/octet-stream" : it->second;
}

WorkBatch HandlerSupport::expandInputs(const HandlerRequest &request, const std::set<std::string> &member_extensions)
{
    WorkBatch batch;
    for (size_t i = 0; i < request.inputs.size(); ++i)
    {
        const StagedFile &input = request.inputs[i];
        if (batch.bundle_stem.empty())
        {
            batch.bundle_stem = FilenameSanitizer::stemOf(input.safe_name);
        }

        if (input.extension != "zip")
        {
            if (member_extensions.count(input.extension) > 0)
            {
                batch.items.push_back({input.path, input.safe_name, input.extension, false});
            }
            continue;
        }

        batch.has_archive = true;
        fs::path dest = workDir(request, "unzip_" + std::to_string(i));
        for (const auto &member : ZipArchive::extract(input.path, dest, request.cancel_token.get()))
        {
            throwIfCancelled(request);
            SanitizedName name = FilenameSanitizer::sanitize(member.filename().string());
            if (member_extensions.count(name.extension) == 0)
            {
                continue;
            }
            batch.items.push_back({member, name.safe_name, name.extension, true});
        }
    }

    if (batch.items.empty())
    {
        throw ProcessingError(FailureKind::InvalidInput,
                              batch.has_archive ? "no supported files found inside the ZIP archive"
                                                : "no supported input files");
    }
    return batch;
}

ProcessingOutcome HandlerSupport::packageOutputs(const HandlerRequest &request,
                                                 const std::vector<fs::path> &outputs,
                                                 const WorkBatch &batch,
                                                 const std::string &suffix)
{
    std::string stem = batch.bundle_stem.empty() ? "files" : batch.bundle_stem;
    // An uploaded archive always comes back as an archive
    return bundleOutputs(request, outputs, stem + "_" + suffix + ".zip", batch.has_archive);
}

ProcessingOutcome HandlerSupport::bundleOutputs(const HandlerRequest &request,
                                                const std::vector<fs::path> &outputs,
                                                const std::string &zip_name,
                                                bool always_zip)
{
    if (outputs.empty())
    {
        throw ProcessingError(FailureKind::HandlerCrashed, "processing produced no output");
    }

    if (outputs.size() == 1 && !always_zip)
    {
        const fs::path &out = outputs.front();
        std::string name = out.filename().string();
        return ProcessingOutcome::artifact(readFileBytes(out), name,
                                           mimeForExtension(FilenameSanitizer::extensionOf(name)));
    }

    std::vector<std::pair<std::string, fs::path>> entries;
    std::set<std::string> used;
    for (const auto &out : outputs)
    {
        std::string name = out.filename().string();
        std::string stem = FilenameSanitizer::stemOf(name);
        std::string ext = name.substr(stem.size());
        int n = 1;
        while (!used.insert(name).second)
        {
            name = stem + "_" + std::to_string(n++) + ext;
        }
        entries.emplace_back(name, out);
    }

    fs::path zip_path = workDir(request, "bundle") / zip_name;
    ZipArchive::create(zip_path, entries);
    return ProcessingOutcome::artifact(readFileBytes(zip_path), zip_name, "application/zip");
}

std::vector<fs::path> HandlerSupport::processAll(const HandlerRequest &request,
                                                 const WorkBatch &batch,
                                                 const ItemProcessor &process,
                                                 bool parallel)
{
    const size_t count = batch.items.size();
    std::vector<fs::path> out_dirs(count, request.output_dir);
    if (count > 1)
    {
        for (size_t i = 0; i < count; ++i)
        {
            out_dirs[i] = makeSubdir(request.output_dir, std::to_string(i));
        }
    }

    std::vector<fs::path> results(count);
    std::vector<std::string> errors(count);
    std::mutex first_error_mutex;
    std::exception_ptr first_error;

    auto runOne = [&](size_t i)
    {
        if (request.cancelled())
            return;
        try
        {
            results[i] = process(batch.items[i], out_dirs[i]);
        }
        catch (const std::exception &e)
        {
            errors[i] = e.what();
            std::lock_guard<std::mutex> lock(first_error_mutex);
            if (!first_error)
                first_error = std::current_exception();
        }
    };

    if (parallel && count > 1)
    {
        tbb::parallel_for(tbb::blocked_range<size_t>(0, count), [&](const tbb::blocked_range<size_t> &range)
                          {
            for (size_t i = range.begin(); i != range.end(); ++i)
            {
                runOne(i);
            } });
    }
    else
    {
        for (size_t i = 0; i < count; ++i)
        {
            runOne(i);
        }
    }

    throwIfCancelled(request);

    std::vector<fs::path> produced;
    for (size_t i = 0; i < count; ++i)
    {
        if (!results[i].empty())
            produced.push_back(results[i]);
        else if (!errors[i].empty())
            Logger::warn("HandlerSupport: skipped " + batch.items[i].name + ": " + errors[i]);
    }

    if (produced.empty() && first_error)
    {
        std::rethrow_exception(first_error);
    }
    return produced;
}

void HandlerSupport::throwIfCancelled(const HandlerRequest &request)
{
    if (request.cancelled())
    {
        throw ProcessingError(FailureKind::Timeout, "processing cancelled");
    }
}

ToolResult HandlerSupport::runTool(const HandlerRequest &request, const std::vector<std::string> &argv,
                                   const fs::path &working_dir)
{
    throwIfCancelled(request);
    ToolResult result = ToolRunner::run(argv, request.cancel_token.get(), std::chrono::milliseconds(0), working_dir);
    if (result.cancelled)
    {
        throw ProcessingError(FailureKind::Timeout, "processing cancelled");
    }
    if (!result.succeeded())
    {
        std::string tool = fs::path(argv.front()).filename().string();
        throw ProcessingError(FailureKind::HandlerCrashed,
                              tool + " failed with exit code " + std::to_string(result.exit_code),
                              ToolRunner::tail(result.output));
    }
    return result;
}

fs::path HandlerSupport::uniqueOutputPath(const fs::path &dir, const std::string &stem, const std::string &suffix)
{
    fs::path candidate = dir / (stem + suffix);
    std::error_code ec;
    int n = 1;
    while (fs::exists(candidate, ec))
    {
        candidate = dir / (stem + "_" + std::to_string(n++) + suffix);
    }
    return candidate;
}

fs::path HandlerSupport::makeSubdir(const fs::path &parent, const std::string &name)
{
    fs::path dir = parent / name;
    std::error_code ec;
    fs::create_directory(dir, ec);
    if (ec)
    {
        throw StagingError("cannot create " + dir.string() + ": " + ec.message());
    }
    return dir;
}

fs::path HandlerSupport::workDir(const HandlerRequest &request, const std::string &name)
{
    return makeSubdir(makeSubdir(request.output_dir.parent_path(), "work"), name);
}

int HandlerSupport::optionInt(const HandlerRequest &request, const std::string &key, int def)
{
    auto it = request.options.find(key);
    if (it == request.options.end() || !it->is_number())
        return def;
    double value = it->get<double>();
    if (std::isnan(value))
        return def;
    // Saturate instead of overflowing; callers clamp to their own range
    value = std::clamp(value, static_cast<double>(std::numeric_limits<int>::min()),
                       static_cast<double>(std::numeric_limits<int>::max()));
    return static_cast<int>(value);
}

double HandlerSupport::optionDouble(const HandlerRequest &request, const std::string &key, double def)
{
    auto it = request.options.find(key);
    if (it == request.options.end() || !it->is_number())
        return def;
    return it->get<double>();
}

bool HandlerSupport::optionBool(const HandlerRequest &request, const std::string &key, bool def)
{
    auto it = request.options.find(key);
    if (it == request.options.end() || !it->is_boolean())
        return def;
    return it->get<bool>();
}

std::string HandlerSupport::optionString(const HandlerRequest &request, const std::string &key, const std::string &def)
{
    auto it = request.options.find(key);
    if (it == request.options.end() || !it->is_string())
        return def;
    return it->get<std::string>();
}
