#pragma once

#include "core/capability_registry.hpp"
#include "core/processing_outcome.hpp"
#include "tools/tool_runner.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

/**
 * @brief One file a handler should process, after ZIP expansion
 */
struct WorkItem
{
    std::filesystem::path path;
    std::string name;      // display name used to derive output names
    std::string extension; // lowercase
    bool from_archive = false;
};

/**
 * @brief Handler inputs with any uploaded ZIP archives unpacked
 */
struct WorkBatch
{
    std::vector<WorkItem> items;
    bool has_archive = false;
    std::string bundle_stem; // stem of the first upload, for naming a ZIP result
};

/**
 * @brief Helpers shared by the capability handlers
 */
class HandlerSupport
{
public:
    static std::vector<uint8_t> readFileBytes(const std::filesystem::path &path);
    static void writeFileBytes(const std::filesystem::path &path, const std::vector<uint8_t> &data);

    static std::string mimeForExtension(const std::string &extension);

    /**
     * @brief Collect inputs whose extension is in `member_extensions`,
     * expanding uploaded `.zip` files into a scratch directory next to the
     * output directory.
     * @throws ProcessingError(InvalidInput) if nothing usable is found
     */
    static WorkBatch expandInputs(const HandlerRequest &request, const std::set<std::string> &member_extensions);

    /**
     * @brief Turn produced files into the response artifact: the file itself
     * when there is exactly one and no archive was uploaded, otherwise a ZIP
     * named `<bundle_stem>_<suffix>.zip`.
     */
    static ProcessingOutcome packageOutputs(const HandlerRequest &request,
                                            const std::vector<std::filesystem::path> &outputs,
                                            const WorkBatch &batch,
                                            const std::string &suffix);

    /**
     * @brief The file itself when `outputs` holds exactly one (unless
     * `always_zip`), otherwise a ZIP named `zip_name` with de-duplicated
     * member names.
     */
    static ProcessingOutcome bundleOutputs(const HandlerRequest &request,
                                           const std::vector<std::filesystem::path> &outputs,
                                           const std::string &zip_name,
                                           bool always_zip = false);

    // Produces one output file for `item` inside `out_dir`
    using ItemProcessor = std::function<std::filesystem::path(const WorkItem &item, const std::filesystem::path &out_dir)>;

    /**
     * @brief Run `process` for every item (in parallel through oneTBB when
     * `parallel` is set). Each item gets its own output directory. Items that
     * fail are logged and skipped unless every item fails, in which case the
     * first error is rethrown.
     */
    static std::vector<std::filesystem::path> processAll(const HandlerRequest &request,
                                                         const WorkBatch &batch,
                                                         const ItemProcessor &process,
                                                         bool parallel);

    // Throws ProcessingError(Timeout) once the dispatcher has given up on the request
    static void throwIfCancelled(const HandlerRequest &request);

    /**
     * @brief Run an external tool bound to the request's cancellation token.
     * @throws ProcessingError(HandlerCrashed) with the output tail when the tool fails
     */
    static ToolResult runTool(const HandlerRequest &request, const std::vector<std::string> &argv,
                              const std::filesystem::path &working_dir = {});

    // Unique path `<dir>/<stem><suffix>` that does not exist yet
    static std::filesystem::path uniqueOutputPath(const std::filesystem::path &dir, const std::string &stem, const std::string &suffix);

    /**
     * @brief Create `<parent>/<name>` when missing. Only the leaf is created,
     * so a released staging directory is never brought back.
     * @throws StagingError if `parent` is gone or the directory cannot be made
     */
    static std::filesystem::path makeSubdir(const std::filesystem::path &parent, const std::string &name);

    // Scratch directory for the request (sibling of the output directory), created on demand
    static std::filesystem::path workDir(const HandlerRequest &request, const std::string &name);

    // Numeric option truncated to int, saturating at the int range
    static int optionInt(const HandlerRequest &request, const std::string &key, int def);
    static double optionDouble(const HandlerRequest &request, const std::string &key, double def);
    static bool optionBool(const HandlerRequest &request, const std::string &key, bool def);
    static std::string optionString(const HandlerRequest &request, const std::string &key, const std::string &def);
};
