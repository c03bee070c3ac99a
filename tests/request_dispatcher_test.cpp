#include "test_base.hpp"
#include "core/request_dispatcher.hpp"
#include "handlers/handler_support.hpp"
#include <atomic>
#include <limits>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

class RequestDispatcherTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        staging_options_.root = test_dir_ / "staging";
        staging_options_.release_grace_ms = 200;
        staging_options_.min_free_bytes = 0;
        staging_ = std::make_unique<StagingAreaManager>(staging_options_);
    }

    void add(const std::string &key, std::set<std::string> extensions, CapabilityHandler handler,
             nlohmann::json defaults = nlohmann::json::object(), size_t min_inputs = 1)
    {
        CapabilityDescriptor d;
        d.key = key;
        d.aliases = {key + "-route"};
        d.group = "test";
        d.accepted_extensions = std::move(extensions);
        d.option_defaults = std::move(defaults);
        d.min_inputs = min_inputs;
        d.handler = std::move(handler);
        registry_.registerCapability(std::move(d));
    }

    RequestDispatcher makeDispatcher(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
                                     int64_t max_bytes = 1024 * 1024, size_t max_threads = 64)
    {
        registry_.freeze();
        DispatcherOptions options;
        options.handler_timeout = timeout;
        options.max_upload_bytes = max_bytes;
        options.max_handler_threads = max_threads;
        return RequestDispatcher(registry_, *staging_, options);
    }

    static UploadedArtifact upload(const std::string &name, const std::string &content)
    {
        return UploadedArtifact{name, "application/octet-stream", content};
    }

    static std::string readAll(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    // Handler that echoes its single input back with a new name
    static CapabilityHandler echoHandler(std::atomic<int> *calls = nullptr)
    {
        return [calls](const HandlerRequest &request)
        {
            if (calls)
                (*calls)++;
            std::string data = readAll(request.inputs.at(0).path);
            return ProcessingOutcome::artifact(std::vector<uint8_t>(data.begin(), data.end()),
                                               "echo_" + request.inputs.at(0).safe_name, "text/plain");
        };
    }

    StagingOptions staging_options_;
    std::unique_ptr<StagingAreaManager> staging_;
    CapabilityRegistry registry_;
};

TEST_F(RequestDispatcherTest, UnknownCapabilityIsNotFoundWithoutStaging)
{
    RequestDispatcher dispatcher = makeDispatcher();
    ProcessingOutcome outcome = dispatcher.dispatch("does.not.exist", {upload("a.txt", "x")}, nlohmann::json::object());

    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::NotFound);
    EXPECT_EQ(countEntries(staging_options_.root), 0u);
}

TEST_F(RequestDispatcherTest, SuccessfulDispatchByAliasCleansUp)
{
    std::atomic<int> calls{0};
    add("text.echo", {"txt"}, echoHandler(&calls));
    RequestDispatcher dispatcher = makeDispatcher();

    ProcessingOutcome outcome = dispatcher.dispatch("text.echo-route", {upload("../../notes.txt", "hello")}, nlohmann::json::object());

    ASSERT_TRUE(outcome.isArtifact());
    EXPECT_EQ(outcome.getArtifact().filename, "echo_notes.txt");
    EXPECT_EQ(std::string(outcome.getArtifact().data.begin(), outcome.getArtifact().data.end()), "hello");
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(countEntries(staging_options_.root), 0u);
    EXPECT_EQ(staging_->activeCount(), 0u);
}

TEST_F(RequestDispatcherTest, UnsupportedTypeSkipsHandler)
{
    std::atomic<int> calls{0};
    add("text.echo", {"txt"}, echoHandler(&calls));
    RequestDispatcher dispatcher = makeDispatcher();

    ProcessingOutcome outcome = dispatcher.dispatch("text.echo", {upload("ok.txt", "a"), upload("bad.exe", "b")}, nlohmann::json::object());

    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::UnsupportedType);
    EXPECT_NE(outcome.getFailure().message.find(".exe"), std::string::npos);
    EXPECT_NE(outcome.getFailure().message.find("txt"), std::string::npos);
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(countEntries(staging_options_.root), 0u);
}

TEST_F(RequestDispatcherTest, MissingExtensionIsUnsupported)
{
    add("text.echo", {"txt"}, echoHandler());
    RequestDispatcher dispatcher = makeDispatcher();

    ProcessingOutcome outcome = dispatcher.dispatch("text.echo", {upload("README", "a")}, nlohmann::json::object());
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::UnsupportedType);
}

TEST_F(RequestDispatcherTest, EmptyInputListIsRejected)
{
    std::atomic<int> calls{0};
    add("pdf.to_word", {"pdf"}, echoHandler(&calls));
    RequestDispatcher dispatcher = makeDispatcher();

    ProcessingOutcome outcome = dispatcher.dispatch("pdf.to_word", {}, nlohmann::json::object());
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::UnsupportedType);
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(RequestDispatcherTest, ZeroMinimumAllowsOptionOnlyRequests)
{
    add("url.fetch", {"txt"}, [](const HandlerRequest &request)
        { return ProcessingOutcome::status({{"inputs", request.inputs.size()}, {"url", request.options["url"]}}); },
        {{"url", ""}}, 0);
    RequestDispatcher dispatcher = makeDispatcher();

    ProcessingOutcome outcome = dispatcher.dispatch("url.fetch", {}, {{"url", "https://example.com/v"}});
    ASSERT_TRUE(outcome.isStatus());
    EXPECT_EQ(outcome.getStatus().data["inputs"], 0);
    EXPECT_EQ(outcome.getStatus().data["url"], "https://example.com/v");
}

TEST_F(RequestDispatcherTest, OversizedUploadIsRejectedBeforeStaging)
{
    std::atomic<int> calls{0};
    add("text.echo", {"txt"}, echoHandler(&calls));
    RequestDispatcher dispatcher = makeDispatcher(std::chrono::milliseconds(5000), 10);

    ProcessingOutcome outcome = dispatcher.dispatch("text.echo", {upload("a.txt", "123456"), upload("b.txt", "123456")}, nlohmann::json::object());
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::PayloadTooLarge);
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(countEntries(staging_options_.root), 0u);
}

TEST_F(RequestDispatcherTest, OptionsAreMergedOverDefaults)
{
    nlohmann::json seen;
    std::mutex mutex;
    add("image.compress", {"jpg"}, [&](const HandlerRequest &request)
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen = request.options;
            return ProcessingOutcome::status({{"ok", true}}); },
        {{"quality", 85}, {"mode", "fast"}, {"strip", false}});
    RequestDispatcher dispatcher = makeDispatcher();

    ProcessingOutcome outcome = dispatcher.dispatch("image.compress", {upload("a.jpg", "x")},
                                                    {{"quality", "40"}, {"strip", "true"}, {"unknown", 1}});
    ASSERT_TRUE(outcome.isStatus());
    EXPECT_EQ(seen["quality"], 40);
    EXPECT_EQ(seen["mode"], "fast");
    EXPECT_EQ(seen["strip"], true);
    EXPECT_FALSE(seen.contains("unknown"));
}

TEST_F(RequestDispatcherTest, MergeOptionsKeepsDefaultOnBadValue)
{
    nlohmann::json defaults{{"quality", 85}, {"scale", 1.5}, {"flag", true}, {"name", "x"}};
    nlohmann::json merged = RequestDispatcher::mergeOptions(defaults, {{"quality", "abc"}, {"scale", "2.5"}, {"flag", "maybe"}, {"name", 7}});

    EXPECT_EQ(merged["quality"], 85);
    EXPECT_DOUBLE_EQ(merged["scale"].get<double>(), 2.5);
    EXPECT_EQ(merged["flag"], true);
    EXPECT_EQ(merged["name"], "7");

    EXPECT_EQ(RequestDispatcher::mergeOptions(defaults, nlohmann::json()), defaults);
}

TEST_F(RequestDispatcherTest, ThrowingHandlerBecomesCrashAndCleansUp)
{
    fs::path seen_dir;
    std::mutex mutex;
    add("text.crash", {"txt"}, [&](const HandlerRequest &request) -> ProcessingOutcome
        {
            {
                std::lock_guard<std::mutex> lock(mutex);
                seen_dir = request.output_dir;
            }
            std::ofstream(request.output_dir / "partial.bin") << "half";
            throw std::runtime_error("boom"); });
    RequestDispatcher dispatcher = makeDispatcher();

    ProcessingOutcome outcome = dispatcher.dispatch("text.crash", {upload("a.txt", "x")}, nlohmann::json::object());
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::HandlerCrashed);
    EXPECT_EQ(outcome.getFailure().detail, "boom");
    EXPECT_FALSE(seen_dir.empty());
    EXPECT_FALSE(fs::exists(seen_dir.parent_path()));
}

TEST_F(RequestDispatcherTest, ProcessingErrorKeepsItsKind)
{
    add("pdf.protect", {"pdf"}, [](const HandlerRequest &) -> ProcessingOutcome
        { throw ProcessingError(FailureKind::InvalidInput, "password is required"); });
    RequestDispatcher dispatcher = makeDispatcher();

    ProcessingOutcome outcome = dispatcher.dispatch("pdf.protect", {upload("a.pdf", "%PDF")}, nlohmann::json::object());
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::InvalidInput);
    EXPECT_EQ(outcome.getFailure().message, "password is required");
}

TEST_F(RequestDispatcherTest, SlowHandlerTimesOutAndIsCancelled)
{
    auto observed_cancel = std::make_shared<std::atomic<bool>>(false);
    add("text.slow", {"txt"}, [observed_cancel](const HandlerRequest &request)
        {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (!request.cancelled() && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            observed_cancel->store(request.cancelled());
            return ProcessingOutcome::status({{"late", true}}); });
    RequestDispatcher dispatcher = makeDispatcher(std::chrono::milliseconds(200));

    auto started = std::chrono::steady_clock::now();
    ProcessingOutcome outcome = dispatcher.dispatch("text.slow", {upload("a.txt", "x")}, nlohmann::json::object());
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(countEntries(staging_options_.root), 0u);
    EXPECT_TRUE(waitUntil([&]
                          { return observed_cancel->load(); }));
}

TEST_F(RequestDispatcherTest, StagingFailureIsReported)
{
    staging_options_.min_free_bytes = std::numeric_limits<int64_t>::max();
    staging_ = std::make_unique<StagingAreaManager>(staging_options_);
    std::atomic<int> calls{0};
    add("text.echo", {"txt"}, echoHandler(&calls));
    RequestDispatcher dispatcher = makeDispatcher();

    ProcessingOutcome outcome = dispatcher.dispatch("text.echo", {upload("a.txt", "x")}, nlohmann::json::object());
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::StagingError);
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(countEntries(staging_options_.root), 0u);
}

TEST_F(RequestDispatcherTest, ConcurrentRequestsAreIsolated)
{
    add("text.echo", {"txt"}, [](const HandlerRequest &request)
        {
            // Each request must only ever see its own input
            if (request.inputs.size() != 1 || countEntries(request.inputs[0].path.parent_path()) != 1)
                throw std::runtime_error("foreign input visible");
            std::string data = readAll(request.inputs[0].path);
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            return ProcessingOutcome::artifact(std::vector<uint8_t>(data.begin(), data.end()), "out.txt", "text/plain"); });
    RequestDispatcher dispatcher = makeDispatcher();

    constexpr int REQUESTS = 64;
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < REQUESTS; ++i)
    {
        threads.emplace_back([&, i]()
                             {
            std::string payload = "request-" + std::to_string(i);
            ProcessingOutcome outcome = dispatcher.dispatch("text.echo", {upload("same.txt", payload)}, nlohmann::json::object());
            if (!outcome.isArtifact() ||
                std::string(outcome.getArtifact().data.begin(), outcome.getArtifact().data.end()) != payload)
                mismatches++; });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(staging_->activeCount(), 0u);
    EXPECT_EQ(countEntries(staging_options_.root), 0u);
}

TEST_F(RequestDispatcherTest, AbandonedHandlerCannotRecreateReleasedStaging)
{
    struct LateState
    {
        std::atomic<bool> finished{false};
        std::atomic<bool> refused{false};
    };
    auto state = std::make_shared<LateState>();
    add("text.stubborn", {"txt"}, [state](const HandlerRequest &request)
        {
            // Ignores cancellation and only starts writing once its directory is gone
            fs::path scope_dir = request.output_dir.parent_path();
            waitUntil([&]
                      { return !fs::exists(scope_dir); });
            try
            {
                fs::path bundle = HandlerSupport::workDir(request, "bundle");
                std::ofstream(bundle / "late.zip") << std::string(1024 * 1024, 'z');
            }
            catch (const StagingError &)
            {
                state->refused = true;
            }
            state->finished = true;
            return ProcessingOutcome::status({{"late", true}}); });
    RequestDispatcher dispatcher = makeDispatcher(std::chrono::milliseconds(100));

    ProcessingOutcome outcome = dispatcher.dispatch("text.stubborn", {upload("a.txt", "x")}, nlohmann::json::object());
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.getFailure().kind, FailureKind::Timeout);

    ASSERT_TRUE(waitUntil([&]
                          { return state->finished.load(); }, std::chrono::milliseconds(5000)));
    EXPECT_TRUE(state->refused.load());
    EXPECT_EQ(countEntries(staging_options_.root), 0u);
    EXPECT_EQ(staging_->activeCount(), 0u);
    EXPECT_TRUE(dispatcher.waitForHandlers(std::chrono::milliseconds(3000)));
}

TEST_F(RequestDispatcherTest, AbandonedHandlersCountAgainstThreadLimit)
{
    auto unblock = std::make_shared<std::atomic<bool>>(false);
    auto calls = std::make_shared<std::atomic<int>>(0);
    add("text.stuck", {"txt"}, [unblock, calls](const HandlerRequest &)
        {
            (*calls)++;
            while (!unblock->load())
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            return ProcessingOutcome::status({{"done", true}}); });
    RequestDispatcher dispatcher = makeDispatcher(std::chrono::milliseconds(100), 1024 * 1024, 1);

    ProcessingOutcome first = dispatcher.dispatch("text.stuck", {upload("a.txt", "x")}, nlohmann::json::object());
    ASSERT_TRUE(first.isFailure());
    EXPECT_EQ(first.getFailure().kind, FailureKind::Timeout);
    EXPECT_EQ(dispatcher.runningHandlers(), 1u);

    ProcessingOutcome refused = dispatcher.dispatch("text.stuck", {upload("b.txt", "y")}, nlohmann::json::object());
    ASSERT_TRUE(refused.isFailure());
    EXPECT_EQ(refused.getFailure().kind, FailureKind::ToolUnavailable);
    EXPECT_EQ(calls->load(), 1);
    EXPECT_EQ(countEntries(staging_options_.root), 0u);

    EXPECT_FALSE(dispatcher.waitForHandlers(std::chrono::milliseconds(50)));
    unblock->store(true);
    EXPECT_TRUE(dispatcher.waitForHandlers(std::chrono::milliseconds(3000)));
    EXPECT_EQ(dispatcher.runningHandlers(), 0u);

    ProcessingOutcome after = dispatcher.dispatch("text.stuck", {upload("c.txt", "z")}, nlohmann::json::object());
    EXPECT_TRUE(after.isStatus());
}
