#include <gtest/gtest.h>
#include "core/capability_registry.hpp"
#include "handlers/capability_catalog.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

class CapabilityRegistryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");
    }

    static CapabilityDescriptor makeDescriptor(const std::string &key, std::vector<std::string> aliases = {})
    {
        CapabilityDescriptor d;
        d.key = key;
        d.aliases = std::move(aliases);
        d.group = "image";
        d.accepted_extensions = {"jpg", ".PNG"};
        d.option_defaults = {{"quality", 85}};
        d.handler = [](const HandlerRequest &)
        { return ProcessingOutcome::status({{"ok", true}}); };
        return d;
    }
};

TEST_F(CapabilityRegistryTest, ResolvesKeysAndAliases)
{
    CapabilityRegistry registry;
    registry.registerCapability(makeDescriptor("image.compress", {"img-compress"}));
    registry.freeze();

    const CapabilityDescriptor *by_key = registry.resolve("image.compress");
    const CapabilityDescriptor *by_alias = registry.resolve("img-compress");
    ASSERT_NE(by_key, nullptr);
    EXPECT_EQ(by_key, by_alias);
    EXPECT_EQ(registry.resolve("image.nope"), nullptr);
    EXPECT_EQ(registry.resolve(""), nullptr);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(CapabilityRegistryTest, ExtensionsAreNormalized)
{
    CapabilityRegistry registry;
    registry.registerCapability(makeDescriptor("image.compress"));
    const CapabilityDescriptor *d = registry.resolve("image.compress");
    ASSERT_NE(d, nullptr);

    EXPECT_TRUE(CapabilityRegistry::isAcceptedExtension(*d, "jpg"));
    EXPECT_TRUE(CapabilityRegistry::isAcceptedExtension(*d, "JPG"));
    EXPECT_TRUE(CapabilityRegistry::isAcceptedExtension(*d, ".png"));
    EXPECT_FALSE(CapabilityRegistry::isAcceptedExtension(*d, "gif"));
    EXPECT_FALSE(CapabilityRegistry::isAcceptedExtension(*d, ""));
    EXPECT_FALSE(CapabilityRegistry::isAcceptedExtension(*d, "."));
}

TEST_F(CapabilityRegistryTest, RejectsInvalidDescriptors)
{
    CapabilityRegistry registry;
    registry.registerCapability(makeDescriptor("image.compress", {"img-compress"}));

    EXPECT_THROW(registry.registerCapability(makeDescriptor("image.compress")), std::invalid_argument);
    EXPECT_THROW(registry.registerCapability(makeDescriptor("image.other", {"img-compress"})), std::invalid_argument);
    EXPECT_THROW(registry.registerCapability(makeDescriptor("img-compress")), std::invalid_argument);
    EXPECT_THROW(registry.registerCapability(makeDescriptor("image.twice", {"same", "same"})), std::invalid_argument);
    EXPECT_THROW(registry.registerCapability(makeDescriptor("")), std::invalid_argument);

    CapabilityDescriptor no_handler = makeDescriptor("image.no_handler");
    no_handler.handler = nullptr;
    EXPECT_THROW(registry.registerCapability(no_handler), std::invalid_argument);

    CapabilityDescriptor no_types = makeDescriptor("image.no_types");
    no_types.accepted_extensions.clear();
    EXPECT_THROW(registry.registerCapability(no_types), std::invalid_argument);

    CapabilityDescriptor bad_defaults = makeDescriptor("image.bad_defaults");
    bad_defaults.option_defaults = nlohmann::json::array();
    EXPECT_THROW(registry.registerCapability(bad_defaults), std::invalid_argument);

    // Failed registrations leave no trace
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.resolve("image.other"), nullptr);
}

TEST_F(CapabilityRegistryTest, FrozenRegistryRejectsRegistration)
{
    CapabilityRegistry registry;
    registry.freeze();
    EXPECT_TRUE(registry.isFrozen());
    EXPECT_THROW(registry.registerCapability(makeDescriptor("image.late")), std::logic_error);
}

TEST_F(CapabilityRegistryTest, ConcurrentResolveAfterFreeze)
{
    CapabilityRegistry registry;
    for (int i = 0; i < 20; ++i)
    {
        registry.registerCapability(makeDescriptor("cap." + std::to_string(i), {"route-" + std::to_string(i)}));
    }
    registry.freeze();

    std::atomic<int> misses{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&]()
                             {
            for (int n = 0; n < 1000; ++n)
            {
                int i = n % 20;
                const CapabilityDescriptor *d = registry.resolve("route-" + std::to_string(i));
                if (d == nullptr || d->key != "cap." + std::to_string(i))
                    misses++;
            } });
    }
    for (auto &t : threads)
        t.join();
    EXPECT_EQ(misses.load(), 0);
}

TEST_F(CapabilityRegistryTest, BuiltInCatalogRegistersEveryRoute)
{
    CapabilityRegistry registry;
    ASSERT_NO_THROW(CapabilityCatalog::registerAll(registry));
    registry.freeze();

    const std::vector<std::string> routes = {
        "img-compress", "img-jpg", "img-png", "img-webp", "upscale", "remove-imgbg", "watermark-imgvideo",
        "video-upscale", "download-video-batch", "download-audio-batch",
        "protect-pdf", "unlock-pdf", "pdf-to-word", "watermark-files",
        "file-pdf", "convert-all-to-ppt", "compress", "generate-qr"};
    for (const auto &route : routes)
    {
        EXPECT_NE(registry.resolve(route), nullptr) << route;
    }
    EXPECT_EQ(registry.size(), routes.size());

    nlohmann::json listing = registry.describe();
    ASSERT_TRUE(listing.is_array());
    EXPECT_EQ(listing.size(), routes.size());
    EXPECT_EQ(registry.resolve("image.compress")->option_defaults["quality"], 85);
    EXPECT_EQ(registry.resolve("download-video-batch")->min_inputs, 0u);
}
