#include "test_base.hpp"
#include "core/processing_outcome.hpp"
#include "media/zip_archive.hpp"

namespace fs = std::filesystem;

class ZipArchiveTest : public TestBase
{
protected:
    static std::string readAll(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
};

TEST_F(ZipArchiveTest, CreateThenExtractPreservesContents)
{
    fs::path a = writeFile("src/a.txt", "alpha");
    fs::path b = writeFile("src/b.bin", std::string("\x00\x01\x02", 3));
    fs::path zip = test_dir_ / "bundle.zip";

    ZipArchive::create(zip, {{"a.txt", a}, {"nested/b.bin", b}});
    ASSERT_TRUE(fs::exists(zip));

    fs::path dest = test_dir_ / "out";
    auto files = ZipArchive::extract(zip, dest);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(readAll(dest / "a.txt"), "alpha");
    EXPECT_EQ(readAll(dest / "nested" / "b.bin"), std::string("\x00\x01\x02", 3));
}

TEST_F(ZipArchiveTest, TraversalEntriesAreSkipped)
{
    fs::path payload = writeFile("payload.txt", "owned");
    fs::path zip = test_dir_ / "evil.zip";
    ZipArchive::create(zip, {{"../escape.txt", payload},
                             {"dir/../../escape2.txt", payload},
                             {"safe.txt", payload}});

    fs::create_directory(test_dir_ / "extract");
    fs::path dest = test_dir_ / "extract" / "here";
    auto files = ZipArchive::extract(zip, dest);

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename(), "safe.txt");
    EXPECT_FALSE(fs::exists(test_dir_ / "extract" / "escape.txt"));
    EXPECT_FALSE(fs::exists(test_dir_ / "escape2.txt"));
}

TEST_F(ZipArchiveTest, AbsoluteEntriesStayInsideDestination)
{
    fs::path payload = writeFile("payload.txt", "data");
    fs::path zip = test_dir_ / "abs.zip";
    ZipArchive::create(zip, {{"/etc/passwd_copy", payload}});

    fs::path dest = test_dir_ / "dest";
    auto files = ZipArchive::extract(zip, dest);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], dest / "etc" / "passwd_copy");
}

TEST_F(ZipArchiveTest, GarbageIsInvalidInput)
{
    fs::path bogus = writeFile("bogus.zip", "this is not a zip archive at all");
    try
    {
        ZipArchive::extract(bogus, test_dir_ / "dest");
        FAIL() << "expected ProcessingError";
    }
    catch (const ProcessingError &e)
    {
        EXPECT_EQ(e.kind(), FailureKind::InvalidInput);
    }
}

TEST_F(ZipArchiveTest, CancelledExtractionStopsBeforeWriting)
{
    fs::path a = writeFile("a.txt", "alpha");
    fs::path zip = test_dir_ / "batch.zip";
    ZipArchive::create(zip, {{"a.txt", a}, {"b.txt", a}});

    CancellationToken token;
    token.cancel();
    fs::path dest = test_dir_ / "dest";
    try
    {
        ZipArchive::extract(zip, dest, &token);
        FAIL() << "expected ProcessingError";
    }
    catch (const ProcessingError &e)
    {
        EXPECT_EQ(e.kind(), FailureKind::Timeout);
    }
    EXPECT_EQ(countEntries(dest), 0u);
}

TEST_F(ZipArchiveTest, RemovedParentIsNotRecreated)
{
    fs::path a = writeFile("a.txt", "alpha");
    fs::path zip = test_dir_ / "batch.zip";
    ZipArchive::create(zip, {{"nested/a.txt", a}});

    fs::path gone = test_dir_ / "released";
    EXPECT_THROW(ZipArchive::extract(zip, gone / "work" / "unzip_0"), std::exception);
    EXPECT_FALSE(fs::exists(gone));
}

TEST_F(ZipArchiveTest, RepackRewritesSelectedMembers)
{
    fs::path doc = writeFile("doc.xml", "<doc/>");
    fs::path img = writeFile("image1.png", "BIGIMAGEDATA");
    fs::path src = test_dir_ / "in.docx";
    ZipArchive::create(src, {{"word/document.xml", doc}, {"word/media/image1.png", img}});

    fs::path dst = test_dir_ / "out.docx";
    size_t rewritten = ZipArchive::repack(src, dst, [](const std::string &name, std::string &data)
                                          {
        if (name.rfind("word/media/", 0) != 0)
            return false;
        data = "small";
        return true; });
    EXPECT_EQ(rewritten, 1u);

    fs::path dest = test_dir_ / "check";
    ZipArchive::extract(dst, dest);
    EXPECT_EQ(readAll(dest / "word" / "document.xml"), "<doc/>");
    EXPECT_EQ(readAll(dest / "word" / "media" / "image1.png"), "small");
}
