#include "media/zip_archive.hpp"
#include "core/processing_outcome.hpp"
#include "logging/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    struct ArchiveReadDeleter
    {
        void operator()(archive *a) const { archive_read_free(a); }
    };
    struct ArchiveWriteDeleter
    {
        void operator()(archive *a) const { archive_write_free(a); }
    };
    using ArchiveReader = std::unique_ptr<archive, ArchiveReadDeleter>;
    using ArchiveWriter = std::unique_ptr<archive, ArchiveWriteDeleter>;

    std::string archiveError(archive *a)
    {
        const char *msg = archive_error_string(a);
        return msg != nullptr ? msg : "unknown libarchive error";
    }

    // Resolve an entry name below dest_dir, rejecting anything that escapes it
    bool resolveEntryPath(const std::string &entry_name, const fs::path &dest_dir, fs::path &out_path)
    {
        if (entry_name.empty() || entry_name.find('\0') != std::string::npos)
            return false;

        std::string s = entry_name;
        for (auto &c : s)
        {
            if (c == '\\')
                c = '/';
        }
        while (!s.empty() && s.front() == '/')
            s.erase(s.begin());
        if (s.empty())
            return false;

        fs::path normalized = (dest_dir / fs::path(s).relative_path()).lexically_normal();
        fs::path base = dest_dir.lexically_normal();
        fs::path rel = normalized.lexically_relative(base);
        if (rel.empty() || rel == "." || *rel.begin() == "..")
            return false;

        out_path = normalized;
        return true;
    }

    ArchiveWriter openZipWriter(const fs::path &out_path)
    {
        ArchiveWriter writer(archive_write_new());
        if (!writer)
            throw std::runtime_error("archive_write_new failed");
        if (archive_write_set_format_zip(writer.get()) != ARCHIVE_OK)
            throw std::runtime_error("cannot select zip format: " + archiveError(writer.get()));
        archive_write_set_format_option(writer.get(), "zip", "compression", "deflate");
        if (archive_write_open_filename(writer.get(), out_path.c_str()) != ARCHIVE_OK)
            throw std::runtime_error("cannot open " + out_path.string() + ": " + archiveError(writer.get()));
        return writer;
    }

    void writeMember(archive *writer, const std::string &name, const std::string &data)
    {
        archive_entry *entry = archive_entry_new();
        if (entry == nullptr)
            throw std::runtime_error("archive_entry_new failed");
        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));

        int r = archive_write_header(writer, entry);
        archive_entry_free(entry);
        if (r < ARCHIVE_WARN)
            throw std::runtime_error("archive_write_header failed for " + name + ": " + archiveError(writer));
        if (!data.empty() && archive_write_data(writer, data.data(), data.size()) < 0)
            throw std::runtime_error("archive_write_data failed for " + name + ": " + archiveError(writer));
    }

    // Create `dir` and any missing components between it and `base`, one level
    // at a time, so nothing is created once `base` has been removed
    void createBelow(const fs::path &base, const fs::path &dir)
    {
        fs::path current = base.empty() ? fs::path(".") : base;
        for (const auto &part : dir.lexically_relative(base))
        {
            current /= part;
            std::error_code ec;
            fs::create_directory(current, ec);
            if (ec)
                throw std::runtime_error("cannot create " + current.string() + ": " + ec.message());
        }
    }

    void throwIfCancelled(const CancellationToken *cancel)
    {
        if (cancel != nullptr && cancel->isCancelled())
            throw ProcessingError(FailureKind::Timeout, "processing cancelled");
    }

    std::string readFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw std::runtime_error("cannot read " + path.string());
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
}

std::vector<fs::path> ZipArchive::extract(const fs::path &archive_path, const fs::path &dest_dir,
                                          const CancellationToken *cancel)
{
    ArchiveReader reader(archive_read_new());
    if (!reader)
        throw std::runtime_error("archive_read_new failed");
    archive_read_support_filter_all(reader.get());
    archive_read_support_format_zip(reader.get());

    if (archive_read_open_filename(reader.get(), archive_path.c_str(), 10240) != ARCHIVE_OK)
    {
        throw ProcessingError(FailureKind::InvalidInput, "cannot open ZIP archive " + archive_path.filename().string(),
                              archiveError(reader.get()));
    }

    createBelow(dest_dir.parent_path(), dest_dir);

    std::vector<fs::path> extracted;
    uint64_t total_bytes = 0;
    size_t entries = 0;
    archive_entry *entry = nullptr;
    int r;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK)
    {
        throwIfCancelled(cancel);
        if (++entries > MAX_ENTRIES)
        {
            throw ProcessingError(FailureKind::InvalidInput, "ZIP archive has too many entries");
        }

        const char *name = archive_entry_pathname(entry);
        fs::path out_path;
        if (name == nullptr || archive_entry_filetype(entry) != AE_IFREG || !resolveEntryPath(name, dest_dir, out_path))
        {
            if (name != nullptr && archive_entry_filetype(entry) == AE_IFREG)
                Logger::warn("ZipArchive: skipping unsafe entry " + std::string(name));
            archive_read_data_skip(reader.get());
            continue;
        }

        createBelow(dest_dir.lexically_normal(), out_path.parent_path());
        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            throw std::runtime_error("cannot create " + out_path.string());
        }

        char buffer[64 * 1024];
        la_ssize_t n;
        while ((n = archive_read_data(reader.get(), buffer, sizeof(buffer))) > 0)
        {
            throwIfCancelled(cancel);
            total_bytes += static_cast<uint64_t>(n);
            if (total_bytes > MAX_EXTRACTED_BYTES)
            {
                throw ProcessingError(FailureKind::InvalidInput, "ZIP archive expands beyond the size limit");
            }
            out.write(buffer, n);
        }
        if (n < 0)
        {
            throw ProcessingError(FailureKind::InvalidInput, "corrupt ZIP member " + std::string(name),
                                  archiveError(reader.get()));
        }
        extracted.push_back(out_path);
    }
    if (r != ARCHIVE_EOF)
    {
        throw ProcessingError(FailureKind::InvalidInput, "corrupt ZIP archive " + archive_path.filename().string(),
                              archiveError(reader.get()));
    }

    Logger::debug("ZipArchive: extracted " + std::to_string(extracted.size()) + " files from " + archive_path.filename().string());
    return extracted;
}

void ZipArchive::create(const fs::path &out_path, const std::vector<std::pair<std::string, fs::path>> &entries)
{
    ArchiveWriter writer = openZipWriter(out_path);
    for (const auto &item : entries)
    {
        writeMember(writer.get(), item.first, readFile(item.second));
    }
    if (archive_write_close(writer.get()) != ARCHIVE_OK)
        throw std::runtime_error("archive_write_close failed: " + archiveError(writer.get()));
}

size_t ZipArchive::repack(const fs::path &src_path, const fs::path &dst_path, const EntryTransform &transform)
{
    ArchiveReader reader(archive_read_new());
    if (!reader)
        throw std::runtime_error("archive_read_new failed");
    archive_read_support_format_zip(reader.get());
    if (archive_read_open_filename(reader.get(), src_path.c_str(), 10240) != ARCHIVE_OK)
    {
        throw ProcessingError(FailureKind::InvalidInput, "cannot open " + src_path.filename().string() + " as a ZIP container",
                              archiveError(reader.get()));
    }

    ArchiveWriter writer = openZipWriter(dst_path);
    size_t rewritten = 0;
    size_t entries = 0;
    archive_entry *entry = nullptr;
    int r;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK)
    {
        if (++entries > MAX_ENTRIES)
            throw ProcessingError(FailureKind::InvalidInput, "container has too many members");
        if (archive_entry_filetype(entry) != AE_IFREG || archive_entry_pathname(entry) == nullptr)
        {
            archive_read_data_skip(reader.get());
            continue;
        }
        std::string name = archive_entry_pathname(entry);

        std::string data;
        char buffer[64 * 1024];
        la_ssize_t n;
        while ((n = archive_read_data(reader.get(), buffer, sizeof(buffer))) > 0)
        {
            data.append(buffer, static_cast<size_t>(n));
            if (data.size() > MAX_EXTRACTED_BYTES)
                throw ProcessingError(FailureKind::InvalidInput, "container member " + name + " is too large");
        }
        if (n < 0)
            throw ProcessingError(FailureKind::InvalidInput, "corrupt container member " + name, archiveError(reader.get()));

        if (transform && transform(name, data))
            ++rewritten;
        writeMember(writer.get(), name, data);
    }
    if (r != ARCHIVE_EOF)
        throw ProcessingError(FailureKind::InvalidInput, "corrupt container " + src_path.filename().string(), archiveError(reader.get()));
    if (archive_write_close(writer.get()) != ARCHIVE_OK)
        throw std::runtime_error("archive_write_close failed: " + archiveError(writer.get()));
    return rewritten;
}
