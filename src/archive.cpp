#include "archive.hpp"

#include <archive.h>           // Libarchive for reading archives
#include <archive_entry.h>     // Libarchive entry handling

#include <iostream>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Quiver {

namespace {

    struct ArchiveReadDeleter {
        void operator()(struct archive* a) const {
            archive_read_close(a);
            archive_read_free(a);
        }
    };

    struct ArchiveWriteDeleter {
        void operator()(struct archive* a) const {
            archive_write_close(a);
            archive_write_free(a);
        }
    };

    bool endsWith(const std::string& s, const std::string& suffix)
    {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    /**
     * Copies data blocks of the current entry from the reader to the disk writer.
     */
    int copyData(struct archive* ar, struct archive* aw)
    {
        const void* buff;
        size_t size;
        la_int64_t offset;

        while (true) {
            int r = archive_read_data_block(ar, &buff, &size, &offset);
            if (r == ARCHIVE_EOF) {
                return ARCHIVE_OK;
            }
            if (r == ARCHIVE_RETRY) {
                continue;
            }
            if (r != ARCHIVE_OK) {
                std::cerr << "archive_read_data_block error: "
                          << archive_error_string(ar) << "\n";
                return r;
            }
            if (archive_write_data_block(aw, buff, size, offset) < ARCHIVE_OK) {
                std::cerr << "archive_write_data_block error: "
                          << archive_error_string(aw) << "\n";
                return ARCHIVE_FATAL;
            }
        }
    }

} // end anonymous namespace

bool isArchiveFile(const std::string& path)
{
    static const char* const extensions[] = {
        ".tar", ".tar.gz", ".tgz", ".tar.bz2", ".tar.xz", ".zip"
    };
    for (const char* ext : extensions) {
        if (endsWith(path, ext)) {
            return true;
        }
    }
    return false;
}

bool extractArchive(const fs::path& archivePath, const fs::path& destDir)
{
    std::unique_ptr<struct archive, ArchiveReadDeleter> reader(archive_read_new());
    std::unique_ptr<struct archive, ArchiveWriteDeleter> writer(archive_write_disk_new());
    if (!reader || !writer) {
        std::cerr << "Error: archive_read_new or archive_write_disk_new failed.\n";
        return false;
    }

    // Preserve time and permissions; never follow entries out of destDir
    int extractFlags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                       ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                       ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (geteuid() == 0) {
        extractFlags |= ARCHIVE_EXTRACT_OWNER;
    }

    archive_read_support_filter_all(reader.get());
    archive_read_support_format_all(reader.get());
    archive_write_disk_set_options(writer.get(), extractFlags);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), archivePath.c_str(), 32768) != ARCHIVE_OK) {
        std::cerr << "Error opening archive '" << archivePath.string() << "': "
                  << archive_error_string(reader.get()) << "\n";
        return false;
    }

    std::error_code ec;
    fs::create_directories(destDir, ec);

    bool ok = true;
    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        std::string origPath = archive_entry_pathname(entry);
        fs::path relPath = fs::path(origPath).lexically_normal();
        if (relPath.is_absolute() || (!relPath.empty() && *relPath.begin() == "..")) {
            std::cerr << "Warning: Skipping unsafe archive entry: " << origPath << "\n";
            archive_read_data_skip(reader.get());
            continue;
        }

        fs::path fullDestPath = destDir / relPath;
        archive_entry_set_pathname(entry, fullDestPath.c_str());

        const char* hardlink = archive_entry_hardlink(entry);
        if (hardlink) {
            fs::path linkTarget = destDir / fs::path(hardlink).lexically_normal();
            archive_entry_set_hardlink(entry, linkTarget.c_str());
        }

        r = archive_write_header(writer.get(), entry);
        if (r < ARCHIVE_OK) {
            std::cerr << "Warning (archive_write_header for "
                      << fullDestPath.string() << "): "
                      << archive_error_string(writer.get()) << "\n";
            archive_read_data_skip(reader.get());
            if (r < ARCHIVE_WARN) {
                ok = false;
            }
            continue;
        }

        if (archive_entry_filetype(entry) == AE_IFREG && archive_entry_size(entry) > 0) {
            if (copyData(reader.get(), writer.get()) != ARCHIVE_OK) {
                std::cerr << "Error copying data for " << fullDestPath.string() << "\n";
                ok = false;
            }
        }

        r = archive_write_finish_entry(writer.get());
        if (r < ARCHIVE_WARN) {
            std::cerr << "Error finishing " << fullDestPath.string() << ": "
                      << archive_error_string(writer.get()) << "\n";
            ok = false;
        }
    }

    if (r != ARCHIVE_EOF) {
        std::cerr << "Error reading archive header: "
                  << archive_error_string(reader.get()) << "\n";
        ok = false;
    }
    return ok;
}

} // namespace Quiver
