//
// Created by Giuseppe Francione on 21/01/26.
//

#include "../../include/archive_writer.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace billpress {

namespace {

struct ArchiveWriteDeleter {
    void operator()(archive* a) const noexcept { archive_write_free(a); }
};

struct EntryDeleter {
    void operator()(archive_entry* e) const noexcept { archive_entry_free(e); }
};

using ArchivePtr = std::unique_ptr<archive, ArchiveWriteDeleter>;
using EntryPtr = std::unique_ptr<archive_entry, EntryDeleter>;

std::string error_of(archive* a) {
    const char* err = archive_error_string(a);
    return err ? err : "unknown libarchive error";
}

// ARCHIVE_WARN is logged, anything worse throws
void check(archive* a, const int r, const std::string& what) {
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + what + ": " + error_of(a), "archive_writer");
        return;
    }
    if (r != ARCHIVE_OK) {
        throw std::runtime_error(what + ": " + error_of(a));
    }
}

} // namespace

std::uintmax_t write_zip_archive(const fs::path& src_dir, const fs::path& zip_path) {
    std::vector<fs::path> files;
    for (const auto& e : fs::directory_iterator(src_dir)) {
        if (e.is_regular_file()) files.push_back(e.path());
    }
    std::ranges::sort(files, [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    const ArchivePtr a(archive_write_new());
    if (!a) throw std::runtime_error("archive_write_new failed");

    check(a.get(), archive_write_set_format_zip(a.get()), "archive_write_set_format_zip");
    check(a.get(), archive_write_set_format_option(a.get(), "zip", "compression", "deflate"), "zip compression");
    check(a.get(), archive_write_set_format_option(a.get(), "zip", "compression-level", "9"), "zip compression-level");
    check(a.get(), archive_write_open_filename(a.get(), zip_path.string().c_str()), "archive_write_open_filename");

    for (const auto& p : files) {
        const auto data = read_file_bytes(p);
        const std::string name = p.filename().string();

        const EntryPtr entry(archive_entry_new());
        if (!entry) throw std::runtime_error("archive_entry_new failed");
        archive_entry_set_pathname(entry.get(), name.c_str());
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));

        check(a.get(), archive_write_header(a.get(), entry.get()), "archive_write_header " + name);
        if (!data.empty()) {
            const la_ssize_t wrote = archive_write_data(a.get(), data.data(), data.size());
            if (wrote < 0) {
                throw std::runtime_error("archive_write_data " + name + ": " + error_of(a.get()));
            }
        }
        Logger::log(LogLevel::Debug, "Added " + name + " (" + std::to_string(data.size()) + " bytes)", "archive_writer");
    }

    check(a.get(), archive_write_close(a.get()), "archive_write_close");

    const auto size = fs::file_size(zip_path);
    Logger::log(LogLevel::Info,
                "Wrote " + zip_path.filename().string() + " with " + std::to_string(files.size()) +
                " entries (" + std::to_string(size / 1024) + " KB)",
                "archive_writer");
    return size;
}

} // namespace billpress
