//
// Created by Giuseppe Francione on 20/09/25.
//

#include "../../include/file_scanner.hpp"
#include "../../include/file_kind.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace billpress {

bool is_junk(const fs::path& p) {
    const auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    const auto lower = to_lower_ascii(name);
    return lower == ".ds_store" || lower == "desktop.ini";
}

ScanResult scan_folder(const fs::path& folder) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        throw std::runtime_error("Not a directory: " + folder.string());
    }

    ScanResult result;
    fs::directory_iterator it(folder, ec);
    if (ec) {
        throw std::runtime_error("Cannot read " + folder.string() + ": " + ec.message());
    }

    for (const auto& e : it) {
        std::error_code ec2;
        if (!e.is_regular_file(ec2) || is_junk(e.path())) continue;
        if (kind_from_extension(e.path().extension().string()) == FileKind::Unsupported) {
            Logger::log(LogLevel::Debug, "Skipping " + e.path().filename().string(), "scanner");
            continue;
        }
        result.files.push_back(e.path());
        const auto size = e.file_size(ec2);
        if (!ec2) result.total_bytes += size;
    }

    std::ranges::sort(result.files, [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.files.size()) + " files (" +
                std::to_string(result.total_bytes / 1024) + " KB)",
                "scanner");
    return result;
}

} // namespace billpress
