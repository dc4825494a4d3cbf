//
// Created by Giuseppe Francione on 16/01/26.
//

/**
 * @file file_kind.hpp
 * @brief Classification of batch inputs by extension.
 */

#ifndef BILLPRESS_FILE_KIND_HPP
#define BILLPRESS_FILE_KIND_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <unordered_map>

namespace billpress {

/**
 * @brief What the batch executor does with an input file.
 */
enum class FileKind {
    Pdf,
    Image,
    Unsupported
};

/// Lowercase extensions (with the dot) and the kind of job they become.
inline const std::unordered_map<std::string, FileKind> ext_to_kind = {
    { ".pdf",  FileKind::Pdf },
    { ".png",  FileKind::Image },
    { ".jpg",  FileKind::Image },
    { ".jpeg", FileKind::Image },
};

[[nodiscard]] inline std::string to_lower_ascii(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

/**
 * @brief Kind for an extension, compared case-insensitively.
 */
[[nodiscard]] inline FileKind kind_from_extension(const std::string& ext) {
    const auto it = ext_to_kind.find(to_lower_ascii(ext));
    return it != ext_to_kind.end() ? it->second : FileKind::Unsupported;
}

[[nodiscard]] inline std::string_view to_string(const FileKind kind) noexcept {
    switch (kind) {
        case FileKind::Pdf:         return "PDF";
        case FileKind::Image:       return "Image";
        case FileKind::Unsupported: return "Unsupported";
    }
    return "Unsupported";
}

} // namespace billpress

#endif // BILLPRESS_FILE_KIND_HPP
