//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef BILLPRESS_FILE_SCANNER_HPP
#define BILLPRESS_FILE_SCANNER_HPP

#include <cstdint>
#include <filesystem>
#include <vector>

namespace billpress {

/**
 * @brief Invoice files found in a folder.
 */
struct ScanResult {
    std::vector<std::filesystem::path> files; ///< sorted by filename
    std::uintmax_t total_bytes = 0;           ///< sum of the files' sizes
};

/**
 * @brief True for OS droppings such as .DS_Store, desktop.ini and AppleDouble "._" files.
 */
[[nodiscard]] bool is_junk(const std::filesystem::path& p);

/**
 * @brief Lists the PDF/PNG/JPEG files directly inside @p folder.
 *
 * Extensions are matched case-insensitively, subdirectories are not
 * entered and junk files are skipped.
 *
 * @throws std::runtime_error if @p folder is not a readable directory.
 */
[[nodiscard]] ScanResult scan_folder(const std::filesystem::path& folder);

} // namespace billpress

#endif //BILLPRESS_FILE_SCANNER_HPP
