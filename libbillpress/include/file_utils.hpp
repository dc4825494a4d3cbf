//
// Created by Giuseppe Francione on 12/01/26.
//

#ifndef BILLPRESS_FILE_UTILS_HPP
#define BILLPRESS_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace billpress {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<unsigned char> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Writes a buffer to a file, truncating it.
     * @throws std::runtime_error if the file cannot be created or fully written.
     */
    void write_file_bytes(const std::filesystem::path &path, std::span<const unsigned char> data);

    /**
     * @brief Size of a file in whole KiB (rounded down), 0 if it does not exist.
     */
    std::uintmax_t file_size_kb(const std::filesystem::path &path);

} // namespace billpress

#endif // BILLPRESS_FILE_UTILS_HPP
