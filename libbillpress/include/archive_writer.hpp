//
// Created by Giuseppe Francione on 21/01/26.
//

/**
 * @file archive_writer.hpp
 * @brief Bundles an output folder into a flat ZIP archive with libarchive.
 */

#ifndef BILLPRESS_ARCHIVE_WRITER_HPP
#define BILLPRESS_ARCHIVE_WRITER_HPP

#include <cstdint>
#include <filesystem>

namespace billpress {

/**
 * @brief Writes every regular file directly inside @p src_dir into @p zip_path.
 *
 * Entries are named after the files (no directory part), sorted by name and
 * DEFLATE-compressed at level 9. Subdirectories are ignored.
 *
 * @return Size of the written archive in bytes.
 * @throws std::runtime_error on any libarchive or filesystem failure.
 */
std::uintmax_t write_zip_archive(const std::filesystem::path& src_dir, const std::filesystem::path& zip_path);

} // namespace billpress

#endif // BILLPRESS_ARCHIVE_WRITER_HPP
