//
// Created by Giuseppe Francione on 22/01/26.
//

/**
 * @file batch_report.hpp
 * @brief Jobs and results of a batch run.
 */

#ifndef BILLPRESS_BATCH_REPORT_HPP
#define BILLPRESS_BATCH_REPORT_HPP

#include "file_kind.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace billpress {

/**
 * @brief One input file and the kind it was dispatched as.
 */
struct FileJob {
    std::filesystem::path source_path;
    FileKind detected_kind = FileKind::Unsupported;
};

/**
 * @brief Outcome of one job, in the order the jobs were given.
 */
struct FileResult {
    std::string filename;               ///< source filename, no directory
    bool succeeded = false;             ///< an output exists and fits the budget
    std::uintmax_t original_size_kb = 0;
    std::uintmax_t final_size_kb = 0;   ///< size of the output on disk, 0 if none was written
    std::string status_message;         ///< "OK (n KB)", "Too large (n KB)" or "Error: ..."
    std::filesystem::path output_path;  ///< empty if no output was written
    std::string strategy;               ///< how the output was produced
    double seconds = 0.0;               ///< processing time
};

/**
 * @brief Everything a finished batch hands back to its caller.
 */
struct BatchReport {
    std::size_t total = 0;
    std::size_t success_count = 0;
    std::size_t failed_count = 0;
    std::vector<FileResult> details;
    std::uintmax_t archive_size_kb = 0;
    std::filesystem::path output_dir;
    std::filesystem::path archive_path;
};

} // namespace billpress

#endif // BILLPRESS_BATCH_REPORT_HPP
