//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef BILLPRESS_EVENTS_HPP
#define BILLPRESS_EVENTS_HPP

#include "batch_report.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace billpress {

/**
 * @brief Events published by the BatchExecutor.
 *
 * These lightweight structs are used with EventBus to notify subscribers
 * (CLI progress bar, public API observer) about progress and results.
 * They are simple data carriers without behavior.
 */

/**
 * @brief Emitted once the output directory exists and jobs are about to run.
 */
struct BatchStartEvent {
    std::filesystem::path output_dir; ///< Fresh directory receiving the outputs
    std::size_t total = 0;            ///< Number of jobs
};

/**
 * @brief Emitted before a job is processed.
 */
struct FileProcessStartEvent {
    std::filesystem::path path; ///< Path of the file about to be processed
    std::size_t index = 0;      ///< 1-based position in the batch
    std::size_t total = 0;      ///< Number of jobs
};

/**
 * @brief Emitted when a job produced an output, whether or not it fits.
 */
struct FileProcessCompleteEvent {
    std::filesystem::path path;            ///< Path of the processed file
    std::uintmax_t original_size = 0;      ///< Original file size in bytes
    std::uintmax_t new_size = 0;           ///< Output size in bytes
    bool within_target = false;            ///< True if the output fits the budget
    std::chrono::milliseconds duration{0}; ///< Processing duration
};

/**
 * @brief Emitted when a job could not produce an output.
 */
struct FileProcessErrorEvent {
    std::filesystem::path path; ///< Path of the file
    std::string error_message;  ///< Error description
};

/**
 * @brief Emitted after the ZIP archive has been written.
 */
struct ArchiveCompleteEvent {
    std::filesystem::path archive_path; ///< Path of the archive
    std::uintmax_t size = 0;            ///< Archive size in bytes
};

/**
 * @brief Emitted when the whole batch is done.
 */
struct BatchCompleteEvent {
    BatchReport report; ///< Final report
};

} // namespace billpress

#endif // BILLPRESS_EVENTS_HPP
