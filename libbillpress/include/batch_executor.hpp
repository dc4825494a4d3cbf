//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file batch_executor.hpp
 * @brief Defines the orchestrator that runs a batch of invoice files.
 */

#ifndef BILLPRESS_BATCH_EXECUTOR_HPP
#define BILLPRESS_BATCH_EXECUTOR_HPP

#include "batch_report.hpp"
#include "compression_settings.hpp"
#include "event_bus.hpp"
#include "processor_registry.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace billpress {

/**
 * @brief Thrown for failures that stop the whole batch (output folder, archive).
 */
class BatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Called before each job with (1-based index, total, filename).
 */
using ProgressCallback = std::function<void(std::size_t current, std::size_t total, const std::string& filename)>;

/**
 * @brief "Error: " followed by at most @p limit bytes of @p message.
 *
 * The cut never splits a UTF-8 sequence.
 */
[[nodiscard]] std::string error_status(std::string_view message, std::size_t limit);

/**
 * @brief Runs jobs one after the other and bundles the outputs.
 *
 * @details For every input, in order: publish FileProcessStartEvent (and
 * call the progress callback), pick a processor by MIME type then extension,
 * compress into the output directory and record a FileResult. A job that
 * throws becomes a failed FileResult; it never aborts the batch. When all
 * jobs are done the output directory is zipped next to itself.
 *
 * Only the output directory and the archive are fatal: failures there throw
 * BatchError and no report is returned.
 */
class BatchExecutor {
public:
    /**
     * @param registry Processors to dispatch to.
     * @param settings Budget and tuning, copied.
     * @param bus Bus receiving the events of the run.
     */
    BatchExecutor(const ProcessorRegistry& registry, CompressionSettings settings, EventBus& bus);

    /**
     * @brief Classifies the inputs without touching them.
     *
     * Inputs no processor accepts are left out: they get no FileResult and
     * do not count as failures.
     */
    [[nodiscard]] std::vector<FileJob> plan(const std::vector<std::filesystem::path>& inputs) const;

    /**
     * @brief Processes @p inputs into the new directory @p output_dir.
     *
     * @param inputs Files to compress, in report order. Unsupported ones are skipped.
     * @param output_dir Must not exist yet; it is created, filled and zipped
     * into output_dir + ".zip".
     * @param on_progress Optional, invoked before each job.
     * @throws BatchError if the directory exists or cannot be created, or the
     * archive cannot be written.
     */
    BatchReport run(const std::vector<std::filesystem::path>& inputs,
                    const std::filesystem::path& output_dir,
                    const ProgressCallback& on_progress = {});

    /**
     * @brief Archive path for an output directory: a sibling "<dir>.zip".
     */
    [[nodiscard]] static std::filesystem::path archive_path_for(const std::filesystem::path& output_dir);

private:
    FileResult process_job(const FileJob& job, const std::filesystem::path& output_dir) const;

    std::filesystem::path output_path_for(const std::filesystem::path& source,
                                          const IProcessor& processor,
                                          const std::filesystem::path& output_dir) const;

    const ProcessorRegistry& registry_; ///< Processor lookup
    CompressionSettings settings_;      ///< Budget and tuning
    EventBus& event_bus_;               ///< Bus for publishing events
};

} // namespace billpress

#endif // BILLPRESS_BATCH_EXECUTOR_HPP
