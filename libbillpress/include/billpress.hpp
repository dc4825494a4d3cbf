//
// Created by Giuseppe Francione on 09/12/25.
//

/**
 * @file billpress.hpp
 * @brief Public API for the billpress library.
 */

#ifndef BILLPRESS_HPP
#define BILLPRESS_HPP

#include "batch_executor.hpp"
#include "batch_report.hpp"
#include "compression_settings.hpp"
#include "progress_channel.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace billpress {

/**
 * @brief Interface for receiving progress and status events during execution.
 *
 * Callbacks run on the thread executing the batch, which is a background
 * thread for Billpress::start().
 */
struct BillpressObserver {
    virtual ~BillpressObserver() = default;

    virtual void onFileStart(const std::filesystem::path& path, std::size_t current, std::size_t total) {}

    virtual void onFileFinish(const std::filesystem::path& path,
                              std::uintmax_t size_before,
                              std::uintmax_t size_after,
                              bool within_target) {}

    virtual void onFileError(const std::filesystem::path& path,
                             const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/// Before job @c current of @c total starts.
struct BatchProgress {
    std::size_t current = 0;
    std::size_t total = 0;
    std::string filename;
};

/// The batch completed; always the last event of a successful run.
struct BatchFinished {
    BatchReport report;
};

/// The batch aborted on a batch-fatal error; always the last event of a failed run.
struct BatchFailed {
    std::string message;
};

using BatchEvent = std::variant<BatchProgress, BatchFinished, BatchFailed>;

/**
 * @brief Handle to a batch running on a background thread.
 *
 * Events arrive through next() in order; the channel is closed after
 * BatchFinished or BatchFailed. Destroying the task waits for the batch.
 */
class BatchTask {
public:
    BatchTask(std::shared_ptr<Channel<BatchEvent>> channel, std::jthread worker)
        : channel_(std::move(channel)), worker_(std::move(worker)) {}

    BatchTask(BatchTask&&) noexcept = default;
    BatchTask& operator=(BatchTask&&) noexcept = default;

    /// Blocks for the next event, std::nullopt after the last one.
    std::optional<BatchEvent> next() { return channel_->pop(); }

    /// Waits for the batch thread to finish.
    void wait() {
        if (worker_.joinable()) worker_.join();
    }

private:
    std::shared_ptr<Channel<BatchEvent>> channel_;
    std::jthread worker_;
};

/**
 * @brief Main interface for the billpress library.
 *
 * @details Scans a folder for invoices, compresses each one under the
 * configured budget into a fresh timestamped folder and zips it. Uses the
 * PIMPL idiom to hide internal dependencies. One batch at a time per
 * instance: run() or start() while a batch is in flight throws
 * std::logic_error.
 */
class Billpress {
public:
    Billpress();
    explicit Billpress(CompressionSettings settings);
    ~Billpress();

    Billpress(const Billpress&) = delete;
    Billpress& operator=(const Billpress&) = delete;
    Billpress(Billpress&&) noexcept;
    Billpress& operator=(Billpress&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Replace the settings used by the next batch.
     * @throws std::logic_error while a batch is running.
     */
    Billpress& settings(const CompressionSettings& settings);

    [[nodiscard]] const CompressionSettings& settings() const;

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(BillpressObserver* observer);

    // --- Execution ---

    /**
     * @brief Compresses every invoice in @p folder. Blocks until completion.
     * @throws BatchError on batch-fatal I/O, std::runtime_error if @p folder
     * cannot be scanned, std::logic_error if a batch is already running.
     */
    BatchReport run(const std::filesystem::path& folder, const ProgressCallback& on_progress = {});

    /**
     * @brief Compresses an explicit list of files into a new folder under @p output_parent.
     */
    BatchReport run(const std::vector<std::filesystem::path>& files,
                    const std::filesystem::path& output_parent,
                    const ProgressCallback& on_progress = {});

    /**
     * @brief Starts run(folder) on a background thread.
     * @throws std::logic_error if a batch is already running.
     */
    [[nodiscard]] BatchTask start(const std::filesystem::path& folder);

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief "<parent>/<prefix>_<YYYYMMDD_HHMMSS>" for a batch started at @p when.
     */
    [[nodiscard]] static std::filesystem::path output_dir_for(const std::filesystem::path& parent,
                                                              const std::string& prefix,
                                                              std::chrono::system_clock::time_point when);

    /**
     * @brief @p base, or "<base>_2", "<base>_3"... if a folder or archive of that name exists.
     */
    [[nodiscard]] static std::filesystem::path first_free_output_dir(const std::filesystem::path& base);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace billpress

#endif // BILLPRESS_HPP
