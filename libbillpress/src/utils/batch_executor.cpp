//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/batch_executor.hpp"
#include "../../include/archive_writer.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <chrono>
#include <utility>

namespace fs = std::filesystem;

namespace billpress {

namespace {

std::string ok_status(const std::uintmax_t kb) {
    return "OK (" + std::to_string(kb) + " KB)";
}

std::string too_large_status(const std::uintmax_t kb) {
    return "Too large (" + std::to_string(kb) + " KB)";
}

void remove_partial_output(const fs::path& p) {
    std::error_code ec;
    if (!p.empty() && fs::exists(p, ec)) {
        fs::remove(p, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Failed to remove partial output: " + p.string(), "Executor");
        }
    }
}

} // namespace

std::string error_status(const std::string_view message, const std::size_t limit) {
    std::size_t cut = std::min(limit, message.size());
    // back off to a UTF-8 lead byte
    while (cut > 0 && cut < message.size() &&
           (static_cast<unsigned char>(message[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return "Error: " + std::string(message.substr(0, cut));
}

BatchExecutor::BatchExecutor(const ProcessorRegistry& registry, CompressionSettings settings, EventBus& bus)
    : registry_(registry),
      settings_(std::move(settings)),
      event_bus_(bus) {}

fs::path BatchExecutor::archive_path_for(const fs::path& output_dir) {
    fs::path zip = output_dir;
    if (!zip.has_filename()) zip = zip.parent_path();
    zip += ".zip";
    return zip;
}

std::vector<FileJob> BatchExecutor::plan(const std::vector<fs::path>& inputs) const {
    std::vector<FileJob> jobs;
    jobs.reserve(inputs.size());
    for (const auto& p : inputs) {
        const IProcessor* proc = registry_.resolve(p);
        if (!proc) {
            Logger::log(LogLevel::Info, "Skipping unsupported file " + p.filename().string(), "Executor");
            continue;
        }
        jobs.push_back(FileJob{p, proc->kind()});
    }
    return jobs;
}

BatchReport BatchExecutor::run(const std::vector<fs::path>& inputs,
                               const fs::path& output_dir,
                               const ProgressCallback& on_progress) {
    std::error_code ec;
    if (fs::exists(output_dir, ec)) {
        throw BatchError("Output directory already exists: " + output_dir.string());
    }
    if (output_dir.has_parent_path()) {
        fs::create_directories(output_dir.parent_path(), ec);
    }
    if (ec || !fs::create_directory(output_dir, ec) || ec) {
        Logger::log(LogLevel::Error, "Failed to create output directory: " + output_dir.string(), "Executor");
        throw BatchError("Cannot create output directory " + output_dir.string() +
                         (ec ? ": " + ec.message() : std::string{}));
    }

    const auto jobs = plan(inputs);
    BatchReport report;
    report.total = jobs.size();
    report.output_dir = output_dir;
    report.details.reserve(jobs.size());

    event_bus_.publish(BatchStartEvent{output_dir, jobs.size()});

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        const auto& job = jobs[i];
        const std::string filename = job.source_path.filename().string();

        event_bus_.publish(FileProcessStartEvent{job.source_path, i + 1, jobs.size()});
        if (on_progress) {
            on_progress(i + 1, jobs.size(), filename);
        }

        FileResult result = process_job(job, output_dir);
        if (result.succeeded) {
            ++report.success_count;
        } else {
            ++report.failed_count;
        }
        report.details.push_back(std::move(result));
    }

    report.archive_path = archive_path_for(output_dir);
    try {
        const auto zip_size = write_zip_archive(output_dir, report.archive_path);
        report.archive_size_kb = zip_size / 1024;
        event_bus_.publish(ArchiveCompleteEvent{report.archive_path, zip_size});
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Archive creation failed: ") + e.what(), "Executor");
        throw BatchError(std::string("Cannot write archive: ") + e.what());
    }

    Logger::log(LogLevel::Info,
                "Batch done: " + std::to_string(report.success_count) + "/" + std::to_string(report.total) +
                " within budget",
                "Executor");
    event_bus_.publish(BatchCompleteEvent{report});
    return report;
}

FileResult BatchExecutor::process_job(const FileJob& job, const fs::path& output_dir) const {
    FileResult result;
    result.filename = job.source_path.filename().string();

    std::error_code ec;
    const auto original_size = fs::file_size(job.source_path, ec);
    result.original_size_kb = ec ? 0 : original_size / 1024;

    IProcessor* processor = registry_.resolve(job.source_path);
    if (!processor) {
        // the file changed since plan()
        Logger::log(LogLevel::Warning, "no processor for " + job.source_path.string(), "Executor");
        result.status_message = "Unsupported format";
        event_bus_.publish(FileProcessErrorEvent{job.source_path, result.status_message});
        return result;
    }

    const fs::path out = output_path_for(job.source_path, *processor, output_dir);
    const auto start = std::chrono::steady_clock::now();
    try {
        Logger::log(LogLevel::Info,
                    "Processing " + result.filename + " with " + std::string(processor->get_name()),
                    "Executor");
        const ProcessOutcome outcome = processor->process(job.source_path, out, settings_);

        const auto elapsed = std::chrono::steady_clock::now() - start;
        result.seconds = std::chrono::duration<double>(elapsed).count();
        result.output_path = outcome.output_path;
        result.final_size_kb = file_size_kb(outcome.output_path);
        result.strategy = outcome.strategy;
        result.succeeded = settings_.target.fits(fs::file_size(outcome.output_path));
        result.status_message = result.succeeded ? ok_status(result.final_size_kb)
                                                 : too_large_status(result.final_size_kb);

        event_bus_.publish(FileProcessCompleteEvent{
            job.source_path, original_size, outcome.output_size, result.succeeded,
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)});
    } catch (const std::exception& e) {
        result.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        Logger::log(LogLevel::Error, "Failed to process " + job.source_path.string() + ": " + e.what(), "Executor");
        remove_partial_output(out);
        result.succeeded = false;
        result.output_path.clear();
        result.final_size_kb = 0;
        result.status_message = error_status(e.what(), settings_.error_message_limit);
        event_bus_.publish(FileProcessErrorEvent{job.source_path, e.what()});
    }
    return result;
}

fs::path BatchExecutor::output_path_for(const fs::path& source,
                                        const IProcessor& processor,
                                        const fs::path& output_dir) const {
    const std::string stem = source.stem().string();
    const std::string ext(processor.output_extension());
    fs::path candidate = output_dir / (stem + ext);

    // a.png and a.jpg would both become a.jpg
    std::error_code ec;
    for (int n = 2; fs::exists(candidate, ec); ++n) {
        candidate = output_dir / (stem + "_" + std::to_string(n) + ext);
    }
    return candidate;
}

} // namespace billpress
