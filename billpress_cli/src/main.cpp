//
// Created by Giuseppe Francione on 18/09/25.
//

#include <iostream>
#include <filesystem>
#include <chrono>
#include <clocale>
#include <iomanip>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libbillpress/include/billpress.hpp"
#include "../../libbillpress/include/file_scanner.hpp"
#include "../../libbillpress/include/logger.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace billpress;
namespace fs = std::filesystem;

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

namespace {

/**
 * @brief Prints a line per finished file and advances the progress bar.
 */
class ConsoleObserver final : public BillpressObserver {
public:
    ConsoleObserver(const bool quiet, const std::chrono::steady_clock::time_point start)
        : quiet_(quiet), start_(start) {}

    void onFileStart(const fs::path&, const std::size_t, const std::size_t total) override {
        total_ = total;
    }

    void onFileFinish(const fs::path& path,
                      const std::uintmax_t size_before,
                      const std::uintmax_t size_after,
                      const bool within_target) override {
        if (!quiet_) {
            std::cerr << (within_target ? GREEN : YELLOW)
                      << "\n[DONE] " << path.filename().string()
                      << " (" << size_before << " -> " << size_after << " bytes)"
                      << (within_target ? " [OK]" : " [too large]")
                      << RESET << std::endl;
        }
        advance();
    }

    void onFileError(const fs::path& path, const std::string& error) override {
        Logger::log(LogLevel::Error, path.filename().string() + " " + error, "main");
        advance();
    }

private:
    void advance() {
        ++done_;
        if (quiet_) return;
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        print_progress_bar(done_, total_, elapsed);
    }

    bool quiet_;
    std::chrono::steady_clock::time_point start_;
    std::size_t done_ = 0;
    std::size_t total_ = 0;
};

// follows a background batch through its event channel
BatchReport drain(BatchTask& task, const bool quiet, const std::chrono::steady_clock::time_point start) {
    std::optional<BatchReport> report;
    std::string failure;

    while (auto event = task.next()) {
        std::visit([&](auto&& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, BatchProgress>) {
                if (!quiet) {
                    const double elapsed =
                        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
                    print_progress_bar(e.current - 1, e.total, elapsed);
                }
            } else if constexpr (std::is_same_v<T, BatchFinished>) {
                report = std::move(e.report);
            } else {
                failure = e.message;
            }
        }, *event);
    }
    task.wait();

    if (!report) {
        throw BatchError(failure.empty() ? "batch ended without a result" : failure);
    }
    if (!quiet) {
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        print_progress_bar(report->total, report->total, elapsed);
    }
    return std::move(*report);
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"billpress: compresses a folder of invoices under a per-file size budget and zips them."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    // set file logger
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }

    // set console logger
    if (!settings.quiet && settings.log_level != "NONE") {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    CompressionSettings compression;
    try {
        compression = settings.to_compression_settings();
    } catch (const std::invalid_argument& e) {
        std::cerr << RED << "Invalid settings: " << e.what() << RESET << std::endl;
        return 2;
    }

    ScanResult scan;
    try {
        scan = scan_folder(settings.folder);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << e.what() << RESET << std::endl;
        return 1;
    }

    if (!settings.quiet) {
        std::cout << scan.files.size() << " files found ("
                  << scan.total_bytes / kKiB << " KB total)" << std::endl;
    }
    if (scan.files.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    const auto start_total = std::chrono::steady_clock::now();
    Billpress billpress(compression);

    BatchReport report;
    try {
        if (settings.background) {
            auto task = billpress.start(settings.folder);
            report = drain(task, settings.quiet, start_total);
        } else {
            ConsoleObserver observer(settings.quiet, start_total);
            billpress.setObserver(&observer);
            report = billpress.run(settings.folder);
            billpress.setObserver(nullptr);
        }
    } catch (const std::exception& e) {
        std::cerr << RED << "\nBatch failed: " << e.what() << RESET << std::endl;
        return 1;
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        std::cerr << std::endl;
        print_console_report(report, total_seconds);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(report, settings.report_path, total_seconds)) {
            Logger::log(LogLevel::Error, "Cannot write report to " + settings.report_path.string(), "main");
        }
    }

    return 0;
}
