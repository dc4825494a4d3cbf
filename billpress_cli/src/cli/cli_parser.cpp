//
// Created by Giuseppe Francione on 20/09/25.
//

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <filesystem>

billpress::CompressionSettings Settings::to_compression_settings() const {
    billpress::CompressionSettings cs;
    cs.target = billpress::CompressionTarget(max_size_kb * billpress::kKiB);

    cs.image_ladder.min_quality = min_quality;
    cs.image_ladder.min_scale = min_scale;
    cs.pdf_ladder.min_quality = pdf_min_quality;
    cs.pdf_ladder.min_scale = min_scale;

    const auto policy = smallest ? billpress::BestResultPolicy::Smallest : billpress::BestResultPolicy::Latest;
    cs.image_ladder.policy = policy;
    cs.pdf_ladder.policy = policy;

    cs.output_parent = output_parent;
    cs.output_prefix = prefix;
    return cs;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_flag("--smallest", settings.smallest,
                 "When no setting fits, keep the smallest attempt instead of the last one.");

    app.add_flag("--background", settings.background,
                 "Run the batch on a worker thread and follow it through its event channel.");

    // --- Budget and ladder ---
    app.add_option("--max-size", settings.max_size_kb,
                   "Per-file size budget in KB.")
                   ->default_val(settings.max_size_kb)
                   ->check(CLI::PositiveNumber);

    app.add_option("--min-quality", settings.min_quality,
                   "Lowest JPEG quality tried for image files.")
                   ->default_val(settings.min_quality)
                   ->check(CLI::Range(1, 100));

    app.add_option("--pdf-min-quality", settings.pdf_min_quality,
                   "Lowest JPEG quality tried inside PDFs.")
                   ->default_val(settings.pdf_min_quality)
                   ->check(CLI::Range(1, 100));

    app.add_option("--min-scale", settings.min_scale,
                   "Lowest resize factor tried (0.1 - 1.0).")
                   ->default_val(settings.min_scale)
                   ->check(CLI::Range(0.1, 1.0));

    // --- Output ---
    app.add_option("-o,--output-parent", settings.output_parent,
                   "Create the output folder and ZIP under PATH instead of next to the input folder.")
                   ->check(CLI::ExistingDirectory);

    app.add_option("--prefix", settings.prefix,
                   "Name prefix of the timestamped output folder.")
                   ->default_val(settings.prefix);

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    // --- Logging ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("folder", settings.folder, "Folder containing the invoices (PDF, PNG, JPEG).")
        ->required()
        ->check(CLI::ExistingDirectory);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.prefix.empty() ||
            settings.prefix.find_first_of("/\\") != std::string::npos) {
            throw CLI::ValidationError("--prefix must be a plain, non-empty folder name.");
        }
        if (!settings.report_path.empty() && std::filesystem::is_directory(settings.report_path)) {
            throw CLI::ValidationError("--report must name a file, not a directory.");
        }
    });
}
