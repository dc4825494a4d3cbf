//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef BILLPRESS_CLI_PARSER_HPP
#define BILLPRESS_CLI_PARSER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include "../../../libbillpress/include/compression_settings.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool quiet = false;
    bool smallest = false;
    bool background = false;

    std::size_t max_size_kb = 200;
    int min_quality = 25;
    int pdf_min_quality = 20;
    double min_scale = 0.3;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path report_path;
    std::filesystem::path output_parent;
    std::string prefix = "compressed_invoices";

    std::filesystem::path folder;

    /// Library settings for the parsed options.
    [[nodiscard]] billpress::CompressionSettings to_compression_settings() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //BILLPRESS_CLI_PARSER_HPP
