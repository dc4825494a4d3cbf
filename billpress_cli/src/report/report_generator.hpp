//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef BILLPRESS_REPORT_GENERATOR_HPP
#define BILLPRESS_REPORT_GENERATOR_HPP

#include <filesystem>
#include "../../../libbillpress/include/batch_report.hpp"

/**
 * @brief Prints the result pane: totals, one "filename -> status" line per
 * file, then the output folder and ZIP path.
 */
void print_console_report(const billpress::BatchReport& report, double total_seconds);

/**
 * @brief Writes the per-file results as CSV.
 * @return false if @p output_path could not be opened.
 */
bool export_csv_report(const billpress::BatchReport& report,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

#endif //BILLPRESS_REPORT_GENERATOR_HPP
