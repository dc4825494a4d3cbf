//
// Created by Giuseppe Francione on 20/09/25.
//

#include "report_generator.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

static bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static double reduction_percent(const billpress::FileResult& r) {
    if (r.original_size_kb == 0 || r.output_path.empty()) return 0.0;
    return 100.0 * (1.0 - static_cast<double>(r.final_size_kb) / static_cast<double>(r.original_size_kb));
}

void print_console_report(const billpress::BatchReport& report, const double total_seconds) {
    const bool use_colors = is_stdout_a_tty();
    const unsigned term_width = get_terminal_width();

    size_t name_width = 4;
    for (const auto& r : report.details) {
        name_width = std::max(name_width, r.filename.size());
    }
    // keep room for " -> " and the status
    name_width = std::min<size_t>(name_width, term_width > 50 ? term_width - 40 : 20);

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cout << "\n";
    std::cout << (use_colors ? (report.failed_count == 0 ? GREEN : YELLOW) : "")
              << "OK files: " << report.success_count << "/" << report.total
              << (use_colors ? RESET : "") << "\n";
    std::cout << "ZIP size: " << report.archive_size_kb << " KB\n\n";

    for (const auto& r : report.details) {
        const char* color = "";
        if (use_colors) {
            color = r.succeeded ? GREEN : (r.output_path.empty() ? RED : YELLOW);
        }
        std::cout << std::left << std::setw(static_cast<int>(name_width)) << truncate(r.filename, name_width)
                  << " -> " << color << r.status_message << (use_colors ? RESET : "");
        if (!r.strategy.empty()) {
            std::cout << "  [" << r.strategy << "]";
        }
        std::cout << "\n";
    }

    std::cout << "\nOutput folder: " << report.output_dir.string() << "\n"
              << "ZIP archive: " << report.archive_path.string() << "\n"
              << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

bool export_csv_report(const billpress::BatchReport& report,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Before(KB),After(KB),Delta(%),Time(s),Result,Strategy,Status\n";

    for (const auto& r : report.details) {
        const std::string outcome = r.succeeded ? "OK" : (r.output_path.empty() ? "FAIL" : "TOO LARGE");

        std::ostringstream osspct;
        osspct << std::fixed << std::setprecision(2) << reduction_percent(r);
        std::ostringstream osstime;
        osstime << std::fixed << std::setprecision(2) << r.seconds;

        out << csv_escape(r.filename) << ","
            << r.original_size_kb << ","
            << r.final_size_kb << ","
            << osspct.str() << ","
            << osstime.str() << ","
            << csv_escape(outcome) << ","
            << csv_escape(r.strategy) << ","
            << csv_escape(r.status_message) << "\n";
    }

    out << "\n\nOK files,Total files,ZIP(KB),Total time,ZIP archive\n";
    out << report.success_count << "," << report.total << "," << report.archive_size_kb << ","
        << std::fixed << std::setprecision(2) << total_seconds << " seconds,"
        << csv_escape(report.archive_path.string()) << "\n";
    return static_cast<bool>(out);
}
