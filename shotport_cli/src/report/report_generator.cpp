//
// Created by the shotport authors on 20/09/25.
//

#include "report_generator.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

#ifdef _WIN32

#define NOMINMAX
#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
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

namespace {
std::string outcome_label(const Result& r) {
    switch (r.outcome) {
        case Outcome::Converted:
            if (!r.written) return "DRY-RUN";
            return r.warnings.empty() ? "OK" : "OK (warnings)";
        case Outcome::Failed:
            return r.partial_output ? "FAIL (partial)" : "FAIL";
        case Outcome::Skipped:
            return "SKIPPED";
    }
    return "";
}

const char* outcome_color(const Result& r) {
    switch (r.outcome) {
        case Outcome::Converted: return r.warnings.empty() ? "\033[1;32m" : "\033[1;33m";
        case Outcome::Failed:    return "\033[1;31m";
        case Outcome::Skipped:   return "\033[1;33m";
    }
    return "";
}

std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}
} // namespace

void print_console_report(const std::vector<Result>& results,
                          const unsigned num_threads,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_output = 12;
    size_t max_before = 12;
    size_t max_after = 12;
    size_t max_time = 10;
    size_t max_result = 16;
    for (const auto& r : results) {
        max_output = std::max(max_output, r.output.filename().string().size() + 2);
        max_before = std::max(max_before, std::to_string(r.size_before / 1024).size() + 2);
        max_after  = std::max(max_after,  std::to_string(r.size_after / 1024).size() + 2);
        max_time   = std::max(max_time,   fixed2(r.seconds).size() + 2);
    }

    const unsigned fixed_cols_width = static_cast<unsigned>(max_output + max_before + max_after +
                                                            max_time + max_result) + 7;

    const unsigned file_col_width = term_width > fixed_cols_width + 5
                                ? term_width - fixed_cols_width
                                : 10;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(file_col_width) << "File"
              << std::setw(max_output) << "Output"
              << std::setw(max_before) << "Before(KB)"
              << std::setw(max_after)  << "After(KB)"
              << std::setw(max_time)   << "Time(s)"
              << std::setw(max_result) << "Result"
              << "Detail"
              << "\n";

    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    size_t converted = 0, failed = 0, skipped = 0, with_warnings = 0;
    std::map<std::string, size_t> failures_by_kind;

    for (const auto& r : sorted) {
        switch (r.outcome) {
            case Outcome::Converted: ++converted; break;
            case Outcome::Failed:    ++failed; ++failures_by_kind[r.error_kind]; break;
            case Outcome::Skipped:   ++skipped; break;
        }
        if (!r.warnings.empty()) ++with_warnings;

        const std::string label = outcome_label(r);
        const std::string detail = r.outcome == Outcome::Converted ? join(r.warnings, "; ") : r.error_msg;

        std::cerr << std::left << std::setw(file_col_width) << truncate(r.path.filename().string(), file_col_width - 1)
                  << std::setw(max_output) << r.output.filename().string()
                  << std::setw(max_before) << (r.size_before / 1024)
                  << std::setw(max_after)  << (r.size_after / 1024)
                  << std::setw(max_time)   << fixed2(r.seconds);
        if (use_colors) {
            std::cerr << outcome_color(r) << std::setw(max_result) << label << "\033[0m";
        } else {
            std::cerr << std::setw(max_result) << label;
        }
        std::cerr << detail << "\n";
    }

    std::cerr << "\nConverted: " << converted
              << "  Failed: " << failed
              << "  Skipped: " << skipped
              << "  With warnings: " << with_warnings << "\n";
    if (failed > 0) {
        std::cerr << "Failures by kind:";
        for (const auto& [kind, count] : failures_by_kind) {
            std::cerr << " " << kind << "=" << count;
        }
        std::cerr << "\n";
        if (failures_by_kind.contains("metadata")) {
            std::cerr << "Metadata failures leave the PNG on disk without complete metadata; "
                         "check the exiftool installation.\n";
        }
    }
    std::cerr << "Total time: " << std::fixed << std::setprecision(2)
              << total_seconds << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Output,Before(KB),After(KB),Time(s),Result,ErrorKind,CarriedChunks,Warnings,Error\n";

    for (const auto& r : results) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.output.string()) << ","
            << (r.size_before / 1024) << ","
            << (r.size_after / 1024) << ","
            << fixed2(r.seconds) << ","
            << csv_escape(outcome_label(r)) << ","
            << csv_escape(r.error_kind) << ","
            << r.carried_chunks << ","
            << csv_escape(join(r.warnings, "; ")) << ","
            << csv_escape(r.outcome == Outcome::Converted ? std::string() : r.error_msg) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << std::fixed << std::setprecision(2) << total_seconds << " seconds\n";
    return static_cast<bool>(out);
}
