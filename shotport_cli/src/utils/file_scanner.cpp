//
// Created by the shotport authors on 20/09/25.
//

#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libshotport/include/logger.hpp"
#include <algorithm>
#include <regex>
#include <type_traits>

namespace fs = std::filesystem;
using shotport::Logger;
using shotport::LogLevel;

static bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    return name == ".ds_store" || name == "desktop.ini";
}

namespace {
bool has_image_extension(const fs::path& p) {
    auto ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}

bool is_filtered(const fs::path& path, const Settings& settings) {
    const std::string path_str = path.string();

    for (const auto& pattern : settings.exclude_patterns) {
        try {
            if (std::regex_search(path_str, std::regex(pattern))) {
                return true;
            }
        } catch (const std::regex_error& e) {
            Logger::log(LogLevel::Warning, "Invalid exclude regex: " + pattern + " (" + e.what() + ")", "scanner");
        }
    }

    if (!settings.include_patterns.empty()) {
        for (const auto& pattern : settings.include_patterns) {
            try {
                if (std::regex_search(path_str, std::regex(pattern))) {
                    return false;
                }
            } catch (const std::regex_error& e) {
                Logger::log(LogLevel::Warning, "Invalid include regex: " + pattern + " (" + e.what() + ")", "scanner");
            }
        }
        return true;
    }

    return false;
}

bool same_dir(const fs::path& a, const fs::path& b) {
    if (b.empty()) return false;
    std::error_code ec;
    const bool eq = fs::equivalent(a, b, ec);
    return !ec && eq;
}

template <typename Iterator>
void walk(Iterator it, const Settings& settings, const fs::path& skip_dir, std::vector<fs::path>& out) {
    std::vector<fs::path> found;
    std::error_code ec;
    for (const auto end = Iterator(); it != end; ) {
        const auto& p = it->path();
        if (it->is_directory(ec)) {
            if constexpr (std::is_same_v<Iterator, fs::recursive_directory_iterator>) {
                if (same_dir(p, skip_dir)) it.disable_recursion_pending();
            }
        } else if (it->is_regular_file(ec) && has_image_extension(p) && !is_junk(p) && !is_filtered(p, settings)) {
            found.push_back(p);
        }
        ec.clear();
        it.increment(ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Directory scan stopped early: " + ec.message(), "scanner");
            break;
        }
    }
    std::sort(found.begin(), found.end());
    out.insert(out.end(), found.begin(), found.end());
}
} // namespace


std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs,
                    const Settings& settings,
                    const fs::path& skip_dir) {
    std::vector<fs::path> result;

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            if (settings.recursive()) {
                fs::recursive_directory_iterator it(in, fs::directory_options::skip_permission_denied, ec);
                if (!ec) walk(std::move(it), settings, skip_dir, result);
            } else {
                fs::directory_iterator it(in, fs::directory_options::skip_permission_denied, ec);
                if (!ec) walk(std::move(it), settings, skip_dir, result);
            }
            if (ec) {
                Logger::log(LogLevel::Error, "Cannot scan " + in.string() + ": " + ec.message(), "scanner");
            }
        } else if (fs::is_regular_file(in, ec) && !is_junk(in) && !is_filtered(in, settings)) {
            result.push_back(in);
        }
    }

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}

fs::path default_output_dir(const std::vector<fs::path>& inputs) {
    if (inputs.empty()) return "ios_output";
    const fs::path& first = inputs.front();
    std::error_code ec;
    if (fs::is_directory(first, ec)) {
        return first / "ios_output";
    }
    return first.parent_path() / "ios_output";
}
