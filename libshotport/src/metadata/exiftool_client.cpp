//
// Created by the shotport authors on 07/11/25.
//

#include "../../include/exiftool_client.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace shotport {

    namespace {

        // exit status of a shell-less spawn whose exec failed on old glibc
        constexpr int kExecFailedStatus = 127;

        std::string first_line(const std::string& s) {
            const auto start = s.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) return {};
            const auto end = s.find_first_of("\r\n", start);
            return s.substr(start, end == std::string::npos ? std::string::npos : end - start);
        }

    } // namespace

    ExifToolClient::ExifToolClient(std::string executable) : executable_(std::move(executable)) {}

    std::vector<std::string> ExifToolClient::copy_command(const std::filesystem::path& source,
                                                          const std::filesystem::path& target) const {
        return {
            executable_,
            "-overwrite_original",
            "-tagsFromFile", source.string(),
            "-all:all",
            "-unsafe",
            target.string()
        };
    }

    std::vector<std::string> ExifToolClient::read_command(const std::filesystem::path& source,
                                                          const std::string_view tag) const {
        return {executable_, "-s3", "-" + std::string(tag) + "#", source.string()};
    }

    std::vector<std::string> ExifToolClient::set_command(const std::filesystem::path& target,
                                                         const MetadataTagSet& tags,
                                                         const TagWriteMode mode) const {
        std::vector<std::string> argv{executable_, "-overwrite_original"};
        if (mode == TagWriteMode::CreateOnly) {
            argv.emplace_back("-wm");
            argv.emplace_back("cg");
        }
        for (const auto& [name, value] : tags) {
            argv.push_back("-" + name + "#=" + value);
        }
        argv.push_back(target.string());
        return argv;
    }

    bool ExifToolClient::run_succeeded(const ProcessResult& result) {
        if (result.exit_code == 0) return true;
        if (result.output.find("Error:") != std::string::npos) return false;
        return result.output.find("No writable tags") != std::string::npos ||
               result.output.find("unchanged") != std::string::npos;
    }

    std::optional<std::string> ExifToolClient::parse_tag_value(const ProcessResult& result) {
        const auto error = result.output.find("Error:");
        if (error != std::string::npos) {
            throw MetadataWriteError("read tag failed: " + first_line(result.output.substr(error)));
        }
        std::size_t pos = 0;
        while (pos < result.output.size()) {
            const auto end = result.output.find('\n', pos);
            const std::string line = first_line(result.output.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
            if (!line.empty() && line.rfind("Warning:", 0) != 0) return line;
            if (end == std::string::npos) break;
            pos = end + 1;
        }
        return std::nullopt;
    }

    void ExifToolClient::run_checked(const std::vector<std::string>& argv, const std::string_view operation) const {
        ProcessResult result;
        try {
            result = run_process(argv);
        } catch (const std::system_error& e) {
            throw MetadataWriteError(std::string(operation) + ": cannot run " + executable_ + ": " + e.what());
        }

        if (result.exit_code == kExecFailedStatus && result.output.empty()) {
            throw MetadataWriteError(std::string(operation) + ": " + executable_ + " not found");
        }
        if (!run_succeeded(result)) {
            throw MetadataWriteError(std::string(operation) + " failed (exit " + std::to_string(result.exit_code) +
                                     "): " + first_line(result.output));
        }
        if (result.exit_code != 0) {
            Logger::log(LogLevel::Debug, std::string(operation) + ": nothing written: " + first_line(result.output),
                        "exiftool");
        }
    }

    void ExifToolClient::copy_all_tags(const std::filesystem::path& source, const std::filesystem::path& target) const {
        run_checked(copy_command(source, target), "copy tags");
    }

    std::optional<std::string> ExifToolClient::read_tag(const std::filesystem::path& source,
                                                        const std::string_view tag) const {
        ProcessResult result;
        try {
            result = run_process(read_command(source, tag));
        } catch (const std::system_error& e) {
            throw MetadataWriteError("read tag: cannot run " + executable_ + ": " + e.what());
        }
        if (result.exit_code == kExecFailedStatus && result.output.empty()) {
            throw MetadataWriteError("read tag: " + executable_ + " not found");
        }
        return parse_tag_value(result);
    }

    void ExifToolClient::set_tags(const std::filesystem::path& target, const MetadataTagSet& tags,
                                  const TagWriteMode mode) const {
        if (tags.empty()) return;
        run_checked(set_command(target, tags, mode), mode == TagWriteMode::CreateOnly ? "fill tags" : "set tags");
    }

    std::string ExifToolClient::version() const {
        ProcessResult result;
        try {
            result = run_process({executable_, "-ver"});
        } catch (const std::system_error& e) {
            throw MetadataWriteError("cannot run " + executable_ + ": " + e.what());
        }
        if (result.exit_code != 0) {
            throw MetadataWriteError(executable_ + " -ver exited with " + std::to_string(result.exit_code));
        }
        return first_line(result.output);
    }

    bool ExifToolClient::is_available() const noexcept {
        try {
            const std::string v = version();
            Logger::log(LogLevel::Debug, "exiftool version " + v, "exiftool");
            return !v.empty();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Debug, e.what(), "exiftool");
            return false;
        }
    }

} // namespace shotport
