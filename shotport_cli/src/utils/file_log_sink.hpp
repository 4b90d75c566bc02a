//
// Created by the shotport authors on 20/10/25.
//

#ifndef SHOTPORT_FILE_LOG_SINK_HPP
#define SHOTPORT_FILE_LOG_SINK_HPP

#include "../../../libshotport/include/log_sink.hpp"
#include "../../../libshotport/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>

/**
 * @brief Writes every log message, with a local timestamp, to a file.
 */
class FileLogSink final : public shotport::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const shotport::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &now);
#else
        localtime_r(&now, &tm);
#endif
        char stamp[20];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

        out_ << stamp << " [" << shotport::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
};

#endif // SHOTPORT_FILE_LOG_SINK_HPP
