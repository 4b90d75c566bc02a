//
// Created by the shotport authors on 20/10/25.
//

#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>

namespace shotport {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        if (sink->accepts(level)) {
            sink->log(level, msg, tag);
        }
    }
}

bool Logger::enabled(const LogLevel level) {
    std::lock_guard lock(mtx_);
    return std::ranges::any_of(sinks_, [level](const auto& sink) { return sink->accepts(level); });
}

LogLevel Logger::string_to_level(const std::string_view level) {
    std::string up(level);
    std::transform(up.begin(), up.end(), up.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG") return LogLevel::Debug;
    if (up == "INFO") return LogLevel::Info;
    if (up == "WARN" || up == "WARNING") return LogLevel::Warning;
    if (up == "NONE") return LogLevel::None;
    return LogLevel::Error;
}

} // namespace shotport
