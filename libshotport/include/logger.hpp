//
// Created by the shotport authors on 20/10/25.
//

/**
 * @file logger.hpp
 * @brief Static logging facade shared by the library and the CLI.
 */

#ifndef SHOTPORT_LOGGER_HPP
#define SHOTPORT_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace shotport {

/**
 * @brief Fans log messages out to the installed sinks.
 *
 * With no sinks installed, messages are discarded. Tags name the component
 * ("png_decoder", "exiftool", "Executor", ...). Calls from worker threads
 * are serialized, so sinks need no locking of their own.
 */
class Logger {
public:
    /// Installs a sink. The Logger takes ownership.
    static void add_sink(std::unique_ptr<ILogSink> sink);

    static void clear_sinks();

    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "shotport");

    /**
     * @brief Tells whether any sink would receive a message of @p level.
     *
     * Lets callers skip building expensive debug strings.
     */
    [[nodiscard]] static bool enabled(LogLevel level);

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Parses a level name, case-insensitively.
     * Accepts DEBUG, INFO, WARN/WARNING, ERROR and NONE; anything else is Error.
     */
    static LogLevel string_to_level(std::string_view level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace shotport

#endif //SHOTPORT_LOGGER_HPP
