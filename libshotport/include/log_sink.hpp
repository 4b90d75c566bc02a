//
// Created by the shotport authors on 20/10/25.
//

#ifndef SHOTPORT_LOG_SINK_HPP
#define SHOTPORT_LOG_SINK_HPP

#include <string_view>

namespace shotport {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Chunk decisions, tool command lines, per-stage details
    Info,    ///< Normal progress (files collected, locale, dry-run plans)
    Warning, ///< Non-fatal conversion issues (dropped chunks, timestamps)
    Error,   ///< Failed conversions and unusable inputs
    None     ///< Threshold only: a sink set to None receives nothing
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations define how log messages are delivered (console, file).
 * The Logger only forwards messages at or above a sink's threshold.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    LogLevel threshold = LogLevel::Debug;

    [[nodiscard]] bool accepts(const LogLevel level) const noexcept {
        return level != LogLevel::None && level >= threshold;
    }

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace shotport

#endif // SHOTPORT_LOG_SINK_HPP
