//
// Created by the shotport authors on 20/10/25.
//

#ifndef SHOTPORT_CONSOLE_LOG_SINK_HPP
#define SHOTPORT_CONSOLE_LOG_SINK_HPP

#include "../../../libshotport/include/log_sink.hpp"
#include "color.hpp"
#include <iostream>

/**
 * @brief Prints log messages to the console.
 * Debug and Info go to stdout, Warning and Error to stderr in color.
 * The leading newline keeps messages off the progress bar line.
 */
class ConsoleLogSink final : public shotport::ILogSink {
public:
    explicit ConsoleLogSink(const shotport::LogLevel level) { threshold = level; }

    void log(const shotport::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        using shotport::LogLevel;
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << YELLOW << "\n[WARN ][" << tag << "] " << message << RESET << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << RED << "\n[ERROR][" << tag << "] " << message << RESET << std::endl;
                break;
            case LogLevel::None:
                break;
        }
    }
};

#endif // SHOTPORT_CONSOLE_LOG_SINK_HPP
