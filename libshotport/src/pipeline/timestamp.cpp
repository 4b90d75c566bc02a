//
// Created by the shotport authors on 08/11/25.
//

#include "../../include/timestamp.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace shotport {

    fs::file_time_type capture_mtime(const fs::path& source) {
        std::error_code ec;
        const auto mtime = fs::last_write_time(source, ec);
        if (ec) {
            throw DecodeError("Cannot read modification time of " + source.string() + ": " + ec.message());
        }
        return mtime;
    }

    void restore_mtime(const fs::path& output, const fs::file_time_type mtime) {
        std::error_code ec;
        fs::last_write_time(output, mtime, ec);
        if (ec) {
            throw TimestampError("Cannot set modification time of " + output.string() + ": " + ec.message());
        }
        Logger::log(LogLevel::Debug, "mtime restored on " + output.string(), "timestamp");
    }

} // namespace shotport
