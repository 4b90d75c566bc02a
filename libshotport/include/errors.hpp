//
// Created by the shotport authors on 03/11/25.
//

/**
 * @file errors.hpp
 * @brief Exception taxonomy of the conversion pipeline.
 *
 * Every failure of a single file conversion is reported as a subclass of
 * ConversionError. The ErrorKind lets callers tell a bad input apart from
 * a broken environment without parsing messages.
 */

#ifndef SHOTPORT_ERRORS_HPP
#define SHOTPORT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace shotport {

/**
 * @brief Category of a per-file conversion failure.
 */
enum class ErrorKind {
    Decode,        ///< Input unreadable or not a supported image
    Assembly,      ///< Invalid internal image state while building the PNG
    MetadataWrite, ///< External metadata tool missing or failed
    Timestamp,     ///< Modification time could not be restored (non-fatal)
    OutputWrite    ///< Output file could not be created or written
};

/**
 * @brief Converts an ErrorKind to a short, stable identifier.
 */
constexpr std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Decode:        return "decode";
        case ErrorKind::Assembly:      return "assembly";
        case ErrorKind::MetadataWrite: return "metadata";
        case ErrorKind::Timestamp:     return "timestamp";
        case ErrorKind::OutputWrite:   return "output";
    }
    return "unknown";
}

/**
 * @brief Base class of all conversion errors.
 */
class ConversionError : public std::runtime_error {
public:
    ConversionError(const ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// The input file is not a readable JPEG or PNG.
class DecodeError final : public ConversionError {
public:
    explicit DecodeError(const std::string& what) : ConversionError(ErrorKind::Decode, what) {}
};

/// The raster handed to the assembler cannot be encoded.
class AssemblyError final : public ConversionError {
public:
    explicit AssemblyError(const std::string& what) : ConversionError(ErrorKind::Assembly, what) {}
};

/**
 * @brief The external metadata tool is unavailable or rejected the write.
 *
 * When thrown by the pipeline, the output PNG already exists on disk with
 * correct pixels; its chunk layout and metadata may be incomplete.
 */
class MetadataWriteError final : public ConversionError {
public:
    explicit MetadataWriteError(const std::string& what) : ConversionError(ErrorKind::MetadataWrite, what) {}
};

/// Restoring the source modification time failed. Reported as a warning.
class TimestampError final : public ConversionError {
public:
    explicit TimestampError(const std::string& what) : ConversionError(ErrorKind::Timestamp, what) {}
};

/// The output file could not be created or written.
class OutputWriteError final : public ConversionError {
public:
    explicit OutputWriteError(const std::string& what) : ConversionError(ErrorKind::OutputWrite, what) {}
};

} // namespace shotport

#endif // SHOTPORT_ERRORS_HPP
