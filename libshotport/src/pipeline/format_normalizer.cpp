//
// Created by the shotport authors on 05/11/25.
//

#include "../../include/format_normalizer.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/timestamp.hpp"
#include <stdexcept>

namespace fs = std::filesystem;

namespace shotport {

    const IImageDecoder* FormatNormalizer::select_decoder(const fs::path& source,
                                                          const std::span<const unsigned char> content) const {
        if (const auto* dec = registry_.find_by_signature(content)) {
            return dec;
        }
        const std::string mime = MimeDetector::detect(content, source);
        if (const auto* dec = registry_.find_by_mime(mime)) {
            Logger::log(LogLevel::Debug, "decoder chosen by MIME " + mime + " for " + source.string(), "normalizer");
            return dec;
        }
        if (const auto* dec = registry_.find_by_extension(source.extension().string())) {
            Logger::log(LogLevel::Debug, "decoder chosen by extension for " + source.string(), "normalizer");
            return dec;
        }
        return nullptr;
    }

    NormalizedSource FormatNormalizer::normalize(const fs::path& source) const {
        NormalizedSource result;
        result.path = source;
        result.mtime = capture_mtime(source);

        std::vector<unsigned char> content;
        try {
            content = read_file_bytes(source);
        } catch (const std::runtime_error& e) {
            throw DecodeError(e.what());
        }
        if (content.empty()) {
            throw DecodeError("Empty file: " + source.string());
        }

        const IImageDecoder* decoder = select_decoder(source, content);
        if (!decoder) {
            throw DecodeError("Unsupported image format: " + source.string());
        }
        result.decoder = decoder->get_name();
        result.decoded = decoder->decode(content);

        const auto& img = result.decoded.image;
        Logger::log(LogLevel::Debug,
                    source.filename().string() + ": " + std::string(result.decoder) + " " +
                    std::to_string(img.width) + "x" + std::to_string(img.height) + ", " +
                    std::to_string(img.channels()) + "ch/" + std::to_string(img.bit_depth) + "bit, " +
                    std::to_string(result.decoded.chunks.carried().size()) + " carried chunks",
                    "normalizer");
        return result;
    }

} // namespace shotport
