//
// Created by the shotport authors on 19/10/25.
//

#include "../../include/decoder_registry.hpp"
#include "../../include/jpeg_decoder.hpp"
#include "../../include/png_decoder.hpp"
#include <algorithm>
#include <cctype>

namespace shotport {

DecoderRegistry::DecoderRegistry() {
    decoders_.push_back(std::make_unique<PngDecoder>());
    decoders_.push_back(std::make_unique<JpegDecoder>());
}

const IImageDecoder* DecoderRegistry::find_by_signature(const std::span<const unsigned char> header) const {
    for (const auto& dec : decoders_) {
        if (dec->matches_signature(header)) {
            return dec.get();
        }
    }
    return nullptr;
}

const IImageDecoder* DecoderRegistry::find_by_mime(const std::string& mime) const {
    for (const auto& dec : decoders_) {
        for (const auto supported_mime : dec->get_supported_mime_types()) {
            if (supported_mime == mime) {
                return dec.get();
            }
        }
    }
    return nullptr;
}

const IImageDecoder* DecoderRegistry::find_by_extension(const std::string& ext) const {
    if (ext.empty() || ext[0] != '.') return nullptr;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& dec : decoders_) {
        for (const auto supported_ext : dec->get_supported_extensions()) {
            if (iequals(supported_ext, ext)) {
                return dec.get();
            }
        }
    }
    return nullptr;
}

} // namespace shotport
