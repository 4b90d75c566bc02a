//
// Created by the shotport authors on 19/10/25.
//

/**
 * @file decoder_registry.hpp
 * @brief Defines the registry for discovering and managing IImageDecoder instances.
 */

#ifndef SHOTPORT_DECODER_REGISTRY_HPP
#define SHOTPORT_DECODER_REGISTRY_HPP

#include "image_decoder.hpp"
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace shotport {

/**
 * @brief Registry of all available input decoders.
 *
 * @details Owns one instance of every built-in IImageDecoder (PNG, JPEG)
 * and looks them up by magic bytes, MIME type or file extension.
 * Lookups are const and the decoders are stateless, so one registry can
 * serve every worker thread.
 */
class DecoderRegistry {
public:
    /**
     * @brief Construct and register all built-in decoders.
     */
    DecoderRegistry();

    /**
     * @brief Find the decoder whose magic bytes match a file header.
     * @return Non-owning pointer, or nullptr if no decoder matches.
     */
    [[nodiscard]] const IImageDecoder* find_by_signature(std::span<const unsigned char> header) const;

    /**
     * @brief Find the decoder that supports a given MIME type.
     * @param mime MIME type string (e.g. "image/png").
     * @return Non-owning pointer, or nullptr if unsupported.
     */
    [[nodiscard]] const IImageDecoder* find_by_mime(const std::string& mime) const;

    /**
     * @brief Find the decoder that supports a given file extension.
     *
     * Comparison is case-insensitive.
     *
     * @param ext File extension (including the dot, e.g. ".JPG").
     * @return Non-owning pointer, or nullptr if unsupported.
     */
    [[nodiscard]] const IImageDecoder* find_by_extension(const std::string& ext) const;

    /**
     * @brief Access all registered decoders.
     */
    [[nodiscard]] const std::vector<std::unique_ptr<IImageDecoder>>& all() const { return decoders_; }

private:
    std::vector<std::unique_ptr<IImageDecoder>> decoders_;
};

} // namespace shotport

#endif // SHOTPORT_DECODER_REGISTRY_HPP
