//
// Created by the shotport authors on 11/10/25.
//

#ifndef SHOTPORT_MIME_DETECTOR_HPP
#define SHOTPORT_MIME_DETECTOR_HPP

#include <filesystem>
#include <span>
#include <string>

namespace shotport {

    /**
     * @brief Content-based file type detection through libmagic.
     *
     * The executor uses it to skip non-image files before decoding; the
     * normalizer uses it when no decoder recognizes the magic bytes.
     * Each call opens its own magic cookie, so calls are thread-safe.
     * On Windows, where libmagic is not used, the extension decides.
     */
    class MimeDetector {
    public:
        /**
         * @brief MIME type of a file on disk (e.g. "image/jpeg").
         * @return Empty string if detection failed.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief MIME type of a file already read into memory.
         * @param content File bytes.
         * @param name File name, used only where libmagic is unavailable.
         * @return Empty string if detection failed.
         */
        static std::string detect(std::span<const unsigned char> content, const std::filesystem::path& name);
    };

} // namespace shotport
#endif //SHOTPORT_MIME_DETECTOR_HPP
