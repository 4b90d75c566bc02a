//
// Created by the shotport authors on 11/10/25.
//
#ifndef _WIN32
#include <magic.h>
#else
#include <algorithm>
#include <cctype>
#include <map>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"

namespace shotport {

    namespace {

#ifndef _WIN32
        /**
         * @brief Owns a libmagic cookie with the system database loaded.
         */
        struct MagicCookie {
            magic_t cookie = nullptr;

            MagicCookie() : cookie(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR)) {
                if (cookie && magic_load(cookie, nullptr) != 0) {
                    Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(cookie), "mime");
                    magic_close(cookie);
                    cookie = nullptr;
                }
            }

            ~MagicCookie() {
                if (cookie) magic_close(cookie);
            }

            MagicCookie(const MagicCookie&) = delete;
            MagicCookie& operator=(const MagicCookie&) = delete;

            std::string result(const char* mime, const std::string& what) const {
                if (!mime) {
                    const char* err = magic_error(cookie);
                    Logger::log(LogLevel::Debug, "magic failed on " + what + ": " + (err ? err : "?"), "mime");
                    return {};
                }
                return mime;
            }
        };
#else
        std::string mime_from_extension(const std::filesystem::path& path) {
            static const std::map<std::string, std::string> ext_to_mime = {
                {".png", "image/png"},
                {".jpg", "image/jpeg"},
                {".jpeg", "image/jpeg"},
                {".jpe", "image/jpeg"},
            };
            auto ext = path.extension().string();
            std::ranges::transform(ext, ext.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            const auto it = ext_to_mime.find(ext);
            return it != ext_to_mime.end() ? it->second : "application/octet-stream";
        }
#endif

    } // namespace

    std::string MimeDetector::detect(const std::filesystem::path& path) {
#ifndef _WIN32
        const MagicCookie magic;
        if (!magic.cookie) return {};
        return magic.result(magic_file(magic.cookie, path.string().c_str()), path.string());
#else
        return mime_from_extension(path);
#endif
    }

    std::string MimeDetector::detect(const std::span<const unsigned char> content, const std::filesystem::path& name) {
#ifndef _WIN32
        const MagicCookie magic;
        if (!magic.cookie) return {};
        return magic.result(magic_buffer(magic.cookie, content.data(), content.size()), name.string());
#else
        (void)content;
        return mime_from_extension(name);
#endif
    }

} // namespace shotport
