//
// Created by the shotport authors on 17/11/25.
//

#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>

namespace shotport {

    std::string random_suffix() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
        return buf;
    }

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // On Windows, convert mode to wstring and use _wfopen, which accepts
        // wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        // get absolute path, required for the long path prefix
        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            // fallback to original behavior on error
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<unsigned char> read_file_bytes(const std::filesystem::path& path) {
        const unique_FILE fp(open_file(path, "rb"));
        if (!fp) {
            throw std::runtime_error("Cannot open file: " + path.string());
        }

        std::vector<unsigned char> data;
        unsigned char buf[64 * 1024];
        std::size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), fp.get())) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (std::ferror(fp.get())) {
            throw std::runtime_error("Read error on file: " + path.string());
        }
        return data;
    }

    void write_file_bytes(const std::filesystem::path& path, const std::span<const unsigned char> bytes) {
        unique_FILE fp(open_file(path, "wb"));
        if (!fp) {
            throw std::runtime_error("Cannot create file: " + path.string());
        }
        if (!bytes.empty() && std::fwrite(bytes.data(), 1, bytes.size(), fp.get()) != bytes.size()) {
            throw std::runtime_error("Short write on file: " + path.string());
        }
        // explicitly flush stdio buffer to disk before returning
        if (std::fflush(fp.get()) != 0) {
            throw std::runtime_error("fflush failed for " + path.string());
        }
        if (std::fclose(fp.release()) != 0) {
            throw std::runtime_error("fclose failed for " + path.string());
        }
    }

    void replace_file_bytes(const std::filesystem::path& path, const std::span<const unsigned char> bytes) {
        const auto tmp = temp_sibling_path(path);
        std::error_code ec;
        try {
            write_file_bytes(tmp, bytes);
        } catch (const std::exception&) {
            std::filesystem::remove(tmp, ec);
            throw;
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            const std::string rename_error = ec.message();
            std::error_code remove_ec;
            std::filesystem::remove(tmp, remove_ec);
            if (remove_ec) {
                Logger::log(LogLevel::Warning, "Can't remove temp file: " + tmp.string() + " (" + remove_ec.message() + ")", "file_utils");
            }
            throw std::runtime_error("Rename failed: " + path.string() + " (" + rename_error + ")");
        }
    }

    std::filesystem::path temp_sibling_path(const std::filesystem::path& path) {
        const std::string name = "." + path.filename().string() + "." + random_suffix() + ".tmp";
        return path.parent_path() / name;
    }

} // namespace shotport
