//
// Created by the shotport authors on 13/11/25.
//

#ifndef SHOTPORT_FILE_UTILS_HPP
#define SHOTPORT_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace shotport {

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };

    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /// 16 random hex digits, for temporary file and directory names.
    std::string random_suffix();

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<unsigned char> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Creates (or truncates) a file and writes a buffer to it.
     * @throws std::runtime_error if the file cannot be opened, written or flushed.
     */
    void write_file_bytes(const std::filesystem::path &path, std::span<const unsigned char> bytes);

    /**
     * @brief Replaces a file's content by writing a sibling temporary file and
     * renaming it over the target.
     * @throws std::runtime_error on write or rename failure; the temporary
     * file is removed in that case.
     */
    void replace_file_bytes(const std::filesystem::path &path, std::span<const unsigned char> bytes);

    /**
     * @brief Builds a unique temporary path in the same directory as @p path.
     *
     * Uses a ".{filename}.{random_suffix}.tmp" pattern so the rename onto
     * @p path stays on the same filesystem.
     */
    std::filesystem::path temp_sibling_path(const std::filesystem::path &path);

} // namespace shotport

#endif // SHOTPORT_FILE_UTILS_HPP
