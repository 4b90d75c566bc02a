//
// Created by the shotport authors on 07/11/25.
//

#include "../../include/metadata_tags.hpp"
#include "../../include/exif_block.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <stdexcept>

namespace shotport {

    namespace {

        auto by_name(const std::string_view name) {
            return [name](const MetadataTagSet::Entry& e) { return e.first == name; };
        }

    } // namespace

    MetadataTagSet::MetadataTagSet(const std::initializer_list<Entry> entries) {
        for (const auto& [name, value] : entries) {
            set(name, value);
        }
    }

    void MetadataTagSet::set(std::string name, std::string value) {
        const auto it = std::find_if(entries_.begin(), entries_.end(), by_name(name));
        if (it != entries_.end()) {
            it->second = std::move(value);
            return;
        }
        entries_.emplace_back(std::move(name), std::move(value));
    }

    std::optional<std::string> MetadataTagSet::get(const std::string_view name) const {
        const auto it = std::find_if(entries_.begin(), entries_.end(), by_name(name));
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    bool MetadataTagSet::contains(const std::string_view name) const {
        return std::find_if(entries_.begin(), entries_.end(), by_name(name)) != entries_.end();
    }

    MetadataTagSet ios_screenshot_overrides() {
        const std::string dpi = std::to_string(kScreenshotDpi);
        return {
            {"ImageDescription", std::string(kScreenshotDescription)},
            {"UserComment", std::string(kScreenshotDescription)},
            {"Orientation", "1"},
            {"XResolution", dpi},
            {"YResolution", dpi},
            {"ResolutionUnit", "2"},
        };
    }

    std::string format_exif_datetime(const std::filesystem::file_time_type mtime) {
        const auto sys = std::chrono::file_clock::to_sys(mtime);
        const std::time_t t = std::chrono::system_clock::to_time_t(
            std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys));

        std::tm tm{};
#ifdef _WIN32
        if (localtime_s(&tm, &t) != 0) {
#else
        if (!localtime_r(&t, &tm)) {
#endif
            throw std::runtime_error("localtime failed");
        }
        char buf[32];
        if (std::strftime(buf, sizeof(buf), "%Y:%m:%d %H:%M:%S", &tm) == 0) {
            throw std::runtime_error("strftime failed");
        }
        return buf;
    }

    MetadataTagSet capture_date_tags(const std::filesystem::file_time_type mtime) {
        return capture_date_tags(format_exif_datetime(mtime));
    }

    MetadataTagSet capture_date_tags(const std::string& stamp) {
        return {
            {"DateTimeOriginal", stamp},
            {"CreateDate", stamp},
            {"ModifyDate", stamp},
            {"ColorSpace", "1"},
        };
    }

} // namespace shotport
