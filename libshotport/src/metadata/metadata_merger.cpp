//
// Created by the shotport authors on 07/11/25.
//

#include "../../include/metadata_merger.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/metadata_tags.hpp"

namespace shotport {

    MetadataMergeEngine::MetadataMergeEngine(const IMetadataTool& tool, const bool fill_capture_dates)
        : tool_(tool), fill_capture_dates_(fill_capture_dates) {}

    void MetadataMergeEngine::merge(const std::filesystem::path& source,
                                    const std::filesystem::path& output,
                                    const std::filesystem::file_time_type source_mtime) const {
        try {
            tool_.copy_all_tags(source, output);
            tool_.set_tags(output, ios_screenshot_overrides(), TagWriteMode::Override);

            if (fill_capture_dates_) {
                const auto original = tool_.read_tag(source, "DateTimeOriginal");
                tool_.set_tags(output, original ? capture_date_tags(*original) : capture_date_tags(source_mtime),
                               TagWriteMode::CreateOnly);
            }
        } catch (const MetadataWriteError&) {
            throw;
        } catch (const std::exception& e) {
            throw MetadataWriteError(std::string(tool_.get_name()) + ": " + e.what());
        }
        Logger::log(LogLevel::Debug, "metadata merged into " + output.filename().string(), "metadata");
    }

} // namespace shotport
