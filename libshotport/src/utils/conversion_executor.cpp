//
// Created by the shotport authors on 19/10/25.
//

#include "../../include/conversion_executor.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <chrono>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace shotport {
    ConversionExecutor::ConversionExecutor(const DecoderRegistry& registry,
                                           const ConversionPipeline& pipeline,
                                           const bool dry_run,
                                           EventBus& bus,
                                           const unsigned threads)
        : registry_(registry),
          pipeline_(pipeline),
          dry_run_(dry_run),
          pool_(threads),
          event_bus_(bus) {}

    void ConversionExecutor::prepare_output_dirs(const std::vector<ConversionJob>& jobs) const {
        std::set<fs::path> dirs;
        for (const auto& job : jobs) {
            if (job.output.has_parent_path()) dirs.insert(job.output.parent_path());
        }
        for (const auto& dir : dirs) {
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                Logger::log(LogLevel::Error, "Failed to create output directory: " + dir.string() +
                            " (" + ec.message() + ")", "Executor");
                throw std::runtime_error("Failed to create output directory: " + dir.string());
            }
        }
    }

    void ConversionExecutor::process(const std::vector<ConversionJob>& jobs) {
        if (!dry_run_) {
            prepare_output_dirs(jobs);
        }

        for (const auto& job : jobs) {
            const auto skip = [this, &job] {
                event_bus_.publish(FileConvertSkippedEvent{job.source, "Interrupted"});
            };
            const bool queued = !stop_flag_.load(std::memory_order_relaxed) &&
                                pool_.enqueue([this, &job](const std::stop_token& st) { convert_one(job, st); }, skip);
            if (!queued) {
                skip();
            }
        }
        pool_.wait_idle();
    }

    void ConversionExecutor::convert_one(const ConversionJob& job, const std::stop_token& st) const {
        const auto& file = job.source;
        if (st.stop_requested()) {
            event_bus_.publish(FileConvertSkippedEvent{file, "Interrupted"});
            return;
        }

        auto name = file.filename().string();
        if (!registry_.find_by_mime(MimeDetector::detect(file)) &&
            !registry_.find_by_extension(file.extension().string())) {
            Logger::log(LogLevel::Warning, "no decoder for " + file.string(), "Executor");
            event_bus_.publish(FileConvertSkippedEvent{file, "Unsupported format"});
            return;
        }

        event_bus_.publish(FileConvertStartEvent{file, job.output});

        if (dry_run_) {
            Logger::log(LogLevel::Info, "[DRY-RUN] Would convert: " + file.string() + " -> " + job.output.string(),
                        "Executor");
            std::error_code ec;
            const auto size = fs::file_size(file, ec);
            FileConvertCompleteEvent done;
            done.path = file;
            done.output = job.output;
            done.source_size = ec ? 0 : size;
            event_bus_.publish(done);
            return;
        }

        const auto start = std::chrono::steady_clock::now();
        try {
            ConversionReport report = pipeline_.convert(file, job.output);
            const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);

            for (const auto& w : report.warnings) {
                event_bus_.publish(FileConvertWarningEvent{file, w});
            }

            FileConvertCompleteEvent done;
            done.path = file;
            done.output = report.output;
            done.source_size = report.source_size;
            done.output_size = report.output_size;
            done.carried_chunks = report.carried_chunks;
            done.warnings = std::move(report.warnings);
            done.written = true;
            done.duration = duration;
            event_bus_.publish(done);
        } catch (const ConversionError& e) {
            Logger::log(LogLevel::Error, std::string(to_string(e.kind())) + " error on " + name + ": " + e.what(),
                        "Executor");
            const bool partial = e.kind() == ErrorKind::MetadataWrite;
            event_bus_.publish(FileConvertErrorEvent{file, job.output, e.kind(), e.what(), partial});
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "error on " + file.string() + ": " + std::string(e.what()), "Executor");
            event_bus_.publish(FileConvertErrorEvent{file, job.output, std::nullopt, e.what(), false});
        }
    }

    void ConversionExecutor::request_stop() {
        stop_flag_.store(true, std::memory_order_relaxed);
        pool_.request_stop();
    }

} // namespace shotport
