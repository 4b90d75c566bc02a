//
// Created by the shotport authors on 19/10/25.
//

/**
 * @file conversion_executor.hpp
 * @brief Runs a batch of conversions on a thread pool.
 */

#ifndef SHOTPORT_CONVERSION_EXECUTOR_HPP
#define SHOTPORT_CONVERSION_EXECUTOR_HPP

#include "conversion_pipeline.hpp"
#include "decoder_registry.hpp"
#include "event_bus.hpp"
#include "output_naming.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

namespace shotport {

/**
 * @brief Orchestrates the conversion of a list of files.
 *
 * @details Each ConversionJob becomes one task on the ThreadPool. A task
 * first checks that the file looks like a supported image (libmagic MIME
 * type, extension fallback), then runs the ConversionPipeline and publishes
 * the outcome on the EventBus. Per-file failures never stop the batch.
 *
 * The executor borrows the registry, the pipeline and the bus; they must
 * outlive it.
 */
class ConversionExecutor {
public:
    /**
     * @brief Construct a ConversionExecutor.
     *
     * @param registry Decoders used to reject unsupported files early.
     * @param pipeline Pipeline shared by all workers.
     * @param dry_run If true, files are analyzed but nothing is written.
     * @param bus EventBus used to publish progress and results.
     * @param threads Number of worker threads to use.
     */
    ConversionExecutor(const DecoderRegistry& registry,
                       const ConversionPipeline& pipeline,
                       bool dry_run,
                       EventBus& bus,
                       unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Converts every job and returns when all are done or stopped.
     *
     * Output directories are created first (except in dry-run mode).
     *
     * @throws std::runtime_error if an output directory cannot be created.
     */
    void process(const std::vector<ConversionJob>& jobs);

    /**
     * @brief Checks if a stop has been requested.
     */
    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Request the executor and its thread pool to stop.
     *
     * Queued jobs are dropped and reported as skipped; running ones finish.
     * Thread-safe.
     */
    void request_stop();

private:
    /// Body of one pool task.
    void convert_one(const ConversionJob& job, const std::stop_token& st) const;

    void prepare_output_dirs(const std::vector<ConversionJob>& jobs) const;

    const DecoderRegistry& registry_;     ///< Decoder lookup for the format check
    const ConversionPipeline& pipeline_;  ///< Per-file conversion
    bool dry_run_;                        ///< If true, no files are written
    ThreadPool pool_;                     ///< Workers
    std::atomic<bool> stop_flag_{false};  ///< Flag to signal interruption
    EventBus& event_bus_;                 ///< Bus for publishing events
};

} // namespace shotport

#endif // SHOTPORT_CONVERSION_EXECUTOR_HPP
