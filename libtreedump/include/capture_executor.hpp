//
// Created by Giuseppe Francione on 21/01/26.
//

/**
 * @file capture_executor.hpp
 * @brief Drives the parallel capture of a file list into an OutputSink.
 */

#ifndef TREEDUMP_CAPTURE_EXECUTOR_HPP
#define TREEDUMP_CAPTURE_EXECUTOR_HPP

#include "event_bus.hpp"
#include "output_sink.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace treedump {

/**
 * @brief Outcome counters of one CaptureExecutor::process() call.
 */
struct CaptureStats {
    std::size_t files_total = 0;      ///< Paths handed to process()
    std::size_t files_captured = 0;   ///< Records written completely
    std::size_t files_failed = 0;     ///< Files left out of the archive
    std::uintmax_t bytes_captured = 0; ///< Sum of the captured content sizes
};

/**
 * @brief Runs Capture for every path on a ThreadPool and feeds the sink.
 *
 * @details Each path becomes one task: read the file, then submit the
 * record to the shared OutputSink. A file that cannot be read or written
 * is logged, reported through FileCaptureErrorEvent and skipped; it never
 * stops the run. Only paths are queued, never file contents, and the
 * queue is bounded, so memory use is proportional to the number of
 * workers rather than to the size of the tree.
 */
class CaptureExecutor {
public:
    /**
     * @param root Root of the walk; relative paths in records are computed against it.
     * @param sink Destination of every record. Must outlive the executor.
     * @param bus Bus receiving per-file events. Must outlive the executor.
     * @param threads Number of workers (0 is treated as 1).
     * @param queue_capacity Bounded queue size; 0 selects four slots per worker.
     */
    CaptureExecutor(std::filesystem::path root,
                    OutputSink& sink,
                    EventBus& bus,
                    unsigned threads = 4,
                    std::size_t queue_capacity = 0);

    /**
     * @brief Captures every path and blocks until all of them are done.
     *
     * Paths are dequeued in the given order; records may land in the
     * archives in any order.
     */
    CaptureStats process(const std::vector<std::filesystem::path>& files);

private:
    void capture_one(const std::filesystem::path& file);

    std::filesystem::path root_;                 ///< Normalised absolute root
    OutputSink& sink_;
    EventBus& event_bus_;
    unsigned threads_;
    std::size_t queue_capacity_;
    std::atomic<std::size_t> captured_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::uintmax_t> bytes_{0};
};

} // namespace treedump

#endif // TREEDUMP_CAPTURE_EXECUTOR_HPP
