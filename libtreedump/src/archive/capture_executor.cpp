//
// Created by Giuseppe Francione on 21/01/26.
//

#include "../../include/capture_executor.hpp"
#include "../../include/capture.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/thread_pool.hpp"
#include <chrono>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace treedump {

CaptureExecutor::CaptureExecutor(fs::path root,
                                 OutputSink& sink,
                                 EventBus& bus,
                                 const unsigned threads,
                                 const std::size_t queue_capacity)
    : root_(normalize_absolute(root)),
      sink_(sink),
      event_bus_(bus),
      threads_(threads == 0 ? 1 : threads),
      queue_capacity_(queue_capacity) {}

CaptureStats CaptureExecutor::process(const std::vector<fs::path>& files) {
    captured_ = 0;
    failed_ = 0;
    bytes_ = 0;

    {
        ThreadPool pool(threads_, queue_capacity_);
        for (const auto& file : files) {
            pool.enqueue([this, file] { capture_one(file); });
        }
        pool.shutdown();
    }

    CaptureStats stats;
    stats.files_total = files.size();
    stats.files_captured = captured_.load();
    stats.files_failed = failed_.load();
    stats.bytes_captured = bytes_.load();
    Logger::log(LogLevel::Info,
                "Captured " + std::to_string(stats.files_captured) + " of " + std::to_string(stats.files_total) +
                " files (" + std::to_string(stats.files_failed) + " failed)",
                "executor");
    return stats;
}

void CaptureExecutor::capture_one(const fs::path& file) {
    event_bus_.publish(FileCaptureStartEvent{file});
    const auto start = std::chrono::steady_clock::now();

    std::string error;
    auto captured = capture_file(file, root_, &error);
    if (!captured) {
        ++failed_;
        event_bus_.publish(FileCaptureErrorEvent{file, error});
        return;
    }

    fs::path archive;
    try {
        archive = sink_.submit(*captured);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Error writing file " + file.string() + " to output: " + e.what(), "executor");
        ++failed_;
        event_bus_.publish(FileCaptureErrorEvent{file, e.what()});
        return;
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    ++captured_;
    bytes_ += captured->size_bytes;

    FileCapturedEvent done;
    done.path = file;
    done.relative_path = std::move(captured->relative_path);
    done.size_bytes = captured->size_bytes;
    done.archive = std::move(archive);
    done.duration = duration;
    // release the content before handing the event around
    captured.reset();
    event_bus_.publish(done);
}

} // namespace treedump
