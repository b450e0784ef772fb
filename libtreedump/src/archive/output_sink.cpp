//
// Created by Giuseppe Francione on 19/01/26.
//

#include "../../include/output_sink.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace treedump {

std::string format_record_header(const CapturedFile& file) {
    std::string header;
    header.reserve(64 + file.name.size() + file.relative_path.size());
    header += "File: ";
    header += file.name;
    header += "\nPath: ";
    header += file.relative_path;
    header += "\nSize: ";
    header += std::to_string(file.size_bytes);
    header += " bytes\nFILE CONTENT START:\n";
    return header;
}

std::uintmax_t record_size(const CapturedFile& file) {
    return format_record_header(file).size() + file.content.size() + RECORD_FOOTER.size();
}

OutputSink::OutputSink(fs::path output_dir, const std::uintmax_t max_bytes)
    : output_dir_(std::move(output_dir)),
      max_bytes_(max_bytes) {
    if (max_bytes_ == 0) {
        throw std::invalid_argument("Archive size ceiling must be positive");
    }
    ensure_directory(output_dir_, "sink");
}

OutputSink::~OutputSink() {
    std::lock_guard lock(mtx_);
    if (out_) {
        Logger::log(LogLevel::Debug, "Closing " + current_path_.string() + " on destruction", "sink");
    }
}

void OutputSink::ensure_usable(const char* operation) const {
    if (state_ == State::Closed) {
        throw std::logic_error(std::string(operation) + " on closed OutputSink");
    }
}

void OutputSink::open_next() {
    const fs::path path = output_dir_ / archive_file_name(next_index_);
    out_.reset(open_file(path, "wb"));
    if (!out_) {
        const std::string reason = std::strerror(errno);
        Logger::log(LogLevel::Error, "Failed to create archive " + path.string() + ": " + reason, "sink");
        throw std::runtime_error("Failed to create archive " + path.string() + ": " + reason);
    }
    current_path_ = path;
    archives_.push_back(path);
    ++next_index_;
    bytes_written_ = 0;
    damaged_ = false;
    state_ = State::FileOpen;
    Logger::log(LogLevel::Info, "Writing " + path.string(), "sink");
}

void OutputSink::close_current() {
    if (!out_) return;
    FILE* f = out_.release();
    const fs::path closed_path = std::exchange(current_path_, fs::path{});
    state_ = State::NoFileOpen;
    bytes_written_ = 0;
    damaged_ = false;
    if (std::fclose(f) != 0) {
        const std::string reason = std::strerror(errno);
        Logger::log(LogLevel::Error, "Failed to close archive " + closed_path.string() + ": " + reason, "sink");
        throw std::runtime_error("Failed to close archive " + closed_path.string() + ": " + reason);
    }
}

void OutputSink::write_bytes(const char* data, const std::size_t size) {
    if (size == 0) return;
    const std::size_t n = std::fwrite(data, 1, size, out_.get());
    bytes_written_ += n;
    if (n != size) {
        damaged_ = true;
        const std::string reason = std::strerror(errno);
        throw std::runtime_error("Short write to " + current_path_.string() + " (" +
                                 std::to_string(n) + " of " + std::to_string(size) + " bytes): " + reason);
    }
}

void OutputSink::write_tree(const std::string_view tree_text) {
    std::lock_guard lock(mtx_);
    ensure_usable("write_tree");
    if (tree_written_ || state_ != State::NoFileOpen || !archives_.empty()) {
        throw std::logic_error("Directory tree must be written once, before any record");
    }
    tree_written_ = true;
    open_next();

    const std::string_view separator =
        (tree_text.empty() || tree_text.back() == '\n') ? std::string_view("\n") : std::string_view("\n\n");

    write_bytes(TREE_PREFIX.data(), TREE_PREFIX.size());
    write_bytes(tree_text.data(), tree_text.size());
    write_bytes(separator.data(), separator.size());
    if (std::fflush(out_.get()) != 0) {
        damaged_ = true;
        throw std::runtime_error("Failed to flush " + current_path_.string() + ": " + std::strerror(errno));
    }
    Logger::log(LogLevel::Debug, "Directory tree written (" + std::to_string(bytes_written_) + " bytes)", "sink");
}

fs::path OutputSink::submit(const CapturedFile& file) {
    const std::string header = format_record_header(file);
    const std::uintmax_t total = header.size() + file.content.size() + RECORD_FOOTER.size();

    std::lock_guard lock(mtx_);
    ensure_usable("submit");

    if (state_ == State::FileOpen && bytes_written_ > 0 &&
        (damaged_ || bytes_written_ + total > max_bytes_)) {
        Logger::log(LogLevel::Debug,
                    "Rotating after " + current_path_.filename().string() + " at " + std::to_string(bytes_written_) +
                    " bytes (next record " + std::to_string(total) + " bytes)",
                    "sink");
        close_current();
    }
    if (state_ != State::FileOpen) {
        open_next();
    }

    write_bytes(header.data(), header.size());
    write_bytes(file.content.data(), file.content.size());
    write_bytes(RECORD_FOOTER.data(), RECORD_FOOTER.size());
    if (std::fflush(out_.get()) != 0) {
        damaged_ = true;
        throw std::runtime_error("Failed to flush " + current_path_.string() + ": " + std::strerror(errno));
    }
    return current_path_;
}

void OutputSink::close() {
    std::lock_guard lock(mtx_);
    if (state_ == State::Closed) return;
    try {
        close_current();
    } catch (const std::runtime_error&) {
        state_ = State::Closed;
        throw;
    }
    state_ = State::Closed;
    Logger::log(LogLevel::Debug, "Sink closed after " + std::to_string(archives_.size()) + " archive(s)", "sink");
}

std::uintmax_t OutputSink::bytes_written() const {
    std::lock_guard lock(mtx_);
    return bytes_written_;
}

unsigned OutputSink::next_index() const {
    std::lock_guard lock(mtx_);
    return next_index_;
}

OutputSink::State OutputSink::state() const {
    std::lock_guard lock(mtx_);
    return state_;
}

fs::path OutputSink::current_path() const {
    std::lock_guard lock(mtx_);
    return current_path_;
}

std::vector<fs::path> OutputSink::archives() const {
    std::lock_guard lock(mtx_);
    return archives_;
}

} // namespace treedump
