//
// Created by Giuseppe Francione on 19/01/26.
//

/**
 * @file output_sink.hpp
 * @brief The single rotating writer behind every archive file of a run.
 */

#ifndef TREEDUMP_OUTPUT_SINK_HPP
#define TREEDUMP_OUTPUT_SINK_HPP

#include "archive_types.hpp"
#include "file_utils.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace treedump {

/// Literal line that opens the directory tree block of the first archive.
inline constexpr std::string_view TREE_PREFIX = "DIRECTORY STRUCTURE:\n";
/// Literal footer closing every record.
inline constexpr std::string_view RECORD_FOOTER = "\nFILE CONTENT END\n\n";

/**
 * @brief Formats the header written before a file's content.
 */
std::string format_record_header(const CapturedFile& file);

/**
 * @brief Total number of bytes a record occupies on disk: header + content + footer.
 */
std::uintmax_t record_size(const CapturedFile& file);

/**
 * @brief Thread-safe, size-bounded, rotating archive writer.
 *
 * @details OutputSink owns the open archive handle and the byte counter
 * exclusively. Every public operation runs under one mutex, held for the
 * whole of the operation including the physical write, so rotation and
 * the record that follows it are indivisible with respect to other
 * writers.
 *
 * Rotation rule: before a record of `n` bytes is written, the sink
 * rotates iff `bytes_written() > 0 && bytes_written() + n > max_bytes`.
 * A record landing exactly on the ceiling stays in the current file, and a
 * record larger than the ceiling gets an archive of its own.
 *
 * bytes_written() always equals the number of bytes written and flushed
 * into the current archive since it was opened, including the tree block
 * and any partially written record.
 */
class OutputSink {
public:
    enum class State {
        NoFileOpen, ///< Before the first archive, or after a failed rotation
        FileOpen,
        Closed
    };

    /**
     * @brief Creates the output directory if needed. Opens no file yet.
     * @param output_dir Directory receiving output_001.txt, output_002.txt, ...
     * @param max_bytes Size ceiling per archive; must be > 0.
     * @throws std::invalid_argument if max_bytes is 0.
     * @throws std::runtime_error if the directory cannot be created.
     */
    OutputSink(std::filesystem::path output_dir, std::uintmax_t max_bytes);

    /**
     * @brief Closes the current archive if close() was not called.
     */
    ~OutputSink();

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;

    /**
     * @brief Opens the first archive and writes the directory tree block.
     *
     * Writes TREE_PREFIX, `tree_text` and a blank line, and sets the
     * byte counter to exactly the number of bytes written.
     *
     * @throws std::logic_error if an archive was already opened or the sink is closed.
     * @throws std::runtime_error if the archive cannot be created or written.
     */
    void write_tree(std::string_view tree_text);

    /**
     * @brief Appends one record, rotating first if it would exceed the ceiling.
     *
     * @return Path of the archive file that received the record.
     * @throws std::logic_error if the sink is closed.
     * @throws std::runtime_error if an archive cannot be opened or the
     * record cannot be written completely. Bytes that did reach the file
     * are still counted, and the next record starts a fresh archive.
     */
    std::filesystem::path submit(const CapturedFile& file);

    /**
     * @brief Flushes and closes the current archive. Further operations throw.
     *
     * Idempotent.
     * @throws std::runtime_error if the final flush or close fails.
     */
    void close();

    [[nodiscard]] std::uintmax_t bytes_written() const;
    [[nodiscard]] unsigned next_index() const;
    [[nodiscard]] State state() const;
    [[nodiscard]] std::uintmax_t max_bytes() const { return max_bytes_; }

    /**
     * @return Path of the open archive, or an empty path if none is open.
     */
    [[nodiscard]] std::filesystem::path current_path() const;

    /**
     * @return Every archive opened so far, in creation order.
     */
    [[nodiscard]] std::vector<std::filesystem::path> archives() const;

private:
    // all private helpers expect mtx_ to be held
    void open_next();
    void close_current();
    void write_bytes(const char* data, std::size_t size);
    void ensure_usable(const char* operation) const;

    mutable std::mutex mtx_;                     ///< Guards every member below
    std::filesystem::path output_dir_;           ///< Where archives are created
    std::uintmax_t max_bytes_;                   ///< Rotation ceiling in bytes
    unique_FILE out_;                            ///< Open archive, null unless state_ == FileOpen
    std::filesystem::path current_path_;         ///< Path of out_
    std::uintmax_t bytes_written_ = 0;           ///< Bytes flushed into out_ since it was opened
    unsigned next_index_ = 1;                    ///< Index of the next archive to open
    State state_ = State::NoFileOpen;
    bool tree_written_ = false;                  ///< write_tree() allowed only once, first
    bool damaged_ = false;                       ///< A write failed; rotate before the next record
    std::vector<std::filesystem::path> archives_;
};

} // namespace treedump

#endif // TREEDUMP_OUTPUT_SINK_HPP
