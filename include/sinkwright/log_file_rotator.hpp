/**
 * @file log_file_rotator.hpp
 * @brief Size-based rotation of log files into a numbered gzip archive set
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A rotating file keeps one active file at its base path and up to
 * backup_count compressed archives beside it:
 * @code
 * app.log        active file
 * app.log.1.gz   newest archive
 * app.log.2.gz
 * ...
 * app.log.N.gz   oldest archive, N == backup_count
 * @endcode
 *
 * When a write would push the active file past max_bytes, the file is
 * rolled over: every archive moves up one index (the oldest falls off), the
 * active file is renamed to app.log.1, compressed to app.log.1.gz, the
 * uncompressed copy is removed and a fresh active file is opened.
 *
 * Everything happens synchronously inside write(); there is no background
 * thread. The handle is not synchronized itself: callers serialize access,
 * which sink_model does with its per-sink mutex.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "log_types.hpp"
#include "log_utils.hpp"
#include "log_gzip.hpp"

namespace sinkwright
{

/**
 * @brief Rotation settings of a file sink
 */
struct rotate_policy
{
    uint64_t max_bytes      = DEFAULT_MAX_FILE_BYTES; ///< Size that triggers rollover (0 = never roll over)
    int backup_count        = DEFAULT_BACKUP_COUNT;   ///< Compressed archives to keep (0 = discard rolled files)
    text_encoding encoding  = text_encoding::utf8;    ///< Encoding of the bytes written to the file
    bool delay              = false;                  ///< Open files on first write instead of eagerly
    int compression_level   = MZ_DEFAULT_LEVEL;       ///< miniz level used for archives
};

/**
 * @brief The active file of a rotating sink and its rollover state
 */
class rotation_handle
{
  public:
    /**
     * @brief Open (or create) the active file for appending
     *
     * Existing content is kept and counts towards max_bytes.
     *
     * @throws std::system_error if the file cannot be opened (unless policy.delay)
     */
    rotation_handle(std::string base_filename, rotate_policy policy, diagnostic_handler diagnostics = {});

    rotation_handle(const rotation_handle &)            = delete;
    rotation_handle &operator=(const rotation_handle &) = delete;

    /**
     * @brief Append one rendered line, rolling over first if it would not fit
     * @param text UTF-8 text, converted to the policy's encoding before writing
     * @throws std::system_error on any I/O failure, including during rollover
     */
    void write(std::string_view text);

    /**
     * @brief Check whether writing @p next_write_size more bytes requires a rollover
     *
     * An empty file never rolls over, so a single oversized line is written
     * as-is instead of producing an empty archive.
     */
    bool should_rollover(uint64_t next_write_size) const
    {
        return policy_.max_bytes > 0 && current_size_ > 0 && current_size_ + next_write_size > policy_.max_bytes;
    }

    /**
     * @brief Close the active file, shift and compress archives, reopen
     * @throws std::system_error if a rename, delete, compression or reopen fails
     */
    void do_rollover();

    /**
     * @brief Close the active file; the next write reopens it
     * @throws std::system_error if closing fails
     */
    void close();

    bool is_open() const noexcept { return fd_.valid(); }
    uint64_t current_size() const noexcept { return current_size_; }
    uint64_t rollover_count() const noexcept { return rollovers_; }
    const std::string &base_filename() const noexcept { return base_filename_; }
    const rotate_policy &policy() const noexcept { return policy_; }

    /**
     * @brief Path of the compressed archive with the given index (1 = newest)
     */
    std::string archive_filename(int index) const;

  private:
    void open_active();
    void compress_rolled(const std::string &rolled, const std::string &archive);

    std::string base_filename_;
    rotate_policy policy_;
    diagnostic_handler diagnostics_;
    gzip::file_descriptor fd_;
    uint64_t current_size_ = 0;
    uint64_t rollovers_    = 0;
    std::string encoded_; // Scratch space for the encoded line
};

} // namespace sinkwright

#include "log_file_rotator_impl.hpp" // IWYU pragma: keep
