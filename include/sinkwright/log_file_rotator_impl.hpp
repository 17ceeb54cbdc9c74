#pragma once
/**
 * @file log_file_rotator_impl.hpp
 * @brief Implementation of rotation_handle
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include "log_file_rotator.hpp"

#include <errno.h>

namespace sinkwright
{

namespace detail
{

[[noreturn]] inline void throw_errno(int err, const std::string &what)
{
    throw std::system_error(err, std::generic_category(), what);
}

inline bool path_exists(const std::string &path)
{
    struct stat st;
    return ::lstat(path.c_str(), &st) == 0;
}

inline void remove_if_exists(const std::string &path)
{
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) { throw_errno(errno, "Failed to delete " + path); }
}

inline void rename_or_throw(const std::string &from, const std::string &to)
{
    if (::rename(from.c_str(), to.c_str()) != 0) { throw_errno(errno, "Failed to rename " + from + " to " + to); }
}

} // namespace detail

inline rotation_handle::rotation_handle(std::string base_filename, rotate_policy policy, diagnostic_handler diagnostics)
: base_filename_(std::move(base_filename)),
  policy_(policy),
  diagnostics_(std::move(diagnostics))
{
    if (policy_.backup_count < 0) policy_.backup_count = 0;
    if (!policy_.delay) { open_active(); }
}

inline std::string rotation_handle::archive_filename(int index) const { return fmt::format("{}.{}.gz", base_filename_, index); }

inline void rotation_handle::open_active()
{
    int fd = ::open(base_filename_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) { detail::throw_errno(errno, "Failed to open log file " + base_filename_); }
    fd_.reset(fd);

    struct stat st;
    if (::fstat(fd, &st) != 0) { detail::throw_errno(errno, "Failed to stat log file " + base_filename_); }

    // Devices, pipes and sockets cannot be renamed into archives
    if (!S_ISREG(st.st_mode) && policy_.max_bytes > 0)
    {
        if (diagnostics_)
        {
            diagnostics_(fmt::format("'{}' is not a regular file, disabling rotation", base_filename_));
        }
        policy_.max_bytes = 0;
    }

    current_size_ = S_ISREG(st.st_mode) ? static_cast<uint64_t>(st.st_size) : 0;
}

inline void rotation_handle::write(std::string_view text)
{
    encoded_.clear();
    encode_text(text, policy_.encoding, encoded_);

    if (!fd_) { open_active(); }

    if (should_rollover(encoded_.size()))
    {
        do_rollover();
        if (!fd_) { open_active(); }
    }

    if (!gzip::write_all(fd_.get(), encoded_.data(), encoded_.size()))
    {
        detail::throw_errno(errno, "Failed to write log file " + base_filename_);
    }
    current_size_ += encoded_.size();
}

inline void rotation_handle::do_rollover()
{
    // Step 1: close the active file
    if (fd_.close() != 0) { detail::throw_errno(errno, "Failed to close log file " + base_filename_); }

    // Step 2: shift archives up by one; whatever sits at backup_count is overwritten
    for (int i = policy_.backup_count - 1; i >= 1; --i)
    {
        std::string source = archive_filename(i);
        if (detail::path_exists(source))
        {
            std::string target = archive_filename(i + 1);
            detail::remove_if_exists(target);
            detail::rename_or_throw(source, target);
        }
    }

    // Step 3: drop a stale uncompressed rollover
    std::string rolled = base_filename_ + ".1";
    detail::remove_if_exists(rolled);

    // Step 4: move the active file aside and compress it into archive 1
    if (detail::path_exists(base_filename_))
    {
        detail::rename_or_throw(base_filename_, rolled);
        if (policy_.backup_count > 0) { compress_rolled(rolled, archive_filename(1)); }
        else { detail::remove_if_exists(rolled); }
    }

    current_size_ = 0;
    ++rollovers_;

    // Step 5: start the next file now, or on the next write when delayed
    if (!policy_.delay) { open_active(); }
}

inline void rotation_handle::compress_rolled(const std::string &rolled, const std::string &archive)
{
    // Compress next to the target and rename, so a failed compression never
    // leaves a truncated archive under the final name
    std::string pending = archive + ".pending";
    detail::remove_if_exists(pending);

    if (!gzip::file_to_gzip(rolled, pending, policy_.compression_level))
    {
        detail::throw_errno(errno, "Failed to compress " + rolled);
    }

    detail::rename_or_throw(pending, archive);
    detail::remove_if_exists(rolled);
}

inline void rotation_handle::close()
{
    if (fd_.close() != 0) { detail::throw_errno(errno, "Failed to close log file " + base_filename_); }
}

} // namespace sinkwright
