/**
 * @file log_writers.hpp
 * @brief Writers that persist rendered lines to descriptors and rotating files
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <unistd.h> // For STDERR_FILENO
#include <errno.h>

#include "log_record.hpp"
#include "log_file_rotator.hpp"

namespace sinkwright
{

/**
 * @brief Writes lines either to a plain descriptor or to a rotating file
 *
 * @code
 * file_writer console{STDERR_FILENO};                   // borrowed descriptor
 * file_writer logfile{"app.log", rotate_policy{}};      // rotating, compressed
 * @endcode
 */
class file_writer
{
  public:
    /**
     * @brief Write to a rotating file at @p filename
     * @throws std::system_error if the file cannot be opened
     */
    file_writer(const std::string &filename, rotate_policy policy, diagnostic_handler diagnostics = {})
    : rotation_handle_(std::make_unique<rotation_handle>(filename, policy, std::move(diagnostics)))
    {
    }

    explicit file_writer(int fd, bool close_fd = false) : fd_(fd), close_fd_(close_fd) {}

    file_writer(file_writer &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      close_fd_(std::exchange(other.close_fd_, false)),
      rotation_handle_(std::move(other.rotation_handle_))
    {
    }

    file_writer &operator=(file_writer &&) = delete;
    file_writer(const file_writer &)            = delete;
    file_writer &operator=(const file_writer &) = delete;

    ~file_writer()
    {
        if (close_fd_ && fd_ >= 0) { ::close(fd_); }
    }

    /**
     * @brief Write one rendered line
     * @throws std::system_error if the bytes cannot be written
     */
    void write(const log_record &, std::string_view line)
    {
        if (rotation_handle_)
        {
            rotation_handle_->write(line);
            return;
        }

        if (fd_ < 0) { throw std::system_error(EBADF, std::generic_category(), "Log descriptor is closed"); }
        if (!gzip::write_all(fd_, line.data(), line.size()))
        {
            throw std::system_error(errno, std::generic_category(), "Failed to write log line");
        }
    }

    // Descriptor writes go straight to the kernel
    void flush() {}

    void close()
    {
        if (rotation_handle_)
        {
            rotation_handle_->close();
            return;
        }
        if (close_fd_ && fd_ >= 0)
        {
            int fd    = std::exchange(fd_, -1);
            close_fd_ = false;
            if (::close(fd) != 0) { throw std::system_error(errno, std::generic_category(), "Failed to close log descriptor"); }
        }
    }

    /**
     * @brief The rotation state, or nullptr for descriptor writers
     */
    const rotation_handle *rotation() const noexcept { return rotation_handle_.get(); }

  private:
    int fd_        = -1;
    bool close_fd_ = false;
    std::unique_ptr<rotation_handle> rotation_handle_;
};

} // namespace sinkwright
