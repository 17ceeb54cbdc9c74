/**
 * @file log_gzip.hpp
 * @brief Gzip compression of rolled-over log files using miniz
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

// Only the deflate/crc32 API is needed; keep zlib-style macros like 'compress' out of our code
#define MINIZ_NO_ARCHIVE_APIS
#define MINIZ_NO_ZLIB_COMPATIBLE_NAMES
#include <miniz.h>

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sinkwright
{
namespace gzip
{

/**
 * @brief Owning wrapper for a POSIX file descriptor
 */
class file_descriptor
{
  public:
    explicit file_descriptor(int fd = -1) noexcept : fd_(fd) {}

    file_descriptor(file_descriptor &&other) noexcept : fd_(other.release()) {}

    file_descriptor &operator=(file_descriptor &&other) noexcept
    {
        if (this != &other) { reset(other.release()); }
        return *this;
    }

    ~file_descriptor() { close(); }

    file_descriptor(const file_descriptor &)            = delete;
    file_descriptor &operator=(const file_descriptor &) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept
    {
        int old = fd_;
        fd_     = -1;
        return old;
    }

    void reset(int new_fd = -1) noexcept
    {
        if (fd_ != new_fd)
        {
            close();
            fd_ = new_fd;
        }
    }

    /**
     * @brief Close the descriptor, reporting the result of ::close()
     * @return 0 on success (or if nothing was open), -1 with errno set otherwise
     */
    int close() noexcept
    {
        if (fd_ < 0) return 0;
        int rc = ::close(fd_);
        fd_    = -1;
        return rc;
    }

  private:
    int fd_;
};

/**
 * @brief Raw deflate stream, ended on destruction
 */
class deflate_stream
{
  public:
    deflate_stream() : stream_{} {}

    ~deflate_stream()
    {
        if (initialized_) { mz_deflateEnd(&stream_); }
    }

    deflate_stream(const deflate_stream &)            = delete;
    deflate_stream &operator=(const deflate_stream &) = delete;

    bool init(int level)
    {
        // Negative window bits: no zlib wrapper, the gzip framing is written by hand
        initialized_ = mz_deflateInit2(&stream_, level, MZ_DEFLATED, -MZ_DEFAULT_WINDOW_BITS, 8, MZ_DEFAULT_STRATEGY) == MZ_OK;
        return initialized_;
    }

    mz_stream *get() noexcept { return &stream_; }

    int deflate(int flush) { return mz_deflate(&stream_, flush); }

  private:
    mz_stream stream_;
    bool initialized_ = false;
};

/**
 * @brief Output path that is unlinked unless commit() is called
 */
class pending_file
{
  public:
    explicit pending_file(std::string path) : path_(std::move(path)) {}

    ~pending_file()
    {
        if (committed_) return;

        // Keep the errno of the failure that caused the cleanup
        int saved = errno;
        ::unlink(path_.c_str());
        errno = saved;
    }

    pending_file(const pending_file &)            = delete;
    pending_file &operator=(const pending_file &) = delete;

    void commit() noexcept { committed_ = true; }
    const std::string &path() const noexcept { return path_; }

  private:
    std::string path_;
    bool committed_ = false;
};

/**
 * @brief Write the whole buffer, retrying on EINTR and short writes
 */
inline bool write_all(int fd, const void *buf, size_t len)
{
    const auto *p = static_cast<const unsigned char *>(buf);
    while (len > 0)
    {
        ssize_t w = ::write(fd, p, len);
        if (w < 0)
        {
            if (errno == EINTR) continue;
            return false;
        }
        p += static_cast<size_t>(w);
        len -= static_cast<size_t>(w);
    }
    return true;
}

// RFC 1952 member header: magic, CM=deflate, no flags, MTIME, XFL, OS=Unix
inline std::array<unsigned char, 10> make_header(uint32_t mtime)
{
    return {{0x1f,
             0x8b,
             0x08,
             0x00,
             static_cast<unsigned char>(mtime & 0xff),
             static_cast<unsigned char>((mtime >> 8) & 0xff),
             static_cast<unsigned char>((mtime >> 16) & 0xff),
             static_cast<unsigned char>((mtime >> 24) & 0xff),
             0x00,
             0x03}};
}

// RFC 1952 trailer: CRC32 then ISIZE, both little-endian
inline std::array<unsigned char, 8> make_trailer(uint32_t crc32, uint32_t input_size)
{
    std::array<unsigned char, 8> trailer{};
    for (int i = 0; i < 4; ++i)
    {
        trailer[i]     = static_cast<unsigned char>((crc32 >> (8 * i)) & 0xff);
        trailer[4 + i] = static_cast<unsigned char>((input_size >> (8 * i)) & 0xff);
    }
    return trailer;
}

/**
 * @brief Compress @p src into a new gzip file @p dst
 *
 * The bytes of @p src are stored unchanged, so decompressing @p dst yields
 * the original file exactly. @p dst must not exist; it is removed again if
 * anything fails.
 *
 * @return true on success; false with errno describing the failure
 */
inline bool file_to_gzip(const std::string &src, const std::string &dst, int level = MZ_DEFAULT_LEVEL)
{
    file_descriptor in_fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in_fd) return false;

    struct stat st;
    uint32_t mtime = 0;
    if (::fstat(in_fd.get(), &st) == 0) { mtime = static_cast<uint32_t>(st.st_mtime); }

    file_descriptor out_fd(::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0644));
    if (!out_fd) return false;
    pending_file output(dst);

    auto header = make_header(mtime);
    if (!write_all(out_fd.get(), header.data(), header.size())) return false;

    deflate_stream compressor;
    if (!compressor.init(level))
    {
        errno = EIO;
        return false;
    }

    constexpr size_t CHUNK_SIZE = 64 * 1024;
    std::vector<unsigned char> in_buf(CHUNK_SIZE);
    std::vector<unsigned char> out_buf(CHUNK_SIZE);

    mz_ulong crc     = MZ_CRC32_INIT;
    uint64_t total   = 0;
    auto *stream     = compressor.get();

    for (;;)
    {
        ssize_t r = ::read(in_fd.get(), in_buf.data(), in_buf.size());
        if (r < 0)
        {
            if (errno == EINTR) continue;
            return false;
        }

        if (r > 0)
        {
            crc = mz_crc32(crc, in_buf.data(), static_cast<size_t>(r));
            total += static_cast<uint64_t>(r);
        }

        int flush        = (r == 0) ? MZ_FINISH : MZ_NO_FLUSH;
        stream->next_in  = in_buf.data();
        stream->avail_in = static_cast<unsigned>(r);

        do {
            stream->next_out  = out_buf.data();
            stream->avail_out = static_cast<unsigned>(out_buf.size());

            if (compressor.deflate(flush) == MZ_STREAM_ERROR)
            {
                errno = EIO;
                return false;
            }

            size_t have = out_buf.size() - stream->avail_out;
            if (have > 0 && !write_all(out_fd.get(), out_buf.data(), have)) return false;
        } while (stream->avail_out == 0);

        if (flush == MZ_FINISH) break;
    }

    auto trailer = make_trailer(static_cast<uint32_t>(crc), static_cast<uint32_t>(total & 0xffffffffu));
    if (!write_all(out_fd.get(), trailer.data(), trailer.size())) return false;
    if (out_fd.close() != 0) return false;

    output.commit();
    return true;
}

} // namespace gzip
} // namespace sinkwright
