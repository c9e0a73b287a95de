/*
 * File: include/atomic_write.hpp
 * Project: Print Telemetry Bridge
 * Purpose: Atomic file replacement (temp file + fsync + rename)
 * Notes:
 *  - Snapshot and status files are only ever replaced via this header
 *  - Temp file lives beside the destination so rename() stays atomic
 *  - Malformed frames are skipped; the session never drops on bad data
 * Last updated: 2026-10-16
 */

#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>

// Streams bytes into <path>.tmp and renames it over <path> on commit().
// Destroying an uncommitted writer removes the temp file, so the
// destination only ever holds a complete previous or complete new file.
class AtomicFileWriter
{
    std::filesystem::path final_;
    std::filesystem::path tmp_;
    int fd_ = -1;
    std::uint64_t written_ = 0;

public:
    explicit AtomicFileWriter(std::filesystem::path final_path)
        : final_(std::move(final_path)), tmp_(final_)
    {
        tmp_ += ".tmp";
        fd_ = ::open(tmp_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd_ < 0)
            throw std::system_error(errno, std::generic_category(), "open temp file " + tmp_.string());
    }

    AtomicFileWriter(const AtomicFileWriter &) = delete;
    AtomicFileWriter &operator=(const AtomicFileWriter &) = delete;

    ~AtomicFileWriter() { discard(); }

    void write(const void *data, std::size_t n)
    {
        if (fd_ < 0)
            throw std::runtime_error("write on closed temp file: " + tmp_.string());
        auto p = static_cast<const char *>(data);
        while (n > 0)
        {
            auto w = ::write(fd_, p, n);
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::system_error(errno, std::generic_category(), "write temp file " + tmp_.string());
            }
            p += w;
            n -= static_cast<std::size_t>(w);
            written_ += static_cast<std::uint64_t>(w);
        }
    }

    std::uint64_t bytes_written() const { return written_; }
    const std::filesystem::path &temp_path() const { return tmp_; }

    // fsync, close and rename over the destination
    void commit()
    {
        if (fd_ < 0)
            throw std::runtime_error("commit on closed temp file: " + tmp_.string());
        if (::fsync(fd_) != 0)
        {
            int err = errno;
            discard();
            throw std::system_error(err, std::generic_category(), "fsync temp file " + tmp_.string());
        }
        ::close(fd_);
        fd_ = -1;
        if (::rename(tmp_.c_str(), final_.c_str()) != 0)
        {
            int err = errno;
            ::unlink(tmp_.c_str());
            throw std::system_error(err, std::generic_category(), "rename " + tmp_.string() + " -> " + final_.string());
        }
    }

    void discard() noexcept
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
            ::unlink(tmp_.c_str());
        }
    }
};

inline void // Atomic write helper
write_atomic(const std::filesystem::path &final_path, const std::string &data)
{
    AtomicFileWriter w(final_path);
    w.write(data.data(), data.size());
    w.commit();
}
