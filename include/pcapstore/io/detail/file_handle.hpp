// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <utility>

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <sys/types.h>
#include <unistd.h>

namespace pcapstore::io::detail {

/**
 * @brief Owning POSIX file descriptor
 *
 * Closes on destruction. close() reports the errno of a failed ::close so callers that
 * care about the final flush can surface it; the destructor cannot.
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /**
     * @brief Close the descriptor
     * @return 0 on success, errno of the failed ::close otherwise
     */
    int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        int rc = ::close(std::exchange(fd_, -1));
        return rc == 0 ? 0 : errno;
    }

private:
    int fd_{-1};
};

/**
 * @brief Owning stdio stream
 */
class FileStream {
public:
    FileStream() noexcept = default;
    explicit FileStream(std::FILE* file) noexcept : file_(file) {}

    ~FileStream() noexcept {
        if (file_ != nullptr) {
            std::fclose(file_);
        }
    }

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    FileStream(FileStream&& other) noexcept : file_(std::exchange(other.file_, nullptr)) {}

    FileStream& operator=(FileStream&& other) noexcept {
        if (this != &other) {
            if (file_ != nullptr) {
                std::fclose(file_);
            }
            file_ = std::exchange(other.file_, nullptr);
        }
        return *this;
    }

    [[nodiscard]] std::FILE* get() const noexcept { return file_; }
    [[nodiscard]] bool valid() const noexcept { return file_ != nullptr; }
    explicit operator bool() const noexcept { return valid(); }

private:
    std::FILE* file_{nullptr};
};

/**
 * @brief Write a whole buffer, retrying on short writes and EINTR
 * @return 0 on success, errno on failure
 */
inline int write_all(int fd, const void* data, size_t length) noexcept {
    const auto* p = static_cast<const unsigned char*>(data);
    while (length > 0) {
        ssize_t written = ::write(fd, p, length);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno;
        }
        if (written == 0) {
            return EIO;
        }
        p += written;
        length -= static_cast<size_t>(written);
    }
    return 0;
}

} // namespace pcapstore::io::detail
