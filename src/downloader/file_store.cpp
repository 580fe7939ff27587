/*
 * segdl/src/downloader/file_store.cpp
 *
 * POSIX file store:
 * - Each worker opens its own descriptor, so no handle is shared across threads
 * - Positional writes via pwrite() at a cursor set by seek()
 * - setLength() pre-sizes the destination so writes at any offset are valid
 * - Truncate mode creates parent directories and starts from an empty file
 */

#include <segdl/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace segdl::downloader {

namespace fs = std::filesystem;

namespace {

Error ioError(std::string_view what, const fs::path& p, int err) {
    return Error{ErrorCode::IoError,
                 std::string(what) + " failed for " + p.string() + ": " + std::strerror(err)};
}

class PosixRandomAccessFile final : public IRandomAccessFile {
public:
    PosixRandomAccessFile(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}

    ~PosixRandomAccessFile() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    PosixRandomAccessFile(const PosixRandomAccessFile&) = delete;
    PosixRandomAccessFile& operator=(const PosixRandomAccessFile&) = delete;

    Expected<void> seek(std::uint64_t offset) override {
        if (fd_ < 0) {
            return Error{ErrorCode::IoError, "seek on closed file: " + path_.string()};
        }
        pos_ = offset;
        return Expected<void>{};
    }

    Expected<void> write(std::span<const std::byte> data) override {
        if (fd_ < 0) {
            return Error{ErrorCode::IoError, "write on closed file: " + path_.string()};
        }
        const auto* p = reinterpret_cast<const char*>(data.data());
        std::size_t remaining = data.size();
        while (remaining > 0) {
            const ssize_t n = ::pwrite(fd_, p, remaining, static_cast<off_t>(pos_));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return ioError("pwrite()", path_, errno);
            }
            p += n;
            remaining -= static_cast<std::size_t>(n);
            pos_ += static_cast<std::uint64_t>(n);
        }
        return Expected<void>{};
    }

    Expected<void> setLength(std::uint64_t length) override {
        if (fd_ < 0) {
            return Error{ErrorCode::IoError, "truncate on closed file: " + path_.string()};
        }
        if (::ftruncate(fd_, static_cast<off_t>(length)) != 0) {
            return ioError("ftruncate()", path_, errno);
        }
        return Expected<void>{};
    }

    Expected<void> close() override {
        if (fd_ < 0) {
            return Expected<void>{};
        }
        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            return ioError("close()", path_, errno);
        }
        return Expected<void>{};
    }

    [[nodiscard]] std::uint64_t position() const noexcept override { return pos_; }

private:
    int fd_{-1};
    fs::path path_;
    std::uint64_t pos_{0};
};

class PosixFileStore final : public IFileStore {
public:
    Expected<std::unique_ptr<IRandomAccessFile>> open(const fs::path& path,
                                                      OpenMode mode) override {
        if (path.empty()) {
            return Error{ErrorCode::InvalidArgument, "FileStore.open: empty path"};
        }

        int flags = O_RDWR | O_CREAT;
        if (mode == OpenMode::Truncate) {
            flags |= O_TRUNC;
            if (path.has_parent_path()) {
                std::error_code ec;
                fs::create_directories(path.parent_path(), ec);
                if (ec) {
                    return Error{ErrorCode::IoError, "Failed to create directory " +
                                                         path.parent_path().string() + ": " +
                                                         ec.message()};
                }
            }
        }

        const int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
        if (fd < 0) {
            return ioError("open()", path, errno);
        }
        spdlog::trace("Opened {} (mode={})", path.string(),
                      mode == OpenMode::Truncate ? "truncate" : "existing");
        return std::unique_ptr<IRandomAccessFile>(std::make_unique<PosixRandomAccessFile>(fd, path));
    }
};

} // namespace

/// Factory
std::unique_ptr<IFileStore> makePosixFileStore() {
    return std::make_unique<PosixFileStore>();
}

} // namespace segdl::downloader
