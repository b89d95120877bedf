/*
 * mediadl/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Private staging directory (0700) under DownloaderConfig::stagingDir
 * - One uniquely named staging file (0600) per execution attempt
 * - Positional writes (pwrite), fsync of file and directory on completion
 *
 * Every failure is reported as ErrorCode::StorageWriteFailure.
 */

#include <mediadl/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace mediadl::downloader {

namespace fs = std::filesystem;

static Error storage_error(std::string message) {
    return Error{ErrorCode::StorageWriteFailure, std::move(message)};
}

static Expected<void> fsync_path(const fs::path& p, int flags, std::string_view what) {
    int fd = ::open(p.c_str(), flags);
    if (fd < 0) {
        return storage_error(std::string("open() failed for fsync of ") + std::string(what) +
                             ": " + p.string());
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return storage_error(std::string("fsync() failed for ") + std::string(what) + ": " +
                             p.string());
    }
    ::close(fd);
    return Expected<void>{};
}

static void ensure_private(const fs::path& p, fs::perms perms) {
    std::error_code ec;
    fs::permissions(p, perms, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set private perms on {}: {}", p.string(), ec.message());
    }
}

class DiskWriter final : public IDiskWriter {
public:
    Expected<fs::path> createStagingFile(const fs::path& stagingDir, std::string_view transferId,
                                         std::string_view tempExtension) override {
        if (stagingDir.empty()) {
            return storage_error("No staging directory configured");
        }

        std::error_code ec;
        fs::create_directories(stagingDir, ec);
        if (ec) {
            return storage_error("Failed to create staging dir " + stagingDir.string() + ": " +
                                 ec.message());
        }
        ensure_private(stagingDir, fs::perms::owner_all);

        std::string ext(tempExtension.empty() ? std::string_view(".part") : tempExtension);
        if (ext.front() != '.')
            ext.insert(ext.begin(), '.');

        // <transferId>.<timestamp>.part, created exclusively with owner-only permissions
        fs::path stagingFile;
        int fd = -1;
        for (int attempt = 0; attempt < 16 && fd < 0; ++attempt) {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            stagingFile = stagingDir / (std::string(transferId) + "." + std::to_string(stamp) +
                                        ext);
            fd = ::open(stagingFile.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
            if (fd < 0 && errno != EEXIST)
                break;
        }
        if (fd < 0) {
            const int err = errno;
            return storage_error("Failed to create staging file " + stagingFile.string() + ": " +
                                 std::strerror(err));
        }
        ::close(fd);
        ensure_private(stagingFile, fs::perms::owner_read | fs::perms::owner_write);

        spdlog::debug("Created staging file {}", stagingFile.string());
        return stagingFile;
    }

    Expected<void> writeAt(const fs::path& stagingFile, std::uint64_t offset,
                           std::span<const std::byte> data) override {
        // No O_CREAT: the staging file must already exist
        int fd = ::open(stagingFile.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0) {
            const int err = errno;
            return storage_error("Failed to open staging for write: " + stagingFile.string() +
                                 ": " + std::strerror(err));
        }

        const auto* p = reinterpret_cast<const char*>(data.data());
        std::size_t left = data.size();
        auto pos = static_cast<off_t>(offset);
        while (left > 0) {
            const ssize_t n = ::pwrite(fd, p, left, pos);
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0) {
                const int err = errno;
                ::close(fd);
                return storage_error("write failed on " + stagingFile.string() + ": " +
                                     std::strerror(err));
            }
            p += n;
            pos += n;
            left -= static_cast<std::size_t>(n);
        }

        // Durability is handled by sync()
        if (::close(fd) != 0) {
            const int err = errno;
            return storage_error("close failed on " + stagingFile.string() + ": " +
                                 std::strerror(err));
        }
        return Expected<void>{};
    }

    Expected<void> sync(const fs::path& stagingFile) override {
        auto r = fsync_path(stagingFile, O_RDONLY, "file");
        if (!r.ok())
            return r;
        return fsync_path(stagingFile.parent_path(), O_RDONLY | O_DIRECTORY, "directory");
    }

    void cleanup(const fs::path& stagingFile) noexcept override {
        if (stagingFile.empty())
            return;
        std::error_code ec;
        fs::remove(stagingFile, ec);
        if (ec) {
            spdlog::debug("cleanup: failed to remove staging file {}: {}", stagingFile.string(),
                          ec.message());
        }
    }
};

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace mediadl::downloader
