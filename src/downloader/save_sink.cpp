/*
 * mediadl/src/downloader/save_sink.cpp
 *
 * DirectorySaveSink: rename a staging file into <root>/<kind>/<transferId>, copying when the
 * staging directory lives on another filesystem.
 */

#include <mediadl/downloader/save_sink.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace mediadl::downloader {

namespace fs = std::filesystem;

namespace {

Error storage_error(std::string message) {
    return Error{ErrorCode::StorageWriteFailure, std::move(message)};
}

Expected<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return storage_error("open() failed for fsync: " + p.string());
    }
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        return storage_error("fsync() failed for: " + p.string());
    }
    return Expected<void>{};
}

Expected<void> copy_file_fsync(const fs::path& src, const fs::path& dst) {
    {
        std::ifstream is(src, std::ios::binary);
        if (!is.good()) {
            return storage_error("copy: failed to open source: " + src.string());
        }
        std::ofstream os(dst, std::ios::binary | std::ios::trunc);
        if (!os.good()) {
            return storage_error("copy: failed to open destination: " + dst.string());
        }
        std::vector<char> buffer(1 << 20);
        while (is.good()) {
            is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const std::streamsize got = is.gcount();
            if (got > 0) {
                os.write(buffer.data(), got);
                if (!os.good()) {
                    return storage_error("copy: write failed for destination: " + dst.string());
                }
            }
        }
        if (!is.eof()) {
            return storage_error("copy: read failed for source: " + src.string());
        }
    }
    return fsync_file(dst);
}

// "<transferId>.<timestamp>.part" -> "<transferId>"
std::string base_name_for(const fs::path& stagingFile) {
    auto name = stagingFile.filename().string();
    auto dot = name.find('.');
    if (dot != std::string::npos && dot > 0)
        name.resize(dot);
    return name.empty() ? std::string("download") : name;
}

fs::path unique_destination(const fs::path& dir, const std::string& base) {
    fs::path candidate = dir / base;
    std::error_code ec;
    for (int i = 1; fs::exists(candidate, ec); ++i) {
        candidate = dir / (base + "-" + std::to_string(i));
    }
    return candidate;
}

} // namespace

DirectorySaveSink::DirectorySaveSink(fs::path root) : root_(std::move(root)) {}

Expected<fs::path> DirectorySaveSink::save(const fs::path& stagingFile, MediaKind kind) {
    std::error_code ec;
    if (!fs::is_regular_file(stagingFile, ec)) {
        return Error{ErrorCode::NotFound, "Staging file does not exist: " + stagingFile.string()};
    }

    const fs::path dir = root_ / to_string(kind);
    fs::create_directories(dir, ec);
    if (ec) {
        return storage_error("Failed to create " + dir.string() + ": " + ec.message());
    }

    const fs::path dest = unique_destination(dir, base_name_for(stagingFile));

    fs::rename(stagingFile, dest, ec);
    if (ec) {
        if (ec != std::errc::cross_device_link) {
            return storage_error("rename() failed (" + ec.message() + ") from " +
                                 stagingFile.string() + " to " + dest.string());
        }
        spdlog::warn("Cross-device rename detected; copying {} to {}", stagingFile.string(),
                     dest.string());
        auto copied = copy_file_fsync(stagingFile, dest);
        if (!copied.ok()) {
            fs::remove(dest, ec);
            return copied.error();
        }
        fs::remove(stagingFile, ec);
        if (ec) {
            spdlog::warn("Failed to remove staging file {}: {}", stagingFile.string(),
                         ec.message());
        }
    }

    // Saved media is readable by others, unlike staging
    fs::permissions(dest,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions on {}: {}", dest.string(), ec.message());
    }

    spdlog::debug("Saved {} as {}", stagingFile.string(), dest.string());
    return dest;
}

} // namespace mediadl::downloader
