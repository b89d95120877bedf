#pragma once

#include <mediadl/downloader/downloader.hpp>

#include <filesystem>

namespace mediadl::downloader {

/**
 * ISaveSink that moves finished staging files into <root>/<kind>/.
 *
 * The destination name is the transfer id taken from the staging file name; an existing file
 * is never overwritten (a numeric suffix is added instead). Cross-device moves fall back to
 * copy + fsync + remove.
 */
class DirectorySaveSink final : public ISaveSink {
public:
    explicit DirectorySaveSink(std::filesystem::path root);

    Expected<std::filesystem::path> save(const std::filesystem::path& stagingFile,
                                         MediaKind kind) override;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace mediadl::downloader
