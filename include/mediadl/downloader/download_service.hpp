#pragma once

/*
 * mediadl/include/mediadl/downloader/download_service.hpp
 *
 * Submission front end: one TransferQueue plus one BatchCoordinator, reporting to a single
 * IProgressSink. Single transfers are forwarded to the sink directly; batches report through
 * the coordinator's aggregate stream.
 */

#include <mediadl/downloader/batch_coordinator.hpp>
#include <mediadl/downloader/downloader.hpp>
#include <mediadl/downloader/transfer_queue.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mediadl::downloader {

/**
 * One asset to fetch. The URL is used as given (quality selection is up to the caller).
 */
struct MediaRequest {
    std::string url;
    MediaKind kind{MediaKind::Photo};
    std::optional<std::uint64_t> expectedBytes{};
    std::optional<Checksum> checksum{};
    std::vector<Header> headers;
};

class DownloadService {
public:
    /**
     * Uses the default libcurl executor factory.
     */
    DownloadService(DownloaderConfig config, std::shared_ptr<IProgressSink> sink);
    DownloadService(DownloaderConfig config, ExecutorFactory factory,
                    std::shared_ptr<IProgressSink> sink);
    ~DownloadService();

    DownloadService(const DownloadService&) = delete;
    DownloadService& operator=(const DownloadService&) = delete;

    Expected<TransferId> submitSingle(const std::string& url, MediaKind kind);
    Expected<TransferId> submitSingle(const MediaRequest& request);
    Expected<BatchId> submitBatch(const std::vector<MediaRequest>& requests);

    Expected<void> cancel(const TransferId& id);
    Expected<void> cancelBatch(const BatchId& id);
    Expected<TransferState> status(const TransferId& id) const;

    bool waitIdle(std::chrono::milliseconds timeout) const;
    void shutdown();

    TransferQueue& queue() noexcept { return *queue_; }
    BatchCoordinator& batches() noexcept { return *coordinator_; }

private:
    std::shared_ptr<IProgressSink> sink_;
    std::unique_ptr<TransferQueue> queue_;
    std::unique_ptr<BatchCoordinator> coordinator_;
};

} // namespace mediadl::downloader
