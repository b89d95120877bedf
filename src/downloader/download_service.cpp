/*
 * mediadl/src/downloader/download_service.cpp
 */

#include <mediadl/downloader/download_service.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace mediadl::downloader {

namespace {

// Forwards one transfer's notifications to the progress sink
class SinkForwarder final : public ITransferObserver {
public:
    explicit SinkForwarder(std::shared_ptr<IProgressSink> sink) : sink_(std::move(sink)) {}

    void onTransferProgress(const TransferId& id, const TransferProgress& progress) override {
        if (sink_)
            sink_->onProgress(id, progress.fraction);
    }

    void onTransferTerminal(const TransferId& id, const TransferOutcome& outcome) override {
        if (sink_)
            sink_->onTerminal(id, outcome);
    }

private:
    std::shared_ptr<IProgressSink> sink_;
};

Transfer toTransfer(const MediaRequest& request) {
    auto t = makeTransfer(request.url, request.kind, request.expectedBytes);
    t.checksum = request.checksum;
    t.headers = request.headers;
    return t;
}

} // namespace

DownloadService::DownloadService(DownloaderConfig config, std::shared_ptr<IProgressSink> sink)
    : DownloadService(config, makeDefaultExecutorFactory(config), std::move(sink)) {}

DownloadService::DownloadService(DownloaderConfig config, ExecutorFactory factory,
                                 std::shared_ptr<IProgressSink> sink)
    : sink_(std::move(sink)),
      queue_(std::make_unique<TransferQueue>(std::move(config), std::move(factory))),
      coordinator_(std::make_unique<BatchCoordinator>(*queue_, sink_)) {}

DownloadService::~DownloadService() {
    shutdown();
}

Expected<TransferId> DownloadService::submitSingle(const std::string& url, MediaKind kind) {
    MediaRequest request;
    request.url = url;
    request.kind = kind;
    return submitSingle(request);
}

Expected<TransferId> DownloadService::submitSingle(const MediaRequest& request) {
    return queue_->submit(toTransfer(request), std::make_shared<SinkForwarder>(sink_));
}

Expected<BatchId> DownloadService::submitBatch(const std::vector<MediaRequest>& requests) {
    std::vector<Transfer> transfers;
    transfers.reserve(requests.size());
    for (const auto& r : requests) {
        transfers.push_back(toTransfer(r));
    }
    return coordinator_->createBatch(std::move(transfers));
}

Expected<void> DownloadService::cancel(const TransferId& id) {
    return queue_->cancel(id);
}

Expected<void> DownloadService::cancelBatch(const BatchId& id) {
    return coordinator_->cancelBatch(id);
}

Expected<TransferState> DownloadService::status(const TransferId& id) const {
    return queue_->status(id);
}

bool DownloadService::waitIdle(std::chrono::milliseconds timeout) const {
    return queue_->waitIdle(timeout);
}

void DownloadService::shutdown() {
    // Live batches still receive the cancellations issued by the queue
    queue_->shutdown();
    spdlog::debug("DownloadService stopped");
}

} // namespace mediadl::downloader
