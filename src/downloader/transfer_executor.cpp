/*
 * mediadl/src/downloader/transfer_executor.cpp
 *
 * TransferExecutor (one execution attempt of one transfer):
 * - Stream the remote asset once through IHttpAdapter::fetch
 * - Write chunks to a private staging file via IDiskWriter, rate-limited by the shared limiter
 * - Optional digest verification against Transfer::checksum
 * - Size verification against Transfer::expectedBytes (or Content-Length when absent)
 * - Coalesced, non-decreasing progress events
 *
 * The staging file is removed on every Failed or Cancelled outcome. A Succeeded outcome hands
 * the staging file to the caller.
 */

#include <mediadl/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace mediadl::downloader {

namespace {

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool has_scheme(const std::string& url) {
    auto pos = url.find("://");
    if (pos == std::string::npos || pos == 0)
        return false;
    return std::all_of(url.begin(), url.begin() + static_cast<std::ptrdiff_t>(pos),
                       [](unsigned char c) { return std::isalnum(c) || c == '+' || c == '-' ||
                                                    c == '.'; });
}

class TransferExecutor final : public ITransferExecutor {
public:
    TransferExecutor(const DownloaderConfig& config, std::shared_ptr<IHttpAdapter> http,
                     std::shared_ptr<IDiskWriter> disk, std::shared_ptr<IRateLimiter> limiter)
        : config_(config),
          http_(std::move(http)),
          disk_(std::move(disk)),
          limiter_(std::move(limiter)),
          integ_(makeIntegrityVerifier()) {}

    TransferOutcome execute(const Transfer& transfer, const ProgressCallback& onProgress,
                            const ShouldCancel& shouldCancel) override {
        std::filesystem::path stagingFile;
        std::uint64_t written = 0;
        try {
            if (transfer.url.empty() || !has_scheme(transfer.url)) {
                return TransferOutcome::failed(
                    Error{ErrorCode::InvalidArgument, "Malformed URL: '" + transfer.url + "'"});
            }
            if (!http_ || !disk_) {
                return TransferOutcome::failed(
                    Error{ErrorCode::Unknown, "Executor is missing collaborators"});
            }
            if (shouldCancel && shouldCancel()) {
                return TransferOutcome::cancelled();
            }

            auto staged = disk_->createStagingFile(config_.stagingDir, transfer.id, ".part");
            if (!staged.ok()) {
                return TransferOutcome::failed(staged.error());
            }
            stagingFile = staged.value();

            if (transfer.checksum) {
                integ_->reset(transfer.checksum->algo);
            }

            std::optional<std::uint64_t> totalBytes = transfer.expectedBytes;
            std::optional<std::uint64_t> contentLength;
            auto lastEmit = std::chrono::steady_clock::time_point{};
            std::uint64_t lastEmittedBytes = 0;

            auto emit = [&](ProgressStage stage, bool force) {
                if (!onProgress)
                    return;
                const auto now = std::chrono::steady_clock::now();
                if (!force && (now - lastEmit) < config_.progressInterval)
                    return;
                lastEmit = now;
                lastEmittedBytes = std::max(lastEmittedBytes, written);
                ProgressEvent ev;
                ev.downloadedBytes = lastEmittedBytes;
                ev.totalBytes = totalBytes;
                ev.stage = stage;
                ev.timestamp = now;
                onProgress(ev);
            };

            emit(ProgressStage::Connecting, true);

            // Sink writes streaming chunks to staging and feeds the digest; rate-limited
            auto sink = [&](std::span<const std::byte> data) -> Expected<void> {
                if (data.empty())
                    return Expected<void>{};
                if (limiter_) {
                    limiter_->acquire(static_cast<std::uint64_t>(data.size()), shouldCancel);
                }
                if (shouldCancel && shouldCancel()) {
                    return Error{ErrorCode::Cancelled, "Transfer cancelled by user"};
                }

                auto wr = disk_->writeAt(stagingFile, written, data);
                if (!wr.ok()) {
                    return wr.error();
                }
                if (transfer.checksum) {
                    integ_->update(data);
                }
                written += static_cast<std::uint64_t>(data.size());

                if (transfer.expectedBytes && written > *transfer.expectedBytes) {
                    return Error{ErrorCode::IntegrityMismatch,
                                 "Received more than the expected " +
                                     std::to_string(*transfer.expectedBytes) + " bytes"};
                }

                emit(ProgressStage::Downloading, false);
                return Expected<void>{};
            };

            auto onResponse = [&](const FetchInfo& info) {
                contentLength = info.contentLength;
                if (!totalBytes && info.contentLength) {
                    totalBytes = info.contentLength;
                }
            };

            FetchRequest request;
            request.url = transfer.url;
            request.headers = transfer.headers;
            request.timeout = config_.timeout;
            request.connectTimeout = config_.connectTimeout;
            request.stallTimeout = config_.stallTimeout;
            request.tls = config_.tls;
            request.proxy = config_.proxy;
            request.followRedirects = config_.followRedirects;
            request.userAgent = config_.userAgent;

            auto fr = http_->fetch(request, sink, shouldCancel, onResponse);
            if (!fr.ok()) {
                return fail(stagingFile, fr.error(), written);
            }
            if (!contentLength && fr.value().contentLength) {
                contentLength = fr.value().contentLength;
                if (!totalBytes)
                    totalBytes = contentLength;
            }
            if (shouldCancel && shouldCancel()) {
                return fail(stagingFile, Error{ErrorCode::Cancelled, "Transfer cancelled by user"},
                            written);
            }

            emit(ProgressStage::Downloading, true);

            auto sr = disk_->sync(stagingFile);
            if (!sr.ok()) {
                return fail(stagingFile, sr.error(), written);
            }

            const auto expectedSize = transfer.expectedBytes ? transfer.expectedBytes
                                                             : contentLength;
            if (expectedSize && written != *expectedSize) {
                return fail(stagingFile,
                            Error{ErrorCode::IntegrityMismatch,
                                  "Size mismatch (expected " + std::to_string(*expectedSize) +
                                      " bytes, got " + std::to_string(written) + ")"},
                            written);
            }

            if (transfer.checksum) {
                emit(ProgressStage::Verifying, true);
                auto digest = integ_->finalize();
                if (digest.hex.empty() ||
                    to_lower(digest.hex) != to_lower(transfer.checksum->hex)) {
                    return fail(stagingFile,
                                Error{ErrorCode::IntegrityMismatch,
                                      "Checksum mismatch (expected " + transfer.checksum->hex +
                                          ", got " + digest.hex + ")"},
                                written);
                }
            }

            spdlog::debug("Transfer {} staged {} bytes at {}", transfer.id, written,
                          stagingFile.string());
            return TransferOutcome::succeeded(stagingFile, written);
        } catch (const std::exception& ex) {
            return fail(stagingFile, Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()},
                        written);
        }
    }

private:
    TransferOutcome fail(const std::filesystem::path& stagingFile, Error error,
                         std::uint64_t written) {
        if (!stagingFile.empty())
            disk_->cleanup(stagingFile);
        if (error.code == ErrorCode::Cancelled) {
            return TransferOutcome::cancelled(written);
        }
        return TransferOutcome::failed(std::move(error), written);
    }

    DownloaderConfig config_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IDiskWriter> disk_;
    std::shared_ptr<IRateLimiter> limiter_;
    std::unique_ptr<IIntegrityVerifier> integ_;
};

} // namespace

std::unique_ptr<ITransferExecutor>
makeTransferExecutor(const DownloaderConfig& config, std::shared_ptr<IHttpAdapter> http,
                     std::shared_ptr<IDiskWriter> disk, std::shared_ptr<IRateLimiter> limiter) {
    return std::make_unique<TransferExecutor>(config, std::move(http), std::move(disk),
                                              std::move(limiter));
}

ExecutorFactory makeDefaultExecutorFactory(const DownloaderConfig& config) {
    std::shared_ptr<IHttpAdapter> http = makeCurlHttpAdapter();
    std::shared_ptr<IDiskWriter> disk = makeDiskWriter();
    std::shared_ptr<IRateLimiter> limiter = makeRateLimiter();
    limiter->setLimits(config.rateLimit);
    return [config, http, disk, limiter]() {
        return makeTransferExecutor(config, http, disk, limiter);
    };
}

} // namespace mediadl::downloader
