#pragma once

/*
 * mediadl/include/mediadl/downloader/transfer_queue.hpp
 *
 * Bounded-concurrency FIFO scheduler for transfers.
 *
 * The queue is the single writer of transfer runtime state. Each admitted transfer runs on a
 * worker of an internal thread pool with a fresh ITransferExecutor per attempt. Observers are
 * notified in production order; the terminal notification is last and delivered exactly once.
 */

#include <mediadl/downloader/downloader.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mediadl::core {
class ThreadPool;
}

namespace mediadl::downloader {

/**
 * Point-in-time view of one transfer.
 */
struct TransferSnapshot {
    TransferId id;
    std::string url;
    MediaKind kind{MediaKind::Photo};
    TransferState state{TransferState::Pending};
    TransferProgress progress{};
    int attempts{0};
    std::optional<TransferOutcome> outcome{};
};

/**
 * Cumulative queue counters.
 */
struct QueueStats {
    std::size_t submitted{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t cancelled{0};
    std::size_t retries{0};
};

class TransferQueue {
public:
    TransferQueue(DownloaderConfig config, ExecutorFactory factory);
    ~TransferQueue();

    TransferQueue(const TransferQueue&) = delete;
    TransferQueue& operator=(const TransferQueue&) = delete;

    /**
     * Admit a transfer as Pending and promote it immediately if a slot is free. Never blocks
     * on the network. The optional observer is attached before the transfer can start.
     */
    Expected<TransferId> submit(Transfer transfer,
                                std::shared_ptr<ITransferObserver> observer = nullptr);

    /**
     * Pending -> Cancelled directly. Active -> Cancelled immediately while the executor is
     * signalled to abort. No-op for a terminal transfer.
     */
    Expected<void> cancel(const TransferId& id);

    Expected<TransferState> status(const TransferId& id) const;
    Expected<TransferSnapshot> snapshot(const TransferId& id) const;

    Expected<void> subscribe(const TransferId& id, std::shared_ptr<ITransferObserver> observer);
    Expected<void> unsubscribe(const TransferId& id, const ITransferObserver* observer);

    /**
     * Drop the record of a finished transfer. Later lookups of the id return NotFound.
     * A transfer that is still pending or active is InvalidArgument.
     */
    Expected<void> forget(const TransferId& id);

    // Drop every finished record; returns how many were removed
    std::size_t forgetFinished();

    std::size_t activeCount() const;
    std::size_t pendingCount() const;
    QueueStats stats() const;

    /**
     * Block until no transfer is pending or running, or until timeout.
     * @return true if the queue became idle
     */
    bool waitIdle(std::chrono::milliseconds timeout) const;

    /**
     * Reject new submissions, cancel every non-terminal transfer and join the workers.
     * Idempotent. Must not be called from an observer callback.
     */
    void shutdown();

    const DownloaderConfig& config() const noexcept { return config_; }

private:
    struct Record {
        std::shared_ptr<const Transfer> transfer;
        std::vector<std::shared_ptr<ITransferObserver>> observers;
        TransferState state{TransferState::Pending};
        std::atomic<bool> cancelRequested{false};
        std::uint64_t bytes{0};
        std::optional<std::uint64_t> total{};
        double lastFraction{0.0};
        int attempts{0};
        std::optional<TransferOutcome> outcome{};

        // Serializes observer callbacks for this transfer
        std::recursive_mutex notifyMutex;
        bool terminalNotified{false}; // guarded by notifyMutex
    };
    using RecordPtr = std::shared_ptr<Record>;

    std::vector<RecordPtr> promoteLocked();
    void dispatch(std::vector<RecordPtr> promoted);
    void runTransfer(const RecordPtr& rec);
    void releaseSlot() noexcept;
    void onAttemptProgress(const RecordPtr& rec, const ProgressEvent& ev);
    bool waitBackoff(const RecordPtr& rec, std::chrono::milliseconds delay);
    bool markTerminalLocked(const RecordPtr& rec, const TransferOutcome& outcome);
    void finish(const RecordPtr& rec, TransferOutcome outcome);
    void notifyStateChanged(const RecordPtr& rec, TransferState state);
    void notifyTerminal(const RecordPtr& rec);

    DownloaderConfig config_;
    ExecutorFactory factory_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::unordered_map<TransferId, RecordPtr> records_;
    std::deque<RecordPtr> pending_;
    std::size_t running_{0};
    QueueStats stats_{};
    std::atomic<bool> stopping_{false};

    std::unique_ptr<core::ThreadPool> pool_;
};

} // namespace mediadl::downloader
