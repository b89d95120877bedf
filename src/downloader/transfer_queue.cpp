/*
 * mediadl/src/downloader/transfer_queue.cpp
 *
 * TransferQueue:
 * - FIFO admission with a fixed concurrency limit (running_ counts a slot from promotion until
 *   the worker returns, including transfers cancelled while active)
 * - Retry of retryable failures with exponential backoff, invisible to observers
 * - Per-transfer notification lock plus terminal latch: progress is monotonic, the terminal
 *   notification is last and unique
 *
 * Lock order: Record::notifyMutex before mutex_. Observer callbacks never run under mutex_.
 */

#include <mediadl/core/thread_pool.h>
#include <mediadl/core/uuid.h>
#include <mediadl/downloader/transfer_queue.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

namespace mediadl::downloader {

namespace {

// A throwing observer must not take the transfer (or its slot) down with it
template <typename Fn>
void deliver(const TransferId& id, const char* what, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& ex) {
        spdlog::warn("Observer of transfer {} threw from {}: {}", id, what, ex.what());
    } catch (...) {
        spdlog::warn("Observer of transfer {} threw a non-standard exception from {}", id, what);
    }
}

} // namespace

TransferQueue::TransferQueue(DownloaderConfig config, ExecutorFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
    if (config_.maxConcurrent == 0) {
        spdlog::warn("TransferQueue: max_concurrent=0 is not usable, using 1");
        config_.maxConcurrent = 1;
    }
    pool_ = std::make_unique<core::ThreadPool>(config_.maxConcurrent);
    spdlog::debug("TransferQueue started with {} slots", config_.maxConcurrent);
}

TransferQueue::~TransferQueue() {
    shutdown();
}

Expected<TransferId> TransferQueue::submit(Transfer transfer,
                                           std::shared_ptr<ITransferObserver> observer) {
    if (transfer.url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Transfer has an empty URL"};
    }
    if (transfer.id.empty()) {
        transfer.id = core::generateUUID();
    }
    if (transfer.createdAt == std::chrono::system_clock::time_point{}) {
        transfer.createdAt = std::chrono::system_clock::now();
    }

    auto rec = std::make_shared<Record>();
    rec->transfer = std::make_shared<const Transfer>(std::move(transfer));
    rec->total = rec->transfer->expectedBytes;
    if (observer)
        rec->observers.push_back(std::move(observer));
    const TransferId id = rec->transfer->id;

    std::vector<RecordPtr> promoted;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopping_) {
            return Error{ErrorCode::QueueStopped, "Queue is shutting down"};
        }
        if (records_.count(id) != 0) {
            return Error{ErrorCode::InvalidArgument, "Duplicate transfer id " + id};
        }
        records_.emplace(id, rec);
        pending_.push_back(rec);
        ++stats_.submitted;
        promoted = promoteLocked();
    }
    spdlog::debug("Transfer {} submitted ({} {})", id, to_string(rec->transfer->kind),
                  rec->transfer->url);
    dispatch(std::move(promoted));
    return id;
}

Expected<void> TransferQueue::cancel(const TransferId& id) {
    RecordPtr rec;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            return Error{ErrorCode::NotFound, "Unknown transfer " + id};
        }
        rec = it->second;
        if (isTerminal(rec->state)) {
            return Expected<void>{};
        }
        if (rec->state == TransferState::Pending) {
            pending_.erase(std::remove(pending_.begin(), pending_.end(), rec), pending_.end());
        }
        rec->cancelRequested = true;
        markTerminalLocked(rec, TransferOutcome::cancelled(rec->bytes));
    }
    cv_.notify_all();
    spdlog::debug("Transfer {} cancelled", id);
    notifyTerminal(rec);
    return Expected<void>{};
}

Expected<TransferState> TransferQueue::status(const TransferId& id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::NotFound, "Unknown transfer " + id};
    }
    return it->second->state;
}

Expected<TransferSnapshot> TransferQueue::snapshot(const TransferId& id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::NotFound, "Unknown transfer " + id};
    }
    const auto& rec = it->second;
    TransferSnapshot s;
    s.id = rec->transfer->id;
    s.url = rec->transfer->url;
    s.kind = rec->transfer->kind;
    s.state = rec->state;
    s.progress.bytesReceived = rec->bytes;
    s.progress.totalBytes = rec->total;
    s.progress.fraction = rec->lastFraction;
    s.attempts = rec->attempts;
    s.outcome = rec->outcome;
    return s;
}

Expected<void> TransferQueue::subscribe(const TransferId& id,
                                        std::shared_ptr<ITransferObserver> observer) {
    if (!observer) {
        return Error{ErrorCode::InvalidArgument, "Null observer"};
    }
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::NotFound, "Unknown transfer " + id};
    }
    it->second->observers.push_back(std::move(observer));
    return Expected<void>{};
}

Expected<void> TransferQueue::unsubscribe(const TransferId& id,
                                          const ITransferObserver* observer) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::NotFound, "Unknown transfer " + id};
    }
    auto& obs = it->second->observers;
    obs.erase(std::remove_if(obs.begin(), obs.end(),
                             [observer](const auto& o) { return o.get() == observer; }),
              obs.end());
    return Expected<void>{};
}

Expected<void> TransferQueue::forget(const TransferId& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::NotFound, "Unknown transfer " + id};
    }
    if (!isTerminal(it->second->state)) {
        return Error{ErrorCode::InvalidArgument, "Transfer " + id + " has not finished"};
    }
    records_.erase(it);
    return Expected<void>{};
}

std::size_t TransferQueue::forgetFinished() {
    std::lock_guard<std::mutex> lk(mutex_);
    const auto removed = std::erase_if(
        records_, [](const auto& entry) { return isTerminal(entry.second->state); });
    if (removed > 0) {
        spdlog::debug("TransferQueue dropped {} finished record(s)", removed);
    }
    return removed;
}

std::size_t TransferQueue::activeCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return running_;
}

std::size_t TransferQueue::pendingCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_.size();
}

QueueStats TransferQueue::stats() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return stats_;
}

bool TransferQueue::waitIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this] { return pending_.empty() && running_ == 0; });
}

void TransferQueue::shutdown() {
    std::vector<RecordPtr> cancelled;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopping_.exchange(true) && !pool_) {
            return;
        }
        for (auto& [id, rec] : records_) {
            if (isTerminal(rec->state))
                continue;
            rec->cancelRequested = true;
            markTerminalLocked(rec, TransferOutcome::cancelled(rec->bytes));
            cancelled.push_back(rec);
        }
        pending_.clear();
    }
    cv_.notify_all();

    if (!cancelled.empty()) {
        spdlog::info("TransferQueue shutting down, cancelled {} transfer(s)", cancelled.size());
    }
    for (auto& rec : cancelled) {
        notifyTerminal(rec);
    }

    std::unique_ptr<core::ThreadPool> pool;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        pool = std::move(pool_);
    }
    if (pool) {
        pool->stop();
    }
}

// ---- internals ----

std::vector<TransferQueue::RecordPtr> TransferQueue::promoteLocked() {
    std::vector<RecordPtr> promoted;
    while (!pending_.empty() && running_ < config_.maxConcurrent && !stopping_) {
        auto rec = pending_.front();
        pending_.pop_front();
        rec->state = TransferState::Active;
        ++running_;
        promoted.push_back(std::move(rec));
    }
    return promoted;
}

void TransferQueue::dispatch(std::vector<RecordPtr> promoted) {
    for (auto& rec : promoted) {
        notifyStateChanged(rec, TransferState::Active);

        bool queued = false;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (pool_) {
                queued = pool_->enqueue_detached([this, rec] { runTransfer(rec); });
            }
        }
        if (queued)
            continue;

        // Pool is gone: shutdown raced with promotion
        bool won = false;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            won = markTerminalLocked(rec, TransferOutcome::cancelled());
            --running_;
        }
        cv_.notify_all();
        if (won)
            notifyTerminal(rec);
    }
}

void TransferQueue::runTransfer(const RecordPtr& rec) {
    // The slot is returned however this attempt loop is left
    struct SlotRelease {
        TransferQueue* queue;
        ~SlotRelease() { queue->releaseSlot(); }
    } slot{this};

    const Transfer& transfer = *rec->transfer;
    ShouldCancel shouldCancel = [this, rec] {
        return rec->cancelRequested.load() || stopping_.load();
    };
    ProgressCallback onProgress = [this, rec](const ProgressEvent& ev) {
        onAttemptProgress(rec, ev);
    };

    TransferOutcome outcome;
    for (int attempt = 0;; ++attempt) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            rec->attempts = attempt + 1;
        }

        try {
            auto executor = factory_ ? factory_() : nullptr;
            if (!executor) {
                outcome = TransferOutcome::failed(
                    Error{ErrorCode::Unknown, "No transfer executor available"});
            } else {
                outcome = executor->execute(transfer, onProgress, shouldCancel);
            }
        } catch (const std::exception& ex) {
            spdlog::error("Transfer {} executor threw: {}", transfer.id, ex.what());
            outcome = TransferOutcome::failed(
                Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()});
        }

        if (outcome.state != TransferState::Failed || !outcome.retryable ||
            attempt >= config_.retry.maxRetries || shouldCancel()) {
            break;
        }

        const auto delay = config_.retry.backoffFor(attempt + 1);
        spdlog::warn("Transfer {} attempt {} failed ({}), retrying in {} ms", transfer.id,
                     attempt + 1, outcome.summary(), delay.count());
        {
            std::lock_guard<std::mutex> lk(mutex_);
            ++stats_.retries;
        }
        if (!waitBackoff(rec, delay)) {
            outcome = TransferOutcome::cancelled(outcome.bytesReceived);
            break;
        }
    }

    finish(rec, std::move(outcome));
}

void TransferQueue::releaseSlot() noexcept {
    std::vector<RecordPtr> promoted;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        --running_;
        promoted = promoteLocked();
    }
    cv_.notify_all();
    try {
        dispatch(std::move(promoted));
    } catch (const std::exception& ex) {
        spdlog::error("TransferQueue: dispatch after slot release failed: {}", ex.what());
    }
}

bool TransferQueue::waitBackoff(const RecordPtr& rec, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait_for(lk, delay, [this, &rec] { return rec->cancelRequested.load() || stopping_.load(); });
    return !(rec->cancelRequested.load() || stopping_.load());
}

void TransferQueue::onAttemptProgress(const RecordPtr& rec, const ProgressEvent& ev) {
    std::lock_guard<std::recursive_mutex> nl(rec->notifyMutex);
    if (rec->terminalNotified)
        return;

    TransferProgress progress;
    std::vector<std::shared_ptr<ITransferObserver>> observers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (rec->state != TransferState::Active)
            return;
        bool changed = false;
        if (ev.totalBytes && !rec->total) {
            rec->total = ev.totalBytes;
            changed = true;
        }
        if (ev.downloadedBytes > rec->bytes) {
            rec->bytes = ev.downloadedBytes;
            changed = true;
        }
        if (!changed)
            return;

        double fraction = 0.0;
        if (rec->total && *rec->total > 0) {
            fraction = std::min(1.0, static_cast<double>(rec->bytes) /
                                         static_cast<double>(*rec->total));
        }
        rec->lastFraction = std::max(rec->lastFraction, fraction);

        progress.bytesReceived = rec->bytes;
        progress.totalBytes = rec->total;
        progress.fraction = rec->lastFraction;
        observers = rec->observers;
    }

    for (auto& o : observers) {
        deliver(rec->transfer->id, "onTransferProgress",
                [&] { o->onTransferProgress(rec->transfer->id, progress); });
    }
}

bool TransferQueue::markTerminalLocked(const RecordPtr& rec, const TransferOutcome& outcome) {
    if (isTerminal(rec->state))
        return false;
    rec->state = outcome.state;
    rec->outcome = outcome;
    switch (outcome.state) {
        case TransferState::Succeeded:
            ++stats_.succeeded;
            rec->bytes = std::max(rec->bytes, outcome.bytesReceived);
            if (!rec->total)
                rec->total = rec->bytes;
            rec->lastFraction = 1.0;
            break;
        case TransferState::Failed:
            ++stats_.failed;
            break;
        case TransferState::Cancelled:
            ++stats_.cancelled;
            break;
        default:
            break;
    }
    return true;
}

void TransferQueue::finish(const RecordPtr& rec, TransferOutcome outcome) {
    if (!isTerminal(outcome.state)) {
        outcome = TransferOutcome::failed(
            Error{ErrorCode::Unknown, "Executor returned a non-terminal state"},
            outcome.bytesReceived);
    }

    bool won = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        won = markTerminalLocked(rec, outcome);
    }
    cv_.notify_all();

    if (!won) {
        // Cancelled (or shut down) while the executor was finishing
        if (outcome.state == TransferState::Succeeded && !outcome.location.empty()) {
            std::error_code ec;
            std::filesystem::remove(outcome.location, ec);
            if (ec) {
                spdlog::warn("Failed to remove staging file {} of cancelled transfer {}: {}",
                             outcome.location.string(), rec->transfer->id, ec.message());
            }
        }
        return;
    }

    if (outcome.state == TransferState::Failed) {
        spdlog::debug("Transfer {} {}", rec->transfer->id, outcome.summary());
    } else {
        spdlog::debug("Transfer {} {}", rec->transfer->id, to_string(outcome.state));
    }
    notifyTerminal(rec);
}

void TransferQueue::notifyStateChanged(const RecordPtr& rec, TransferState state) {
    std::lock_guard<std::recursive_mutex> nl(rec->notifyMutex);
    if (rec->terminalNotified)
        return;
    std::vector<std::shared_ptr<ITransferObserver>> observers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (rec->state != state)
            return;
        observers = rec->observers;
    }
    for (auto& o : observers) {
        deliver(rec->transfer->id, "onTransferStateChanged",
                [&] { o->onTransferStateChanged(rec->transfer->id, state); });
    }
}

void TransferQueue::notifyTerminal(const RecordPtr& rec) {
    std::lock_guard<std::recursive_mutex> nl(rec->notifyMutex);
    if (rec->terminalNotified)
        return;
    rec->terminalNotified = true;

    std::vector<std::shared_ptr<ITransferObserver>> observers;
    TransferOutcome outcome;
    TransferProgress finalProgress;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        observers = rec->observers;
        outcome = rec->outcome.value_or(TransferOutcome::cancelled(rec->bytes));
        finalProgress.bytesReceived = rec->bytes;
        finalProgress.totalBytes = rec->total;
        finalProgress.fraction = 1.0;
    }

    const auto& id = rec->transfer->id;
    for (auto& o : observers) {
        if (outcome.state == TransferState::Succeeded) {
            deliver(id, "onTransferProgress", [&] { o->onTransferProgress(id, finalProgress); });
        }
        deliver(id, "onTransferStateChanged",
                [&] { o->onTransferStateChanged(id, outcome.state); });
        deliver(id, "onTransferTerminal", [&] { o->onTransferTerminal(id, outcome); });
    }
}

} // namespace mediadl::downloader
