/*
 * mediadl/src/downloader/batch_coordinator.cpp
 *
 * BatchCoordinator:
 * - Each batch is an ITransferObserver attached to every member at submission
 * - Aggregate fraction = bytes received by all members / sum of the known member sizes
 *   (expected size or the size reported by the response), clamped to [0, 1]; when no size is
 *   known the fraction of terminal members is used instead
 * - Progress is forwarded only when the aggregate increases
 * - Exactly one onBatchTerminal, after which the batch detaches from its members and is
 *   released
 */

#include <mediadl/core/uuid.h>
#include <mediadl/downloader/batch_coordinator.hpp>
#include <mediadl/downloader/transfer_queue.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <utility>

namespace mediadl::downloader {

class BatchCoordinator::Batch final : public ITransferObserver {
public:
    struct Member {
        TransferId id;
        std::string url;
        TransferState state{TransferState::Pending};
        std::uint64_t bytes{0};
        std::optional<std::uint64_t> total{};
        std::optional<TransferOutcome> outcome{};
        std::optional<Error> rejection{};
    };

    Batch(BatchId id, BatchCoordinator* owner, TransferQueue* queue,
          std::shared_ptr<IProgressSink> sink)
        : id_(std::move(id)), owner_(owner), queue_(queue), sink_(std::move(sink)) {}

    const BatchId& id() const noexcept { return id_; }

    void addMember(const Transfer& t) {
        std::lock_guard<std::recursive_mutex> lk(mutex_);
        Member m;
        m.id = t.id;
        m.url = t.url;
        m.total = t.expectedBytes;
        members_.push_back(std::move(m));
    }

    void rejectMember(std::size_t index, Error error) {
        std::lock_guard<std::recursive_mutex> lk(mutex_);
        if (index >= members_.size())
            return;
        auto& m = members_[index];
        m.state = TransferState::Failed;
        m.outcome = TransferOutcome::failed(error);
        m.rejection = std::move(error);
    }

    // All members submitted; terminal evaluation may start
    void seal() {
        std::lock_guard<std::recursive_mutex> lk(mutex_);
        sealed_ = true;
        maybeFinish();
    }

    std::vector<TransferId> pendingMemberIds() const {
        std::lock_guard<std::recursive_mutex> lk(mutex_);
        std::vector<TransferId> ids;
        for (const auto& m : members_) {
            if (!isTerminal(m.state))
                ids.push_back(m.id);
        }
        return ids;
    }

    BatchSnapshot snapshot() const {
        std::lock_guard<std::recursive_mutex> lk(mutex_);
        BatchSnapshot s;
        s.id = id_;
        s.state = terminal_ ? computeState() : BatchState::Running;
        s.fraction = lastFraction_;
        s.memberCount = members_.size();
        s.terminalCount = terminalCount();
        for (const auto& m : members_) {
            s.members.push_back(memberResult(m));
        }
        return s;
    }

    // Coordinator is going away: stop reporting to it and stop observing members
    void detach() {
        std::lock_guard<std::recursive_mutex> lk(mutex_);
        owner_ = nullptr;
        unsubscribeAll();
    }

    void onTransferProgress(const TransferId& id, const TransferProgress& progress) override {
        std::lock_guard<std::recursive_mutex> lk(mutex_);
        if (terminal_)
            return;
        auto* m = find(id);
        if (!m)
            return;
        m->bytes = std::max(m->bytes, progress.bytesReceived);
        if (progress.totalBytes && !m->total)
            m->total = progress.totalBytes;
        publishProgress();
    }

    void onTransferTerminal(const TransferId& id, const TransferOutcome& outcome) override {
        std::lock_guard<std::recursive_mutex> lk(mutex_);
        if (terminal_)
            return;
        auto* m = find(id);
        if (!m || isTerminal(m->state))
            return;
        m->state = outcome.state;
        m->outcome = outcome;
        m->bytes = std::max(m->bytes, outcome.bytesReceived);
        if (outcome.state == TransferState::Succeeded && !m->total)
            m->total = m->bytes;
        publishProgress();
        maybeFinish();
    }

private:
    Member* find(const TransferId& id) {
        auto it = std::find_if(members_.begin(), members_.end(),
                               [&id](const Member& m) { return m.id == id; });
        return it == members_.end() ? nullptr : &*it;
    }

    std::size_t terminalCount() const {
        return static_cast<std::size_t>(std::count_if(
            members_.begin(), members_.end(), [](const Member& m) { return isTerminal(m.state); }));
    }

    double aggregate() const {
        std::uint64_t received = 0;
        std::uint64_t known = 0;
        for (const auto& m : members_) {
            received += m.bytes;
            if (m.total)
                known += *m.total;
        }
        if (known == 0) {
            return members_.empty() ? 0.0
                                    : static_cast<double>(terminalCount()) /
                                          static_cast<double>(members_.size());
        }
        return std::clamp(static_cast<double>(received) / static_cast<double>(known), 0.0, 1.0);
    }

    void publishProgress() {
        const double f = aggregate();
        if (f <= lastFraction_)
            return;
        lastFraction_ = f;
        if (sink_)
            toSink("onBatchProgress", [&] { sink_->onBatchProgress(id_, f); });
    }

    // Sink failures are logged; the batch still finishes and is released
    template <typename Fn>
    void toSink(const char* what, Fn&& fn) const {
        try {
            fn();
        } catch (const std::exception& ex) {
            spdlog::warn("Batch {}: progress sink threw from {}: {}", id_, what, ex.what());
        } catch (...) {
            spdlog::warn("Batch {}: progress sink threw a non-standard exception from {}", id_,
                         what);
        }
    }

    BatchState computeState() const {
        std::size_t succeeded = 0;
        for (const auto& m : members_) {
            if (m.state == TransferState::Succeeded)
                ++succeeded;
        }
        if (succeeded == members_.size())
            return BatchState::Succeeded;
        if (succeeded == 0)
            return BatchState::Failed;
        return BatchState::PartiallyFailed;
    }

    static BatchMemberResult memberResult(const Member& m) {
        BatchMemberResult r;
        r.id = m.id;
        r.url = m.url;
        r.state = m.state;
        r.bytesReceived = m.bytes;
        if (m.outcome) {
            r.error = m.outcome->error;
            r.retryable = m.outcome->retryable;
            r.location = m.outcome->location;
        }
        if (m.rejection)
            r.error = m.rejection;
        return r;
    }

    void maybeFinish() {
        if (terminal_ || !sealed_ || terminalCount() != members_.size())
            return;
        terminal_ = true;

        BatchOutcome outcome;
        outcome.state = computeState();
        for (const auto& m : members_) {
            outcome.members.push_back(memberResult(m));
        }

        spdlog::info("Batch {} {} ({}/{} succeeded)", id_, to_string(outcome.state),
                     outcome.succeededCount(), outcome.members.size());

        if (sink_) {
            if (outcome.state == BatchState::Succeeded && lastFraction_ < 1.0) {
                lastFraction_ = 1.0;
                toSink("onBatchProgress", [&] { sink_->onBatchProgress(id_, 1.0); });
            }
            toSink("onBatchTerminal", [&] { sink_->onBatchTerminal(id_, outcome); });
        }

        unsubscribeAll();
        if (owner_) {
            owner_->release(id_);
        }
    }

    void unsubscribeAll() {
        if (!queue_)
            return;
        for (const auto& m : members_) {
            if (m.rejection)
                continue;
            auto r = queue_->unsubscribe(m.id, this);
            if (!r.ok()) {
                spdlog::debug("Batch {}: unsubscribe from {} failed: {}", id_, m.id,
                              r.error().message);
            }
        }
        queue_ = nullptr;
    }

    const BatchId id_;
    BatchCoordinator* owner_;
    TransferQueue* queue_;
    std::shared_ptr<IProgressSink> sink_;

    // Recursive: sink callbacks may re-enter through snapshot()
    mutable std::recursive_mutex mutex_;
    std::vector<Member> members_;
    double lastFraction_{0.0};
    bool sealed_{false};
    bool terminal_{false};
};

BatchCoordinator::BatchCoordinator(TransferQueue& queue, std::shared_ptr<IProgressSink> sink)
    : queue_(queue), sink_(std::move(sink)) {}

BatchCoordinator::~BatchCoordinator() {
    std::unordered_map<BatchId, std::shared_ptr<Batch>> live;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        live.swap(batches_);
    }
    for (auto& [id, batch] : live) {
        batch->detach();
    }
}

Expected<BatchId> BatchCoordinator::createBatch(std::vector<Transfer> transfers) {
    if (transfers.empty()) {
        return Error{ErrorCode::InvalidArgument, "A batch needs at least one transfer"};
    }

    std::unordered_set<TransferId> seen;
    for (auto& t : transfers) {
        if (t.id.empty())
            t.id = core::generateUUID();
        if (!seen.insert(t.id).second) {
            return Error{ErrorCode::InvalidArgument,
                         "Transfer id " + t.id + " appears more than once in the batch"};
        }
    }

    auto batch = std::make_shared<Batch>(core::generatePrefixedId("batch"), this, &queue_, sink_);
    for (const auto& t : transfers) {
        batch->addMember(t);
    }
    const BatchId id = batch->id();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        batches_.emplace(id, batch);
    }

    spdlog::info("Batch {} created with {} member(s)", id, transfers.size());
    for (std::size_t i = 0; i < transfers.size(); ++i) {
        const TransferId memberId = transfers[i].id;
        auto r = queue_.submit(std::move(transfers[i]), batch);
        if (!r.ok()) {
            spdlog::warn("Batch {}: member {} rejected: {}", id, memberId, r.error().message);
            batch->rejectMember(i, r.error());
        }
    }
    batch->seal();
    return id;
}

Expected<void> BatchCoordinator::cancelBatch(const BatchId& id) {
    std::shared_ptr<Batch> batch;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = batches_.find(id);
        if (it == batches_.end()) {
            return Error{ErrorCode::NotFound, "Unknown or finished batch " + id};
        }
        batch = it->second;
    }

    spdlog::info("Cancelling batch {}", id);
    for (const auto& memberId : batch->pendingMemberIds()) {
        auto r = queue_.cancel(memberId);
        if (!r.ok()) {
            spdlog::warn("Batch {}: cancel of member {} failed: {}", id, memberId,
                         r.error().message);
        }
    }
    return Expected<void>{};
}

Expected<BatchSnapshot> BatchCoordinator::snapshot(const BatchId& id) const {
    std::shared_ptr<Batch> batch;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = batches_.find(id);
        if (it == batches_.end()) {
            return Error{ErrorCode::NotFound, "Unknown or finished batch " + id};
        }
        batch = it->second;
    }
    return batch->snapshot();
}

std::vector<BatchId> BatchCoordinator::liveBatches() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<BatchId> ids;
    ids.reserve(batches_.size());
    for (const auto& [id, batch] : batches_) {
        ids.push_back(id);
    }
    return ids;
}

void BatchCoordinator::release(const BatchId& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    batches_.erase(id);
    spdlog::debug("Batch {} released", id);
}

} // namespace mediadl::downloader
