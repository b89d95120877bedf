#pragma once

/*
 * mediadl/include/mediadl/downloader/batch_coordinator.hpp
 *
 * Groups transfers into one logical operation with a single aggregate progress stream and a
 * single terminal report delivered to an IProgressSink.
 */

#include <mediadl/downloader/downloader.hpp>

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace mediadl::downloader {

class TransferQueue;

/**
 * Live view of a batch that has not reached its terminal state.
 */
struct BatchSnapshot {
    BatchId id;
    BatchState state{BatchState::Running};
    double fraction{0.0};
    std::size_t memberCount{0};
    std::size_t terminalCount{0};
    std::vector<BatchMemberResult> members;
};

class BatchCoordinator {
public:
    BatchCoordinator(TransferQueue& queue, std::shared_ptr<IProgressSink> sink);
    ~BatchCoordinator();

    BatchCoordinator(const BatchCoordinator&) = delete;
    BatchCoordinator& operator=(const BatchCoordinator&) = delete;

    /**
     * Submit every transfer to the queue as members of a new batch. Members whose submission
     * is rejected count as Failed with the rejection error. An empty list is InvalidArgument.
     */
    Expected<BatchId> createBatch(std::vector<Transfer> transfers);

    /**
     * Cancel every non-terminal member. The batch state follows from the member states.
     * Unknown (or already released) batch -> NotFound.
     */
    Expected<void> cancelBatch(const BatchId& id);

    Expected<BatchSnapshot> snapshot(const BatchId& id) const;
    std::vector<BatchId> liveBatches() const;

private:
    class Batch;

    void release(const BatchId& id);

    TransferQueue& queue_;
    std::shared_ptr<IProgressSink> sink_;

    mutable std::mutex mutex_;
    std::unordered_map<BatchId, std::shared_ptr<Batch>> batches_;
};

} // namespace mediadl::downloader
