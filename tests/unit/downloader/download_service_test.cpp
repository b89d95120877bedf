#include <gtest/gtest.h>
#include <mediadl/downloader/download_service.hpp>

#include "../../common/downloader_fakes.h"
#include "../../common/test_helpers.h"

using namespace mediadl::downloader;
using namespace mediadl::tests;
using namespace std::chrono_literals;

namespace {

DownloaderConfig serviceConfig() {
    DownloaderConfig c;
    c.maxConcurrent = 2;
    c.retry.maxRetries = 1;
    c.retry.initialBackoff = 1ms;
    c.retry.maxBackoff = 2ms;
    c.progressInterval = 0ms;
    return c;
}

} // namespace

TEST(DownloadService, SingleTransferReportsToSink) {
    auto exec = std::make_shared<ScriptedExecutors>();
    Attempt a;
    a.progress = {10, 40, 80};
    a.total = 80;
    a.outcome = TransferOutcome::succeeded({}, 80);
    exec->script("https://cdn.example.com/one.mp3", {a});
    auto sink = std::make_shared<RecordingSink>();

    DownloadService svc(serviceConfig(), exec->factory(), sink);
    auto id = svc.submitSingle("https://cdn.example.com/one.mp3", MediaKind::Audio);
    ASSERT_TRUE(id.ok());
    ASSERT_TRUE(svc.waitIdle(5s));

    EXPECT_EQ(svc.status(id.value()).value(), TransferState::Succeeded);
    auto progress = sink->progress(id.value());
    ASSERT_FALSE(progress.empty());
    EXPECT_TRUE(nonDecreasing(progress));
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
    auto terminals = sink->terminals(id.value());
    ASSERT_EQ(terminals.size(), 1u);
    EXPECT_EQ(terminals[0].bytesReceived, 80u);
}

TEST(DownloadService, BatchReportsOnlyAggregate) {
    auto exec = std::make_shared<ScriptedExecutors>();
    auto sink = std::make_shared<RecordingSink>();
    DownloadService svc(serviceConfig(), exec->factory(), sink);

    std::vector<MediaRequest> requests;
    for (int i = 0; i < 3; ++i) {
        MediaRequest r;
        r.url = "https://cdn.example.com/photo-" + std::to_string(i) + ".jpg";
        r.kind = MediaKind::Photo;
        r.expectedBytes = 100;
        requests.push_back(r);
    }
    auto batch = svc.submitBatch(requests);
    ASSERT_TRUE(batch.ok());
    ASSERT_TRUE(svc.waitIdle(5s));

    auto terminals = sink->batchTerminals(batch.value());
    ASSERT_EQ(terminals.size(), 1u);
    EXPECT_EQ(terminals[0].state, BatchState::Succeeded);
    for (const auto& m : terminals[0].members) {
        EXPECT_TRUE(sink->terminals(m.id).empty());
        EXPECT_TRUE(sink->progress(m.id).empty());
    }
    EXPECT_TRUE(svc.batches().liveBatches().empty());
}

TEST(DownloadService, EmptyBatchIsRejected) {
    auto exec = std::make_shared<ScriptedExecutors>();
    DownloadService svc(serviceConfig(), exec->factory(), std::make_shared<RecordingSink>());
    auto r = svc.submitBatch({});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(DownloadService, CancelSingleAndAfterShutdown) {
    auto exec = std::make_shared<ScriptedExecutors>();
    Attempt gated;
    gated.gated = true;
    exec->script("https://cdn.example.com/slow.mp4", {gated});
    auto sink = std::make_shared<RecordingSink>();
    DownloadService svc(serviceConfig(), exec->factory(), sink);

    auto id = svc.submitSingle("https://cdn.example.com/slow.mp4", MediaKind::Video);
    ASSERT_TRUE(waitUntil([&] { return exec->active() == 1; }));
    ASSERT_TRUE(svc.cancel(id.value()).ok());
    EXPECT_EQ(svc.status(id.value()).value(), TransferState::Cancelled);
    ASSERT_EQ(sink->terminals(id.value()).size(), 1u);
    EXPECT_EQ(sink->terminals(id.value())[0].state, TransferState::Cancelled);

    EXPECT_EQ(svc.cancel("unknown").error().code, ErrorCode::NotFound);
    EXPECT_EQ(svc.cancelBatch("batch-unknown").error().code, ErrorCode::NotFound);

    svc.shutdown();
    auto late = svc.submitSingle("https://cdn.example.com/late.jpg", MediaKind::Photo);
    ASSERT_FALSE(late.ok());
    EXPECT_EQ(late.error().code, ErrorCode::QueueStopped);
}

TEST(DownloadService, RequestDetailsReachTheWire) {
    auto http = std::make_shared<FakeHttpAdapter>();
    http->push({{"payload"}, 7});
    http->push({{"payload"}, 7});
    auto root = make_temp_dir("mediadl_svc_");
    TempDirGuard guard(root);

    auto config = serviceConfig();
    config.stagingDir = root / "staging";
    std::shared_ptr<IDiskWriter> disk = makeDiskWriter();
    std::shared_ptr<IRateLimiter> limiter = makeRateLimiter();
    ExecutorFactory factory = [config, http, disk, limiter]() {
        return makeTransferExecutor(config, http, disk, limiter);
    };
    auto sink = std::make_shared<RecordingSink>();
    DownloadService svc(config, factory, sink);

    MediaRequest good;
    good.url = "https://cdn.example.com/doc.jpg";
    good.headers.push_back({"Authorization", "Bearer t0k3n"});
    good.expectedBytes = 7;
    auto id = svc.submitSingle(good);
    ASSERT_TRUE(svc.waitIdle(5s));

    auto terminals = sink->terminals(id.value());
    ASSERT_EQ(terminals.size(), 1u);
    ASSERT_EQ(terminals[0].state, TransferState::Succeeded) << terminals[0].summary();
    EXPECT_EQ(read_file(terminals[0].location), "payload");
    ASSERT_TRUE(http->lastRequest().has_value());
    ASSERT_EQ(http->lastRequest()->headers.size(), 1u);
    EXPECT_EQ(http->lastRequest()->headers[0].value, "Bearer t0k3n");

    MediaRequest tampered = good;
    tampered.checksum = Checksum{HashAlgo::Sha256, std::string(64, 'f')};
    auto bad = svc.submitSingle(tampered);
    ASSERT_TRUE(svc.waitIdle(5s));
    auto badTerminals = sink->terminals(bad.value());
    ASSERT_EQ(badTerminals.size(), 1u);
    EXPECT_EQ(badTerminals[0].state, TransferState::Failed);
    EXPECT_EQ(badTerminals[0].error->code, ErrorCode::IntegrityMismatch);
    EXPECT_EQ(http->calls(), 2);
}
