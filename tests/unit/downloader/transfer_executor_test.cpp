#include <gtest/gtest.h>
#include <mediadl/downloader/downloader.hpp>

#include "../../common/downloader_fakes.h"
#include "../../common/test_helpers.h"

#include <atomic>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;
using namespace mediadl::downloader;
using namespace mediadl::tests;

namespace {

class TransferExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = make_temp_dir("mediadl_exec_");
        config_.stagingDir = root_ / "staging";
        config_.progressInterval = std::chrono::milliseconds(0);
        http_ = std::make_shared<FakeHttpAdapter>();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::unique_ptr<ITransferExecutor> executor(std::shared_ptr<IDiskWriter> disk = nullptr) {
        if (!disk)
            disk = makeDiskWriter();
        std::shared_ptr<IRateLimiter> limiter = makeRateLimiter();
        limiter->setLimits(config_.rateLimit);
        return makeTransferExecutor(config_, http_, std::move(disk), std::move(limiter));
    }

    std::size_t stagingEntries() const {
        std::error_code ec;
        if (!fs::exists(config_.stagingDir, ec))
            return 0;
        return static_cast<std::size_t>(std::distance(fs::directory_iterator(config_.stagingDir),
                                                      fs::directory_iterator{}));
    }

    fs::path root_;
    DownloaderConfig config_;
    std::shared_ptr<FakeHttpAdapter> http_;
};

} // namespace

TEST_F(TransferExecutorTest, StreamsBodyIntoPrivateStagingFile) {
    http_->push({{"aaa", "bbb", "cccc"}, 10});
    auto t = makeTransfer("https://cdn.example.com/p.jpg", MediaKind::Photo);

    auto out = executor()->execute(t, {}, {});

    ASSERT_EQ(out.state, TransferState::Succeeded) << out.summary();
    EXPECT_EQ(out.bytesReceived, 10u);
    EXPECT_EQ(out.location.parent_path(), config_.stagingDir);
    EXPECT_EQ(read_file(out.location), "aaabbbcccc");
    auto perms = fs::status(out.location).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST_F(TransferExecutorTest, ForwardsRequestSettings) {
    config_.userAgent = "ua-test";
    config_.tls.insecure = true;
    http_->push({{"x"}, 1});
    auto t = makeTransfer("https://cdn.example.com/a.mp3", MediaKind::Audio);
    t.headers.push_back({"Referer", "https://example.com"});

    auto out = executor()->execute(t, {}, {});
    ASSERT_EQ(out.state, TransferState::Succeeded);

    auto req = http_->lastRequest();
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->url, t.url);
    EXPECT_EQ(req->userAgent, "ua-test");
    EXPECT_TRUE(req->tls.insecure);
    ASSERT_EQ(req->headers.size(), 1u);
    EXPECT_EQ(req->headers[0].name, "Referer");
}

TEST_F(TransferExecutorTest, ShortBodyAgainstExpectedSizeIsIntegrityMismatch) {
    http_->push({{std::string(900, 'x')}, std::nullopt});
    auto t = makeTransfer("https://cdn.example.com/v.mp4", MediaKind::Video, 1000);

    auto out = executor()->execute(t, {}, {});

    ASSERT_EQ(out.state, TransferState::Failed);
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code, ErrorCode::IntegrityMismatch);
    EXPECT_FALSE(out.retryable);
    EXPECT_EQ(stagingEntries(), 0u);
}

TEST_F(TransferExecutorTest, ShortBodyAgainstContentLengthIsIntegrityMismatch) {
    http_->push({{std::string(50, 'x')}, 80});
    auto t = makeTransfer("https://cdn.example.com/v.mp4", MediaKind::Video);

    auto out = executor()->execute(t, {}, {});

    ASSERT_EQ(out.state, TransferState::Failed);
    EXPECT_EQ(out.error->code, ErrorCode::IntegrityMismatch);
}

TEST_F(TransferExecutorTest, OversizedBodyFailsEarly) {
    http_->push({{std::string(600, 'x'), std::string(600, 'y'), std::string(600, 'z')}, {}});
    auto t = makeTransfer("https://cdn.example.com/p.png", MediaKind::Photo, 1000);

    auto out = executor()->execute(t, {}, {});

    ASSERT_EQ(out.state, TransferState::Failed);
    EXPECT_EQ(out.error->code, ErrorCode::IntegrityMismatch);
    EXPECT_LE(out.bytesReceived, 1200u);
    EXPECT_EQ(stagingEntries(), 0u);
}

TEST_F(TransferExecutorTest, ServerErrorIsRetryableClientErrorIsNot) {
    FakeResponse unavailable;
    unavailable.errorAfterChunks = Error{ErrorCode::HttpStatus, "HTTP error 503", 503};
    http_->push(unavailable);
    FakeResponse missing;
    missing.errorAfterChunks = Error{ErrorCode::HttpStatus, "HTTP error 404", 404};
    http_->push(missing);

    auto t = makeTransfer("https://cdn.example.com/a.jpg", MediaKind::Photo);
    auto first = executor()->execute(t, {}, {});
    auto second = executor()->execute(t, {}, {});

    ASSERT_EQ(first.state, TransferState::Failed);
    EXPECT_EQ(first.error->code, ErrorCode::HttpStatus);
    EXPECT_EQ(first.error->httpStatus, 503);
    EXPECT_TRUE(first.retryable);

    ASSERT_EQ(second.state, TransferState::Failed);
    EXPECT_EQ(second.error->httpStatus, 404);
    EXPECT_FALSE(second.retryable);
    EXPECT_EQ(stagingEntries(), 0u);
}

TEST_F(TransferExecutorTest, StorageFailureIsFinalAndCleansUp) {
    http_->push({{"abc"}, 3});
    auto disk = std::make_shared<FailingDiskWriter>();
    auto t = makeTransfer("https://cdn.example.com/a.jpg", MediaKind::Photo);

    auto out = executor(disk)->execute(t, {}, {});

    ASSERT_EQ(out.state, TransferState::Failed);
    EXPECT_EQ(out.error->code, ErrorCode::StorageWriteFailure);
    EXPECT_FALSE(out.retryable);
    ASSERT_EQ(disk->created.size(), 1u);
    EXPECT_FALSE(fs::exists(disk->created[0]));
}

TEST_F(TransferExecutorTest, CancelAbortsAndDeletesPartialBytes) {
    FakeResponse r;
    r.chunks = {"partial"};
    r.hangUntilCancelled = true;
    http_->push(r);
    auto t = makeTransfer("https://cdn.example.com/v.mp4", MediaKind::Video);

    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        cancel = true;
    });
    auto out = executor()->execute(t, {}, [&] { return cancel.load(); });
    canceller.join();

    EXPECT_EQ(out.state, TransferState::Cancelled);
    EXPECT_FALSE(out.error.has_value());
    EXPECT_EQ(stagingEntries(), 0u);
}

TEST_F(TransferExecutorTest, MalformedUrlFailsWithoutFetching) {
    auto t = makeTransfer("not a url", MediaKind::Photo);
    auto out = executor()->execute(t, {}, {});
    ASSERT_EQ(out.state, TransferState::Failed);
    EXPECT_EQ(out.error->code, ErrorCode::InvalidArgument);
    EXPECT_EQ(http_->calls(), 0);
}

TEST_F(TransferExecutorTest, ProgressIsNonDecreasingAndEndsAtTotal) {
    http_->push({{"aa", "bb", "cc", "dd", "ee"}, 10});
    auto t = makeTransfer("https://cdn.example.com/p.jpg", MediaKind::Photo);

    std::vector<ProgressEvent> events;
    auto out = executor()->execute(t, [&](const ProgressEvent& ev) { events.push_back(ev); }, {});

    ASSERT_EQ(out.state, TransferState::Succeeded);
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events.front().stage, ProgressStage::Connecting);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].downloadedBytes, events[i - 1].downloadedBytes);
    }
    EXPECT_EQ(events.back().downloadedBytes, 10u);
    ASSERT_TRUE(events.back().totalBytes.has_value());
    EXPECT_EQ(*events.back().totalBytes, 10u);
}

TEST_F(TransferExecutorTest, ProgressIsCoalesced) {
    config_.progressInterval = std::chrono::hours(1);
    std::vector<std::string> chunks(50, "z");
    http_->push({chunks, 50});
    auto t = makeTransfer("https://cdn.example.com/p.jpg", MediaKind::Photo);

    std::vector<ProgressEvent> events;
    auto out = executor()->execute(t, [&](const ProgressEvent& ev) { events.push_back(ev); }, {});

    ASSERT_EQ(out.state, TransferState::Succeeded);
    // Connecting, at most one interval tick, and the final count
    EXPECT_LE(events.size(), 3u);
    EXPECT_EQ(events.back().downloadedBytes, 50u);
}

TEST_F(TransferExecutorTest, ChecksumVerification) {
    http_->push({{"hel", "lo"}, 5});
    http_->push({{"hello"}, 5});
    http_->push({{"hello"}, 5});

    auto good = makeTransfer("https://cdn.example.com/h.txt", MediaKind::Photo);
    good.checksum =
        Checksum{HashAlgo::Sha256, "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824"};
    auto out = executor()->execute(good, {}, {});
    EXPECT_EQ(out.state, TransferState::Succeeded) << out.summary();

    auto good512 = makeTransfer("https://cdn.example.com/h.txt", MediaKind::Photo);
    good512.checksum = Checksum{HashAlgo::Sha512,
                                "9B71D224BD62F3785D96D46AD3EA3D73319BFBC2890CAADAE2DFF72519673CA7"
                                "2323C3D99BA5C11D7C7ACC6E14B8C5DA0C4663475C2E5C3ADEF46F73BCDEC043"};
    auto out512 = executor()->execute(good512, {}, {});
    EXPECT_EQ(out512.state, TransferState::Succeeded) << out512.summary();

    auto bad = makeTransfer("https://cdn.example.com/h.txt", MediaKind::Photo);
    bad.checksum = Checksum{HashAlgo::Sha256, std::string(64, '0')};
    auto failed = executor()->execute(bad, {}, {});
    ASSERT_EQ(failed.state, TransferState::Failed);
    EXPECT_EQ(failed.error->code, ErrorCode::IntegrityMismatch);
}
