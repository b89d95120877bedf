// Exercises the libcurl adapter end to end through file:// URLs (no network needed)
#include <gtest/gtest.h>
#include <mediadl/downloader/download_service.hpp>
#include <mediadl/downloader/downloader.hpp>
#include <mediadl/downloader/save_sink.hpp>

#include "../../common/downloader_fakes.h"
#include "../../common/test_helpers.h"

namespace fs = std::filesystem;
using namespace mediadl::downloader;
using namespace mediadl::tests;
using namespace std::chrono_literals;

class CurlFileUrlTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = make_temp_dir("mediadl_curl_");
        config_.stagingDir = root_ / "staging";
        config_.retry.maxRetries = 0;
        config_.progressInterval = 0ms;
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string fileUrl(const fs::path& p) const { return "file://" + p.string(); }

    TransferOutcome run(Transfer t) {
        auto executor = makeDefaultExecutorFactory(config_)();
        return executor->execute(t, {}, {});
    }

    fs::path root_;
    DownloaderConfig config_;
};

TEST_F(CurlFileUrlTest, DownloadsLocalFile) {
    const std::string body(64 * 1024 + 17, 'm');
    auto src = write_file(root_ / "remote" / "clip.mp4", body);

    auto t = makeTransfer(fileUrl(src), MediaKind::Video, body.size());
    auto out = run(t);

    ASSERT_EQ(out.state, TransferState::Succeeded) << out.summary();
    EXPECT_EQ(out.bytesReceived, body.size());
    EXPECT_EQ(read_file(out.location), body);
}

TEST_F(CurlFileUrlTest, MissingFileFailsWithoutStagingLeftovers) {
    auto t = makeTransfer(fileUrl(root_ / "remote" / "absent.jpg"), MediaKind::Photo);
    auto out = run(t);

    ASSERT_EQ(out.state, TransferState::Failed);
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code, ErrorCode::NotFound);
    EXPECT_FALSE(out.retryable);
    EXPECT_TRUE(!fs::exists(config_.stagingDir) || fs::is_empty(config_.stagingDir));
}

TEST_F(CurlFileUrlTest, SizeMismatchIsReported) {
    auto src = write_file(root_ / "remote" / "short.jpg", std::string(900, 'p'));
    auto t = makeTransfer(fileUrl(src), MediaKind::Photo, 1000);
    auto out = run(t);

    ASSERT_EQ(out.state, TransferState::Failed);
    EXPECT_EQ(out.error->code, ErrorCode::IntegrityMismatch);
}

TEST_F(CurlFileUrlTest, ServiceBatchEndToEnd) {
    std::vector<MediaRequest> requests;
    for (int i = 0; i < 4; ++i) {
        auto src = write_file(root_ / "remote" / ("p" + std::to_string(i) + ".jpg"),
                              std::string(1000 + static_cast<size_t>(i), 'a'));
        MediaRequest r;
        r.url = fileUrl(src);
        r.kind = MediaKind::Photo;
        requests.push_back(r);
    }
    requests[2].url = fileUrl(root_ / "remote" / "missing.jpg");

    auto sink = std::make_shared<RecordingSink>();
    DownloadService svc(config_, sink);
    auto batch = svc.submitBatch(requests);
    ASSERT_TRUE(batch.ok());
    ASSERT_TRUE(svc.waitIdle(10s));

    auto terminals = sink->batchTerminals(batch.value());
    ASSERT_EQ(terminals.size(), 1u);
    const auto& outcome = terminals[0];
    EXPECT_EQ(outcome.state, BatchState::PartiallyFailed);
    EXPECT_EQ(outcome.succeededCount(), 3u);
    ASSERT_EQ(outcome.failedMembers().size(), 1u);
    EXPECT_EQ(outcome.failedMembers()[0].url, requests[2].url);

    DirectorySaveSink library(root_ / "library");
    for (const auto& m : outcome.members) {
        if (m.state != TransferState::Succeeded)
            continue;
        auto saved = library.save(m.location, MediaKind::Photo);
        ASSERT_TRUE(saved.ok()) << saved.error().message;
        EXPECT_EQ(saved.value().parent_path(), root_ / "library" / "photo");
    }
}
