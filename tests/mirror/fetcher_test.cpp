#include "dm/mirror/fetcher.hpp"

#include "dm/events/events.hpp"
#include "support/fake_remote.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace fs = std::filesystem;
using namespace dm::events;
using dm::mirror::FetchOutcome;
using dm::mirror::ItemFetcher;
using dm::mirror::MediaAsset;
using dm::mirror::MirrorOptions;
using dm::mirror::TransferDecision;
using dm::mirror::WalkSummary;
using dm::testing::FakeRemote;
using dm::testing::create_temp_dir;
using dm::testing::read_file;
using dm::testing::write_file;

class ItemFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir("dm_fetcher_test_");
        bus_.subscribe<TransferPlannedEvent>([this](const TransferPlannedEvent& e) { planned_.push_back(e); });
        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) { completed_.push_back(e); });
        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) { failed_.push_back(e); });
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    dm::Result<FetchOutcome> fetch(const std::string& path, const MirrorOptions& options) {
        ItemFetcher fetcher(remote_, bus_, options);
        auto node = remote_.lookup(path);
        EXPECT_TRUE(node.is_ok());
        return fetcher.fetch_file(node.value(), dir_ / path);
    }

    fs::path dir_;
    FakeRemote remote_;
    EventBus bus_;
    std::vector<TransferPlannedEvent> planned_;
    std::vector<TransferCompletedEvent> completed_;
    std::vector<TransferFailedEvent> failed_;
};

TEST_F(ItemFetcherTest, FreshDownloadCreatesParentsAndReports) {
    remote_.add_file("Docs/notes/a.txt", "0123456789");

    auto outcome = fetch("Docs/notes/a.txt", MirrorOptions{});

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().decision, TransferDecision::Fresh);
    EXPECT_EQ(outcome.value().bytes_transferred, 10u);
    EXPECT_EQ(read_file(dir_ / "Docs/notes/a.txt"), "0123456789");

    ASSERT_EQ(planned_.size(), 1u);
    EXPECT_EQ(planned_[0].decision, TransferDecision::Fresh);
    ASSERT_EQ(completed_.size(), 1u);
    EXPECT_EQ(completed_[0].final_size, 10u);
    EXPECT_TRUE(failed_.empty());
}

TEST_F(ItemFetcherTest, SecondRunSkipsWithoutOpeningStream) {
    remote_.add_file("a.txt", "0123456789");
    ASSERT_TRUE(fetch("a.txt", MirrorOptions{}).is_ok());
    const auto requests = remote_.stream_requests();

    auto again = fetch("a.txt", MirrorOptions{});

    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().decision, TransferDecision::Skip);
    EXPECT_EQ(again.value().bytes_transferred, 0u);
    EXPECT_EQ(remote_.stream_requests(), requests);
    EXPECT_EQ(completed_.size(), 1u);
}

TEST_F(ItemFetcherTest, ResumeRequestsRangeAndAppends) {
    remote_.add_file("a.txt", "0123456789");
    write_file(dir_ / "a.txt", "0123");

    MirrorOptions options;
    options.resume = true;
    auto outcome = fetch("a.txt", options);

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().decision, TransferDecision::Resume);
    EXPECT_EQ(outcome.value().bytes_transferred, 6u);
    EXPECT_EQ(outcome.value().final_size, 10u);
    EXPECT_EQ(read_file(dir_ / "a.txt"), "0123456789");

    ASSERT_EQ(remote_.requests.size(), 1u);
    EXPECT_EQ(remote_.requests[0].headers.at("Range"), "bytes=4-");
}

TEST_F(ItemFetcherTest, PartialWithoutResumeDownloadsFromScratch) {
    remote_.add_file("a.txt", "0123456789");
    write_file(dir_ / "a.txt", "xxxx");

    auto outcome = fetch("a.txt", MirrorOptions{});

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().decision, TransferDecision::Fresh);
    EXPECT_EQ(read_file(dir_ / "a.txt"), "0123456789");
    ASSERT_EQ(remote_.requests.size(), 1u);
    EXPECT_EQ(remote_.requests[0].headers.count("Range"), 0u);
}

TEST_F(ItemFetcherTest, OversizedLocalFileIsReplaced) {
    remote_.add_file("a.txt", "short");
    write_file(dir_ / "a.txt", "much longer local content");

    MirrorOptions options;
    options.resume = true;
    auto outcome = fetch("a.txt", options);

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().decision, TransferDecision::Fresh);
    ASSERT_EQ(planned_.size(), 1u);
    EXPECT_TRUE(planned_[0].oversized);
    EXPECT_EQ(read_file(dir_ / "a.txt"), "short");
}

TEST_F(ItemFetcherTest, UnknownSizeIsAlwaysDownloaded) {
    remote_.add_file("a.txt", "abc", false);
    write_file(dir_ / "a.txt", "abc");

    auto outcome = fetch("a.txt", MirrorOptions{});

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().decision, TransferDecision::Fresh);
    EXPECT_EQ(remote_.stream_requests(), 1u);
}

TEST_F(ItemFetcherTest, OpenFailureIsTransferError) {
    remote_.add_file("a.txt", "abc");
    remote_.blob("a.txt").fail_open = true;

    auto outcome = fetch("a.txt", MirrorOptions{});

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, dm::ErrorKind::Transfer);
    ASSERT_EQ(failed_.size(), 1u);
    EXPECT_EQ(failed_[0].destination.string(), (dir_ / "a.txt").string());
    EXPECT_TRUE(completed_.empty());
}

TEST_F(ItemFetcherTest, InterruptedDownloadResumesOnNextRun) {
    const std::string content = dm::testing::make_payload(64);
    remote_.add_file("big.bin", content);
    remote_.blob("big.bin").fail_after = 24;

    MirrorOptions options;
    options.resume = true;
    auto first = fetch("big.bin", options);
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(fs::file_size(dir_ / "big.bin"), 24u);

    remote_.blob("big.bin").fail_after.reset();
    auto second = fetch("big.bin", options);

    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().decision, TransferDecision::Resume);
    EXPECT_EQ(second.value().bytes_transferred, 40u);
    EXPECT_EQ(read_file(dir_ / "big.bin"), content);
}

TEST_F(ItemFetcherTest, AssetWithoutFilenameUsesIdDotBin) {
    remote_.add_asset("AX12", std::nullopt, "pixels");
    ItemFetcher fetcher(remote_, bus_, MirrorOptions{});

    MediaAsset asset;
    asset.id = "AX12";
    asset.expected_size = 6;
    asset.location = "AX12";
    auto outcome = fetcher.fetch_asset(asset, dir_ / "Photos");

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(read_file(dir_ / "Photos" / "AX12.bin"), "pixels");
    EXPECT_EQ(ItemFetcher::asset_destination(asset, "out").string(), (fs::path("out") / "AX12.bin").string());
}

TEST(FailurePolicy, OnlyLocalIoAbortsTheRun) {
    MirrorOptions strict;
    MirrorOptions lenient;
    lenient.keep_going = true;

    EXPECT_TRUE(dm::mirror::aborts_run(dm::io_error("disk full"), strict));
    EXPECT_FALSE(dm::mirror::aborts_run(dm::io_error("disk full"), lenient));
    EXPECT_FALSE(dm::mirror::aborts_run(dm::transfer_error("reset"), strict));
    EXPECT_FALSE(dm::mirror::aborts_run(dm::not_found_error("gone"), strict));
}

TEST(FailurePolicy, RecordOutcomeFoldsCounters) {
    WalkSummary summary;
    FetchOutcome fresh{TransferDecision::Fresh, 10, 10};
    FetchOutcome resumed{TransferDecision::Resume, 4, 10};
    FetchOutcome skipped{TransferDecision::Skip, 0, 10};

    dm::mirror::record_outcome(summary, dm::Ok(fresh));
    dm::mirror::record_outcome(summary, dm::Ok(resumed));
    dm::mirror::record_outcome(summary, dm::Ok(skipped));
    dm::mirror::record_outcome(summary, dm::Err<FetchOutcome>(dm::transfer_error("reset")));

    EXPECT_EQ(summary.planned, 4u);
    EXPECT_EQ(summary.fresh, 1u);
    EXPECT_EQ(summary.resumed, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.bytes_transferred, 14u);
}

TEST_F(ItemFetcherTest, EmptyBlocksFromRemoteAreIgnored) {
    remote_.interleave_empty_blocks = true;
    remote_.chunk_size = 3;
    remote_.add_file("a.txt", "0123456789");

    auto outcome = fetch("a.txt", MirrorOptions{});

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().final_size, 10u);
    EXPECT_EQ(read_file(dir_ / "a.txt"), "0123456789");
}
