#include "dm/mirror/item_transfer.hpp"

#include <gtest/gtest.h>

using dm::mirror::ItemTransfer;
using dm::mirror::TransferDecision;
using dm::mirror::TransferPlan;
using dm::mirror::TransferState;

namespace {

TransferPlan make_plan(TransferDecision decision, std::optional<std::uint64_t> offset = std::nullopt) {
    TransferPlan plan;
    plan.decision = decision;
    plan.range_offset = offset;
    return plan;
}

} // namespace

TEST(ItemTransferTest, FreshLifecycle) {
    ItemTransfer item("photos/a.jpg");
    EXPECT_EQ(item.state(), TransferState::Pending);

    ASSERT_TRUE(item.planned(make_plan(TransferDecision::Fresh)).is_ok());
    EXPECT_EQ(item.state(), TransferState::Planned);

    ASSERT_TRUE(item.start_streaming().is_ok());
    EXPECT_EQ(item.state(), TransferState::Streaming);

    ASSERT_TRUE(item.completed(120).is_ok());
    EXPECT_EQ(item.state(), TransferState::Completed);
    EXPECT_EQ(item.bytes_transferred(), 120u);
}

TEST(ItemTransferTest, SkipPlanIsTerminal) {
    ItemTransfer item("a");
    ASSERT_TRUE(item.planned(make_plan(TransferDecision::Skip)).is_ok());
    EXPECT_EQ(item.state(), TransferState::Skipped);
    EXPECT_TRUE(item.start_streaming().is_error());
    EXPECT_EQ(item.bytes_transferred(), 0u);
}

TEST(ItemTransferTest, ResumeCountsOnlyNewBytes) {
    ItemTransfer item("a");
    ASSERT_TRUE(item.planned(make_plan(TransferDecision::Resume, 40)).is_ok());
    ASSERT_TRUE(item.start_streaming().is_ok());
    ASSERT_TRUE(item.completed(100).is_ok());
    EXPECT_EQ(item.bytes_transferred(), 60u);
}

TEST(ItemTransferTest, RejectsOutOfOrderTransitions) {
    ItemTransfer item("a");
    EXPECT_TRUE(item.start_streaming().is_error());
    EXPECT_TRUE(item.completed(1).is_error());
    EXPECT_EQ(item.state(), TransferState::Pending);
}

TEST(ItemTransferTest, FailureFromStreamingRecordsMessage) {
    ItemTransfer item("a");
    ASSERT_TRUE(item.planned(make_plan(TransferDecision::Fresh)).is_ok());
    ASSERT_TRUE(item.start_streaming().is_ok());

    item.mark_failed("connection reset");

    EXPECT_EQ(item.state(), TransferState::Failed);
    EXPECT_EQ(item.last_error(), "connection reset");
    EXPECT_TRUE(item.completed(10).is_error());
}

TEST(ItemTransferTest, FailureAfterCompletionIsIgnored) {
    ItemTransfer item("a");
    ASSERT_TRUE(item.planned(make_plan(TransferDecision::Fresh)).is_ok());
    ASSERT_TRUE(item.start_streaming().is_ok());
    ASSERT_TRUE(item.completed(5).is_ok());

    item.mark_failed("late");

    EXPECT_EQ(item.state(), TransferState::Completed);
    EXPECT_TRUE(item.last_error().empty());
}
