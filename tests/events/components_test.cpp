#include <gtest/gtest.h>
#include "dm/events/components.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>

using namespace dm::events;
using dm::mirror::TransferDecision;

TEST(TransferStatsComponent, CountsDecisions) {
    EventBus bus;
    TransferStatsComponent stats(bus);

    bus.emit(TransferPlannedEvent{"a", TransferDecision::Skip, 10, 10, false});
    bus.emit(TransferPlannedEvent{"b", TransferDecision::Fresh, 0, 10, false});
    bus.emit(TransferPlannedEvent{"c", TransferDecision::Resume, 4, 10, false});
    bus.emit(TransferPlannedEvent{"d", TransferDecision::Fresh, 20, 10, true});

    const auto& s = stats.get_stats();
    EXPECT_EQ(s.skipped.load(), 1u);
    EXPECT_EQ(s.fresh.load(), 2u);
    EXPECT_EQ(s.resumed.load(), 1u);
}

TEST(TransferStatsComponent, CountsBytesFailuresAndMisses) {
    EventBus bus;
    TransferStatsComponent stats(bus);

    bus.emit(TransferCompletedEvent{"a", TransferDecision::Fresh, 100, 100, std::chrono::milliseconds{3}});
    bus.emit(TransferCompletedEvent{"b", TransferDecision::Resume, 6, 10, std::chrono::milliseconds{1}});
    bus.emit(TransferFailedEvent{"c", dm::transfer_error("reset")});
    bus.emit(NotFoundEvent{"album", "NoSuchAlbum"});
    bus.emit(ProgressEvent{"a", 50, 100});

    const auto& s = stats.get_stats();
    EXPECT_EQ(s.completed.load(), 2u);
    EXPECT_EQ(s.bytes_transferred.load(), 106u);
    EXPECT_EQ(s.failed.load(), 1u);
    EXPECT_EQ(s.not_found.load(), 1u);
    EXPECT_EQ(s.progress_reports.load(), 1u);
}

TEST(TransferStatsComponent, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        TransferStatsComponent stats(bus);
        EXPECT_EQ(bus.subscriber_count<TransferPlannedEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<TransferPlannedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<NotFoundEvent>(), 0u);
}

TEST(LoggerComponent, HandlesEveryEventKind) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_NO_THROW(bus.emit(TransferPlannedEvent{"a", TransferDecision::Skip, 1, 1, false}));
    EXPECT_NO_THROW(bus.emit(TransferPlannedEvent{"b", TransferDecision::Resume, 1, 2, false}));
    EXPECT_NO_THROW(bus.emit(TransferPlannedEvent{"c", TransferDecision::Fresh, 5, 2, true}));
    EXPECT_NO_THROW(bus.emit(TransferPlannedEvent{"d", TransferDecision::Fresh, 0, std::nullopt, false}));
    EXPECT_NO_THROW(bus.emit(ProgressEvent{"e", 5, 10}));
    EXPECT_NO_THROW(bus.emit(ProgressEvent{"f", 5, std::nullopt}));
    EXPECT_NO_THROW(bus.emit(TransferCompletedEvent{"g", TransferDecision::Fresh, 1, 1, std::chrono::milliseconds{0}}));
    EXPECT_NO_THROW(bus.emit(TransferFailedEvent{"h", dm::io_error("disk full")}));
    EXPECT_NO_THROW(bus.emit(NotFoundEvent{"path", "Docs"}));
}

TEST(LoggerComponent, SkipLineCarriesLocalSize) {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("%v");
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));

    {
        EventBus bus;
        LoggerComponent logger(bus);
        bus.emit(TransferPlannedEvent{"photos/a.jpg", TransferDecision::Skip, 2048, 2048, false});
    }
    spdlog::set_default_logger(previous);

    EXPECT_NE(captured.str().find("[skip] photos/a.jpg (2048 bytes, size matches)"), std::string::npos)
        << captured.str();
}

TEST(LoggerComponent, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 0u);
}
