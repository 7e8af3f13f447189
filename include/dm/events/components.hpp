/**
 * @file components.hpp
 * @brief Event-driven components attached to the engine's EventBus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * TransferStatsComponent stats(bus);
 * // every decision, progress report and failure is now logged and counted
 */

#pragma once

#include "dm/events/event_bus.hpp"
#include "dm/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace dm::events {

/**
 * @brief Renders engine events as log lines through spdlog
 *
 * Decisions are logged at info level the moment they are made,
 * failures and lookup misses at error level.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        planned_id_ = bus_.subscribe<TransferPlannedEvent>([this](const TransferPlannedEvent& e) {
            on_transfer_planned(e);
        });

        progress_id_ = bus_.subscribe<ProgressEvent>([this](const ProgressEvent& e) {
            on_progress(e);
        });

        completed_id_ = bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        failed_id_ = bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_transfer_failed(e);
        });

        not_found_id_ = bus_.subscribe<NotFoundEvent>([this](const NotFoundEvent& e) {
            on_not_found(e);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<TransferPlannedEvent>(planned_id_);
        bus_.unsubscribe<ProgressEvent>(progress_id_);
        bus_.unsubscribe<TransferCompletedEvent>(completed_id_);
        bus_.unsubscribe<TransferFailedEvent>(failed_id_);
        bus_.unsubscribe<NotFoundEvent>(not_found_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    static std::string describe_size(const std::optional<std::uint64_t>& size) {
        return size ? std::to_string(*size) : std::string("unknown");
    }

    void on_transfer_planned(const TransferPlannedEvent& e) {
        const auto path = e.destination.string();
        switch (e.decision) {
            case mirror::TransferDecision::Skip:
                spdlog::info("[skip] {} ({} bytes, size matches)", path, e.existing_size);
                break;
            case mirror::TransferDecision::Resume:
                spdlog::info("[resume] {} ({}/{} bytes)", path, e.existing_size, describe_size(e.expected_size));
                break;
            case mirror::TransferDecision::Fresh:
                if (e.oversized) {
                    spdlog::warn("[size mismatch] {} is {} bytes locally but {} remotely; downloading again",
                                 path, e.existing_size, describe_size(e.expected_size));
                }
                spdlog::info("[get ] {} ({} bytes)", path, describe_size(e.expected_size));
                break;
        }
    }

    void on_progress(const ProgressEvent& e) {
        if (!e.expected_size || *e.expected_size == 0) {
            spdlog::info("  {}: {} bytes", e.label, e.bytes_written);
            return;
        }
        const double pct = static_cast<double>(e.bytes_written) / static_cast<double>(*e.expected_size) * 100.0;
        spdlog::info("  {}: {}/{} bytes ({:.1f}%)", e.label, e.bytes_written, *e.expected_size, pct);
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        spdlog::debug("[done] {} +{} bytes, {} total, {}ms",
                      e.destination.string(), e.bytes_transferred, e.final_size, e.duration.count());
    }

    void on_transfer_failed(const TransferFailedEvent& e) {
        spdlog::error("[fail] {} ({}: {})", e.destination.string(), error_kind_name(e.error.kind), e.error.message);
    }

    void on_not_found(const NotFoundEvent& e) {
        spdlog::error("[missing] {} not found: {}", e.what, e.name);
    }

    EventBus& bus_;
    size_t planned_id_ = 0;
    size_t progress_id_ = 0;
    size_t completed_id_ = 0;
    size_t failed_id_ = 0;
    size_t not_found_id_ = 0;
};

/**
 * @brief Counts decisions, bytes and failures across a run
 */
class TransferStatsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> skipped{0};
        std::atomic<uint64_t> fresh{0};
        std::atomic<uint64_t> resumed{0};
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<uint64_t> not_found{0};
        std::atomic<uint64_t> bytes_transferred{0};
        std::atomic<uint64_t> progress_reports{0};
    };

    explicit TransferStatsComponent(EventBus& bus) : bus_(bus) {
        planned_id_ = bus_.subscribe<TransferPlannedEvent>([this](const TransferPlannedEvent& e) {
            on_transfer_planned(e);
        });

        progress_id_ = bus_.subscribe<ProgressEvent>([this](const ProgressEvent&) {
            stats_.progress_reports++;
        });

        completed_id_ = bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            stats_.completed++;
            stats_.bytes_transferred += e.bytes_transferred;
        });

        failed_id_ = bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.failed++;
        });

        not_found_id_ = bus_.subscribe<NotFoundEvent>([this](const NotFoundEvent&) {
            stats_.not_found++;
        });
    }

    ~TransferStatsComponent() {
        bus_.unsubscribe<TransferPlannedEvent>(planned_id_);
        bus_.unsubscribe<ProgressEvent>(progress_id_);
        bus_.unsubscribe<TransferCompletedEvent>(completed_id_);
        bus_.unsubscribe<TransferFailedEvent>(failed_id_);
        bus_.unsubscribe<NotFoundEvent>(not_found_id_);
    }

    TransferStatsComponent(const TransferStatsComponent&) = delete;
    TransferStatsComponent& operator=(const TransferStatsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Run summary: {} downloaded ({} fresh, {} resumed), {} skipped, {} failed, {} not found, {} bytes",
                     stats_.completed.load(), stats_.fresh.load(), stats_.resumed.load(),
                     stats_.skipped.load(), stats_.failed.load(), stats_.not_found.load(),
                     stats_.bytes_transferred.load());
    }

private:
    void on_transfer_planned(const TransferPlannedEvent& e) {
        switch (e.decision) {
            case mirror::TransferDecision::Skip: stats_.skipped++; break;
            case mirror::TransferDecision::Fresh: stats_.fresh++; break;
            case mirror::TransferDecision::Resume: stats_.resumed++; break;
        }
    }

    EventBus& bus_;
    Stats stats_;
    size_t planned_id_ = 0;
    size_t progress_id_ = 0;
    size_t completed_id_ = 0;
    size_t failed_id_ = 0;
    size_t not_found_id_ = 0;
};

} // namespace dm::events
