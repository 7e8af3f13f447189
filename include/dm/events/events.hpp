/**
 * @file events.hpp
 * @brief Event types emitted by the download engine
 *
 * Components never print. They emit these events on the EventBus and
 * whoever is subscribed (the logger, the stats counter, a test) decides
 * what to do with them. Events are observational only: no handler can
 * change the outcome of a transfer.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: TransferPlannedEvent, TransferFailedEvent
 */

#pragma once

#include "dm/core/error.hpp"
#include "dm/mirror/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dm::events {

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once per item, at the moment the planner decides
 *
 * WHO EMITS: ItemFetcher
 * WHO SUBSCRIBES: LoggerComponent ([skip] / [get ] / [resume] lines),
 *                 TransferStatsComponent
 */
struct TransferPlannedEvent {
    std::filesystem::path destination;
    mirror::TransferDecision decision = mirror::TransferDecision::Fresh;
    std::uint64_t existing_size = 0;
    std::optional<std::uint64_t> expected_size;
    bool oversized = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Periodic progress report from the ByteSink
 *
 * bytes_written includes the bytes already on disk before a resumed
 * transfer started, so percentages stay correct.
 */
struct ProgressEvent {
    std::string label;
    std::uint64_t bytes_written = 0;
    std::optional<std::uint64_t> expected_size;
};

/**
 * @brief Emitted after a stream has been fully written to disk
 */
struct TransferCompletedEvent {
    std::filesystem::path destination;
    mirror::TransferDecision decision = mirror::TransferDecision::Fresh;
    std::uint64_t bytes_transferred = 0; ///< Bytes written by this run only
    std::uint64_t final_size = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when one item (or one folder listing) could not be mirrored
 */
struct TransferFailedEvent {
    std::filesystem::path destination;
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Lookup Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a requested path or album does not exist remotely
 *
 * WHO EMITS: RunCoordinator
 * WHO SUBSCRIBES: LoggerComponent (error stream), TransferStatsComponent
 */
struct NotFoundEvent {
    std::string what;   ///< "path" or "album"
    std::string name;
};

} // namespace dm::events
