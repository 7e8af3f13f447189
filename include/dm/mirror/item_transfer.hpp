#pragma once

#include "dm/core/result.hpp"
#include "dm/mirror/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace dm::mirror {

enum class TransferState {
    Pending,
    Planned,
    Skipped,
    Streaming,
    Completed,
    Failed
};

/**
 * @brief Lifecycle of a single item within one run
 *
 * Pending -> Planned -> Skipped
 *                    -> Streaming -> Completed
 * Failed is reachable from every non-terminal state.
 */
class ItemTransfer {
public:
    explicit ItemTransfer(std::filesystem::path destination);

    [[nodiscard]] TransferState state() const noexcept { return state_; }
    [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }
    [[nodiscard]] const TransferPlan& plan() const noexcept { return plan_; }
    [[nodiscard]] std::uint64_t bytes_transferred() const noexcept { return bytes_transferred_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    dm::Result<void> planned(TransferPlan plan);
    dm::Result<void> start_streaming();
    dm::Result<void> completed(std::uint64_t final_size);
    /// No-op once the item reached a terminal state
    void mark_failed(std::string error_message);

    /// Time spent since start_streaming()
    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    dm::Result<void> transition_to(TransferState next_state);
    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    std::filesystem::path destination_;
    TransferState state_ = TransferState::Pending;
    TransferPlan plan_;
    std::uint64_t bytes_transferred_ = 0;
    std::string last_error_;
    std::chrono::steady_clock::time_point streaming_started_{};
};

} // namespace dm::mirror
