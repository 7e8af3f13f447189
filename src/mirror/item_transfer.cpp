#include "dm/mirror/item_transfer.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace dm::mirror {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    static const std::unordered_map<TransferState, std::vector<TransferState>> transitions {
        {TransferState::Pending, {TransferState::Planned}},
        {TransferState::Planned, {TransferState::Skipped, TransferState::Streaming}},
        {TransferState::Streaming, {TransferState::Completed}},
    };

    if (target == TransferState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

ItemTransfer::ItemTransfer(std::filesystem::path destination)
    : destination_(std::move(destination)) {}

dm::Result<void> ItemTransfer::planned(TransferPlan plan) {
    auto result = transition_to(TransferState::Planned);
    if (result.is_error()) {
        return result;
    }
    plan_ = std::move(plan);
    if (plan_.decision == TransferDecision::Skip) {
        return transition_to(TransferState::Skipped);
    }
    return dm::Ok();
}

dm::Result<void> ItemTransfer::start_streaming() {
    auto result = transition_to(TransferState::Streaming);
    if (result.is_ok()) {
        streaming_started_ = std::chrono::steady_clock::now();
    }
    return result;
}

dm::Result<void> ItemTransfer::completed(std::uint64_t final_size) {
    auto result = transition_to(TransferState::Completed);
    if (result.is_ok()) {
        const auto offset = plan_.range_offset.value_or(0);
        bytes_transferred_ = final_size >= offset ? final_size - offset : 0;
    }
    return result;
}

void ItemTransfer::mark_failed(std::string error_message) {
    if (can_transition(TransferState::Failed)) {
        state_ = TransferState::Failed;
        last_error_ = std::move(error_message);
    }
}

std::chrono::milliseconds ItemTransfer::elapsed() const {
    if (state_ != TransferState::Streaming && state_ != TransferState::Completed) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - streaming_started_);
}

dm::Result<void> ItemTransfer::transition_to(TransferState next_state) {
    if (!can_transition(next_state)) {
        return dm::Err<void>(Error{ErrorKind::InvalidArgument,
                                   "Illegal transfer state transition for " + destination_.string()});
    }
    state_ = next_state;
    return dm::Ok();
}

bool ItemTransfer::can_transition(TransferState target) const noexcept {
    if (state_ == TransferState::Failed || state_ == TransferState::Completed ||
        state_ == TransferState::Skipped) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace dm::mirror
