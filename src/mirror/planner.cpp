#include "dm/mirror/planner.hpp"

#include <system_error>

namespace dm::mirror {
namespace fs = std::filesystem;

dm::Result<TransferPlan> TransferPlanner::plan(const fs::path& destination,
                                               std::optional<std::uint64_t> expected_size,
                                               bool resume_enabled) const {
    std::error_code ec;
    const auto status = fs::status(destination, ec);
    if (ec && status.type() != fs::file_type::not_found) {
        return dm::Err<TransferPlan>(io_error("Failed to stat " + destination.string() + ": " + ec.message()));
    }

    if (!fs::exists(status)) {
        return dm::Ok(decide(destination, false, 0, expected_size, resume_enabled));
    }

    if (!fs::is_regular_file(status)) {
        return dm::Err<TransferPlan>(io_error("Destination exists and is not a regular file: " + destination.string()));
    }

    const auto existing_size = fs::file_size(destination, ec);
    if (ec) {
        return dm::Err<TransferPlan>(io_error("Failed to read size of " + destination.string() + ": " + ec.message()));
    }

    return dm::Ok(decide(destination, true, static_cast<std::uint64_t>(existing_size), expected_size, resume_enabled));
}

TransferPlan TransferPlanner::decide(const fs::path& destination,
                                     bool destination_exists,
                                     std::uint64_t existing_size,
                                     std::optional<std::uint64_t> expected_size,
                                     bool resume_enabled) {
    TransferPlan plan;
    plan.destination_path = destination;
    plan.existing_local_size = destination_exists ? existing_size : 0;
    plan.expected_size = expected_size;

    if (destination_exists && expected_size && *expected_size == existing_size) {
        plan.decision = TransferDecision::Skip;
        return plan;
    }

    if (resume_enabled && destination_exists && expected_size &&
        existing_size > 0 && existing_size < *expected_size) {
        plan.decision = TransferDecision::Resume;
        plan.range_offset = existing_size;
        return plan;
    }

    // Unknown size, resume disabled, empty file or a local copy larger than the remote one
    plan.decision = TransferDecision::Fresh;
    plan.oversized = destination_exists && expected_size && existing_size > *expected_size;
    return plan;
}

} // namespace dm::mirror
