#pragma once

#include "dm/core/result.hpp"
#include "dm/mirror/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace dm::mirror {

/**
 * @brief Decides whether an item is skipped, downloaded fresh or resumed
 *
 * Decision table, evaluated in order:
 * 1. destination exists, expected size known and equal  -> Skip
 * 2. resume enabled, destination exists, expected known,
 *    0 < existing < expected                            -> Resume at existing
 * 3. anything else                                      -> Fresh from offset 0
 *
 * The only side effect is one stat of the destination.
 */
class TransferPlanner {
public:
    dm::Result<TransferPlan> plan(const std::filesystem::path& destination,
                                  std::optional<std::uint64_t> expected_size,
                                  bool resume_enabled) const;

    /// Pure decision step, with the local size already observed
    static TransferPlan decide(const std::filesystem::path& destination,
                               bool destination_exists,
                               std::uint64_t existing_size,
                               std::optional<std::uint64_t> expected_size,
                               bool resume_enabled);
};

} // namespace dm::mirror
