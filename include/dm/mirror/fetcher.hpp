#pragma once

#include "dm/core/result.hpp"
#include "dm/events/event_bus.hpp"
#include "dm/mirror/byte_sink.hpp"
#include "dm/mirror/planner.hpp"
#include "dm/mirror/types.hpp"
#include "dm/remote/service.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace dm::mirror {

struct FetchOutcome {
    TransferDecision decision = TransferDecision::Fresh;
    std::uint64_t bytes_transferred = 0; ///< Written by this run; 0 for Skip
    std::uint64_t final_size = 0;
};

/**
 * @brief Mirrors one remote file or media asset onto the local disk
 *
 * Remote failures are returned as ErrorKind::Transfer and local failures
 * as ErrorKind::Io; the caller decides whether to carry on. Every
 * decision is reported on the bus when it is made.
 */
class ItemFetcher {
public:
    ItemFetcher(remote::RemoteService& remote, events::EventBus& bus, MirrorOptions options);

    dm::Result<FetchOutcome> fetch_file(const RemoteNode& node, const std::filesystem::path& destination);

    dm::Result<FetchOutcome> fetch_asset(const MediaAsset& asset, const std::filesystem::path& destination_dir);

    [[nodiscard]] const MirrorOptions& options() const noexcept { return options_; }

    /// destination_dir / (filename or "<id>.bin")
    static std::filesystem::path asset_destination(const MediaAsset& asset,
                                                   const std::filesystem::path& destination_dir);

private:
    using StreamOpener = std::function<dm::Result<std::unique_ptr<remote::ByteStream>>(const remote::RequestHeaders&)>;

    dm::Result<FetchOutcome> fetch(const std::filesystem::path& destination,
                                   std::optional<std::uint64_t> expected_size,
                                   const StreamOpener& open_stream);

    dm::Result<FetchOutcome> fail(const std::filesystem::path& destination, Error error);

    remote::RemoteService& remote_;
    events::EventBus& bus_;
    MirrorOptions options_;
    TransferPlanner planner_;
    ByteSink sink_;
};

/// True when a failed item must stop the whole run rather than just itself
bool aborts_run(const Error& error, const MirrorOptions& options) noexcept;

/// Folds one fetch result into a walk's counters
void record_outcome(WalkSummary& summary, const dm::Result<FetchOutcome>& outcome);

} // namespace dm::mirror
