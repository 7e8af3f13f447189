#pragma once

#include "dm/core/result.hpp"
#include "dm/events/event_bus.hpp"
#include "dm/mirror/fetcher.hpp"
#include "dm/mirror/types.hpp"
#include "dm/remote/service.hpp"

#include <filesystem>

namespace dm::mirror {

/**
 * @brief Mirrors a remote folder/file tree below a local directory
 *
 * Depth-first, pre-order, children in the order the remote reports them.
 * Descent uses an explicit work stack, so tree depth is bounded by memory
 * rather than by the call stack. The remote tree is assumed acyclic.
 *
 * A child that fails to transfer, or a folder whose listing fails, is
 * reported and skipped. A local I/O failure ends the walk with an error
 * unless MirrorOptions::keep_going is set.
 */
class TreeWalker {
public:
    TreeWalker(remote::RemoteService& remote, ItemFetcher& fetcher, events::EventBus& bus);

    dm::Result<WalkSummary> walk(const RemoteNode& node, const std::filesystem::path& destination);

private:
    remote::RemoteService& remote_;
    ItemFetcher& fetcher_;
    events::EventBus& bus_;
};

} // namespace dm::mirror
