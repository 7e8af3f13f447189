#include "dm/mirror/tree_walker.hpp"

#include "dm/events/events.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace dm::mirror {
namespace fs = std::filesystem;

namespace {

struct PendingEntry {
    RemoteNode node;
    fs::path destination;
};

} // namespace

TreeWalker::TreeWalker(remote::RemoteService& remote, ItemFetcher& fetcher, events::EventBus& bus)
    : remote_(remote), fetcher_(fetcher), bus_(bus) {}

dm::Result<WalkSummary> TreeWalker::walk(const RemoteNode& node, const fs::path& destination) {
    WalkSummary summary;
    const auto& options = fetcher_.options();

    std::vector<PendingEntry> stack;
    stack.push_back(PendingEntry{node, destination});

    while (!stack.empty()) {
        PendingEntry entry = std::move(stack.back());
        stack.pop_back();

        if (!entry.node.is_folder()) {
            auto outcome = fetcher_.fetch_file(entry.node, entry.destination);
            record_outcome(summary, outcome);
            if (outcome.is_error() && aborts_run(outcome.error(), options)) {
                return dm::Err<WalkSummary>(outcome.error());
            }
            continue;
        }

        std::error_code ec;
        fs::create_directories(entry.destination, ec);
        if (ec && !fs::is_directory(entry.destination)) {
            auto error = io_error("Failed to create directory " + entry.destination.string() + ": " + ec.message());
            bus_.emit(events::TransferFailedEvent{entry.destination, error});
            ++summary.failed;
            if (aborts_run(error, options)) {
                return dm::Err<WalkSummary>(std::move(error));
            }
            continue;
        }

        auto children = remote_.children(entry.node);
        if (children.is_error()) {
            bus_.emit(events::TransferFailedEvent{entry.destination, children.error()});
            ++summary.failed;
            continue;
        }

        // Reverse push keeps the remote's order when popping
        auto& listed = children.value();
        for (auto it = listed.rbegin(); it != listed.rend(); ++it) {
            fs::path child_destination = entry.destination / it->name;
            stack.push_back(PendingEntry{std::move(*it), std::move(child_destination)});
        }
    }

    return dm::Ok(summary);
}

} // namespace dm::mirror
