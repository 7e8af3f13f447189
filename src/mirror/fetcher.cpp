#include "dm/mirror/fetcher.hpp"

#include "dm/events/events.hpp"
#include "dm/mirror/item_transfer.hpp"

#include <system_error>
#include <utility>

namespace dm::mirror {
namespace fs = std::filesystem;

namespace {

dm::Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return dm::Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return dm::Err<void>(io_error("Failed to create directory " + parent.string() + ": " + ec.message()));
    }
    return dm::Ok();
}

} // namespace

ItemFetcher::ItemFetcher(remote::RemoteService& remote, events::EventBus& bus, MirrorOptions options)
    : remote_(remote), bus_(bus), options_(options), sink_(bus) {}

dm::Result<FetchOutcome> ItemFetcher::fetch_file(const RemoteNode& node, const fs::path& destination) {
    return fetch(destination, node.size, [this, &node](const remote::RequestHeaders& headers) {
        return remote_.open_stream(node, headers);
    });
}

dm::Result<FetchOutcome> ItemFetcher::fetch_asset(const MediaAsset& asset, const fs::path& destination_dir) {
    return fetch(asset_destination(asset, destination_dir), asset.expected_size,
                 [this, &asset](const remote::RequestHeaders& headers) {
                     return remote_.download_asset(asset, headers);
                 });
}

fs::path ItemFetcher::asset_destination(const MediaAsset& asset, const fs::path& destination_dir) {
    return destination_dir / asset.local_name();
}

dm::Result<FetchOutcome> ItemFetcher::fetch(const fs::path& destination,
                                            std::optional<std::uint64_t> expected_size,
                                            const StreamOpener& open_stream) {
    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return fail(destination, res.error());
    }

    auto plan_result = planner_.plan(destination, expected_size, options_.resume);
    if (plan_result.is_error()) {
        return fail(destination, plan_result.error());
    }
    const TransferPlan plan = plan_result.value();

    ItemTransfer item(destination);
    if (auto res = item.planned(plan); res.is_error()) {
        return fail(destination, res.error());
    }

    bus_.emit(events::TransferPlannedEvent{destination, plan.decision, plan.existing_local_size,
                                           plan.expected_size, plan.oversized});

    FetchOutcome outcome;
    outcome.decision = plan.decision;
    if (plan.decision == TransferDecision::Skip) {
        outcome.final_size = plan.existing_local_size;
        return dm::Ok(outcome);
    }

    remote::RequestHeaders headers;
    if (plan.decision == TransferDecision::Resume) {
        headers["Range"] = remote::make_range_value(*plan.range_offset);
    }

    if (auto res = item.start_streaming(); res.is_error()) {
        return fail(destination, res.error());
    }

    auto stream = open_stream(headers);
    if (stream.is_error()) {
        item.mark_failed(stream.error().message);
        return fail(destination, transfer_error(stream.error().message));
    }

    SinkRequest request;
    request.destination = destination;
    request.mode = plan.decision == TransferDecision::Resume ? WriteMode::Append : WriteMode::Truncate;
    request.start_offset = plan.range_offset.value_or(0);
    request.expected_size = plan.expected_size;
    request.label = destination.filename().string();
    request.report_progress = options_.progress;

    auto written = sink_.write(request, *stream.value());
    if (written.is_error()) {
        item.mark_failed(written.error().message);
        return fail(destination, written.error());
    }

    if (auto res = item.completed(written.value()); res.is_error()) {
        return fail(destination, res.error());
    }

    outcome.final_size = written.value();
    outcome.bytes_transferred = item.bytes_transferred();

    bus_.emit(events::TransferCompletedEvent{destination, plan.decision, outcome.bytes_transferred,
                                             outcome.final_size, item.elapsed()});
    return dm::Ok(outcome);
}

dm::Result<FetchOutcome> ItemFetcher::fail(const fs::path& destination, Error error) {
    bus_.emit(events::TransferFailedEvent{destination, error});
    return dm::Err<FetchOutcome>(std::move(error));
}

bool aborts_run(const Error& error, const MirrorOptions& options) noexcept {
    return error.kind == ErrorKind::Io && !options.keep_going;
}

void record_outcome(WalkSummary& summary, const dm::Result<FetchOutcome>& outcome) {
    ++summary.planned;
    if (outcome.is_error()) {
        ++summary.failed;
        return;
    }
    switch (outcome.value().decision) {
        case TransferDecision::Skip: ++summary.skipped; break;
        case TransferDecision::Fresh: ++summary.fresh; break;
        case TransferDecision::Resume: ++summary.resumed; break;
    }
    summary.bytes_transferred += outcome.value().bytes_transferred;
}

} // namespace dm::mirror
