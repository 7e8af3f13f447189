#pragma once

#include "dm/app/options.hpp"
#include "dm/core/result.hpp"
#include "dm/events/event_bus.hpp"
#include "dm/mirror/collection_walker.hpp"
#include "dm/mirror/fetcher.hpp"
#include "dm/mirror/tree_walker.hpp"
#include "dm/mirror/types.hpp"
#include "dm/remote/service.hpp"

#include <filesystem>
#include <ostream>
#include <string>

namespace dm::app {

/// "<title> (id: <key>)" when the display name differs from the key, else the title
std::string format_album_name(const remote::AlbumInfo& album);

/**
 * @brief Runs every operation requested by the command line, in order:
 *        drive download, photo listings, photo downloads
 *
 * Missing paths and albums are reported as NotFoundEvent and skipped.
 * Only a run-aborting failure (local I/O without --keep-going, or a
 * broken remote root) is returned as an error.
 */
class RunCoordinator {
public:
    RunCoordinator(remote::RemoteService& remote,
                   events::EventBus& bus,
                   const mirror::MirrorOptions& mirror_options,
                   std::ostream& listing_out);

    dm::Result<mirror::WalkSummary> run(const Options& options);

    dm::Result<mirror::WalkSummary> download_items(const std::vector<std::string>& items,
                                                   const std::filesystem::path& destination);

    dm::Result<mirror::WalkSummary> download_drive(const std::filesystem::path& destination);

    dm::Result<mirror::WalkSummary> download_all_photos(const std::filesystem::path& photos_root);

    dm::Result<mirror::WalkSummary> download_albums(const std::vector<std::string>& albums,
                                                    const std::filesystem::path& photos_root);

    dm::Result<void> list_all_photos();
    dm::Result<void> list_album(const std::string& album);
    dm::Result<void> list_album_names();

private:
    dm::Result<void> print_labels(remote::AssetCursor& cursor);

    remote::RemoteService& remote_;
    events::EventBus& bus_;
    mirror::ItemFetcher fetcher_;
    mirror::TreeWalker tree_walker_;
    mirror::CollectionWalker collection_walker_;
    std::ostream& listing_out_;
};

} // namespace dm::app
