#include "dm/app/run_coordinator.hpp"

#include "dm/events/events.hpp"

#include <spdlog/spdlog.h>

namespace dm::app {
namespace fs = std::filesystem;
using mirror::WalkSummary;

std::string format_album_name(const remote::AlbumInfo& album) {
    const std::string& title = album.display_name.empty() ? album.key : album.display_name;
    if (title != album.key) {
        return title + " (id: " + album.key + ")";
    }
    return title;
}

RunCoordinator::RunCoordinator(remote::RemoteService& remote,
                               events::EventBus& bus,
                               const mirror::MirrorOptions& mirror_options,
                               std::ostream& listing_out)
    : remote_(remote),
      bus_(bus),
      fetcher_(remote, bus, mirror_options),
      tree_walker_(remote, fetcher_, bus),
      collection_walker_(remote, fetcher_),
      listing_out_(listing_out) {}

dm::Result<WalkSummary> RunCoordinator::run(const Options& options) {
    WalkSummary summary;

    if (options.drive_download() && options.destination) {
        auto drive = options.items.empty()
            ? download_drive(*options.destination)
            : download_items(options.items, *options.destination);
        if (drive.is_error()) {
            return drive;
        }
        summary += drive.value();
    }

    if (options.photos_list) {
        if (auto res = list_all_photos(); res.is_error()) {
            return dm::Err<WalkSummary>(res.error());
        }
    }
    for (const auto& album : options.photos_list_albums) {
        if (auto res = list_album(album); res.is_error()) {
            return dm::Err<WalkSummary>(res.error());
        }
    }
    if (options.photos_list_album_names) {
        if (auto res = list_album_names(); res.is_error()) {
            return dm::Err<WalkSummary>(res.error());
        }
    }

    if (options.photo_download() && options.destination) {
        const fs::path photos_root = *options.destination / "Photos";
        if (options.photos_all) {
            auto all = download_all_photos(photos_root);
            if (all.is_error()) {
                return all;
            }
            summary += all.value();
        }
        auto albums = download_albums(options.photo_albums, photos_root);
        if (albums.is_error()) {
            return albums;
        }
        summary += albums.value();
    }

    return dm::Ok(summary);
}

dm::Result<WalkSummary> RunCoordinator::download_items(const std::vector<std::string>& items,
                                                       const fs::path& destination) {
    spdlog::info("Downloading specified items...");
    WalkSummary summary;
    for (const auto& target : items) {
        auto node = remote_.lookup(target);
        if (node.is_error()) {
            if (node.error().kind == ErrorKind::NotFound) {
                bus_.emit(events::NotFoundEvent{"path", target});
            } else {
                bus_.emit(events::TransferFailedEvent{destination / target, node.error()});
                ++summary.failed;
            }
            continue;
        }

        auto walked = tree_walker_.walk(node.value(), destination / node.value().path);
        if (walked.is_error()) {
            return walked;
        }
        summary += walked.value();
    }
    return dm::Ok(summary);
}

dm::Result<WalkSummary> RunCoordinator::download_drive(const fs::path& destination) {
    spdlog::info("Mirroring the whole drive into {}", destination.string());
    auto root = remote_.root();
    if (root.is_error()) {
        return dm::Err<WalkSummary>(root.error());
    }
    return tree_walker_.walk(root.value(), destination);
}

dm::Result<WalkSummary> RunCoordinator::download_all_photos(const fs::path& photos_root) {
    spdlog::info("Downloading all photos (this may take a while)...");
    auto cursor = remote_.all_assets();
    if (cursor.is_error()) {
        return dm::Err<WalkSummary>(cursor.error());
    }
    return collection_walker_.walk_all(*cursor.value(), photos_root);
}

dm::Result<WalkSummary> RunCoordinator::download_albums(const std::vector<std::string>& albums,
                                                        const fs::path& photos_root) {
    WalkSummary summary;
    for (const auto& album : albums) {
        spdlog::info("Downloading album: {}", album);
        const fs::path album_dir = photos_root / album;
        auto walked = collection_walker_.walk_album(album, album_dir);
        if (walked.is_ok()) {
            summary += walked.value();
            continue;
        }

        const auto& error = walked.error();
        if (error.kind == ErrorKind::NotFound) {
            bus_.emit(events::NotFoundEvent{"album", album});
            continue;
        }
        if (mirror::aborts_run(error, fetcher_.options())) {
            return walked;
        }
        bus_.emit(events::TransferFailedEvent{album_dir, error});
        ++summary.failed;
    }
    return dm::Ok(summary);
}

dm::Result<void> RunCoordinator::list_all_photos() {
    spdlog::info("Listing all photos:");
    auto cursor = remote_.all_assets();
    if (cursor.is_error()) {
        return dm::Err<void>(cursor.error());
    }
    return print_labels(*cursor.value());
}

dm::Result<void> RunCoordinator::list_album(const std::string& album) {
    auto cursor = remote_.open_album(album);
    if (cursor.is_error()) {
        if (cursor.error().kind == ErrorKind::NotFound) {
            bus_.emit(events::NotFoundEvent{"album", album});
            return dm::Ok();
        }
        return dm::Err<void>(cursor.error());
    }
    spdlog::info("Listing album: {}", album);
    return print_labels(*cursor.value());
}

dm::Result<void> RunCoordinator::list_album_names() {
    spdlog::info("Listing all albums:");
    auto albums = remote_.albums();
    if (albums.is_error()) {
        return dm::Err<void>(albums.error());
    }
    for (const auto& album : albums.value()) {
        listing_out_ << format_album_name(album) << '\n';
    }
    listing_out_.flush();
    return dm::Ok();
}

dm::Result<void> RunCoordinator::print_labels(remote::AssetCursor& cursor) {
    while (true) {
        auto next = cursor.next();
        if (next.is_error()) {
            return dm::Err<void>(next.error());
        }
        if (!next.value().has_value()) {
            break;
        }
        listing_out_ << next.value()->label() << '\n';
    }
    listing_out_.flush();
    return dm::Ok();
}

} // namespace dm::app
