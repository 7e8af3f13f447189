#include "dm/mirror/collection_walker.hpp"

namespace dm::mirror {
namespace fs = std::filesystem;

CollectionWalker::CollectionWalker(remote::RemoteService& remote, ItemFetcher& fetcher)
    : remote_(remote), fetcher_(fetcher) {}

dm::Result<WalkSummary> CollectionWalker::walk_all(remote::AssetCursor& assets, const fs::path& destination_dir) {
    WalkSummary summary;

    while (true) {
        auto next = assets.next();
        if (next.is_error()) {
            // The cursor cannot be advanced past a broken page
            return dm::Err<WalkSummary>(next.error());
        }
        if (!next.value().has_value()) {
            break;
        }

        auto outcome = fetcher_.fetch_asset(*next.value(), destination_dir);
        record_outcome(summary, outcome);
        if (outcome.is_error() && aborts_run(outcome.error(), fetcher_.options())) {
            return dm::Err<WalkSummary>(outcome.error());
        }
    }

    return dm::Ok(summary);
}

dm::Result<WalkSummary> CollectionWalker::walk_album(const std::string& album_name, const fs::path& destination_dir) {
    auto album = remote_.open_album(album_name);
    if (album.is_error()) {
        return dm::Err<WalkSummary>(album.error());
    }
    return walk_all(*album.value(), destination_dir);
}

} // namespace dm::mirror
