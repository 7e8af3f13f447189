#pragma once

#include "dm/core/result.hpp"
#include "dm/mirror/fetcher.hpp"
#include "dm/mirror/types.hpp"
#include "dm/remote/service.hpp"

#include <filesystem>
#include <string>

namespace dm::mirror {

/**
 * @brief Mirrors flat collections of media assets into one directory
 *
 * Assets are pulled from the cursor one at a time and never collected
 * up front. Failure policy matches TreeWalker.
 */
class CollectionWalker {
public:
    CollectionWalker(remote::RemoteService& remote, ItemFetcher& fetcher);

    dm::Result<WalkSummary> walk_all(remote::AssetCursor& assets, const std::filesystem::path& destination_dir);

    /**
     * @brief Mirror album `album_name` into destination_dir
     *
     * Fails with ErrorKind::NotFound when the album does not exist; callers
     * handling several albums log that and move on to the next name.
     */
    dm::Result<WalkSummary> walk_album(const std::string& album_name, const std::filesystem::path& destination_dir);

private:
    remote::RemoteService& remote_;
    ItemFetcher& fetcher_;
};

} // namespace dm::mirror
