#pragma once

#include "dm/core/result.hpp"
#include "dm/mirror/types.hpp"
#include "dm/remote/service.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dm::remote {

/**
 * @brief RemoteService backed by an export directory
 *
 * LAYOUT:
 * <root>/drive/...                the remote folder tree
 * <root>/photos/library.json      photo catalogue (optional)
 * <root>/photos/<blob paths>      asset contents referenced by the catalogue
 *
 * Folder listings are sorted by name so repeated runs see the same order.
 * Range requests of the form "bytes=<n>-" are honoured on every stream.
 */
class ExportStore : public RemoteService {
public:
    static constexpr std::size_t kDefaultChunkSize = 1024 * 1024;
    static constexpr const char* kCatalogueName = "library.json";

    static dm::Result<std::unique_ptr<ExportStore>> open(const std::filesystem::path& root,
                                                         std::size_t chunk_size = kDefaultChunkSize);

    dm::Result<mirror::RemoteNode> root() override;
    dm::Result<std::vector<mirror::RemoteNode>> children(const mirror::RemoteNode& folder) override;
    dm::Result<mirror::RemoteNode> lookup(const std::string& path) override;
    dm::Result<std::unique_ptr<ByteStream>> open_stream(const mirror::RemoteNode& node,
                                                        const RequestHeaders& headers) override;

    dm::Result<std::unique_ptr<AssetCursor>> all_assets() override;
    dm::Result<std::vector<AlbumInfo>> albums() override;
    dm::Result<std::unique_ptr<AssetCursor>> open_album(const std::string& key) override;
    dm::Result<std::unique_ptr<ByteStream>> download_asset(const mirror::MediaAsset& asset,
                                                           const RequestHeaders& headers) override;

    struct Album {
        AlbumInfo info;
        std::vector<std::size_t> asset_indices;
    };

    struct Catalogue {
        std::vector<mirror::MediaAsset> assets;
        std::vector<Album> albums;
    };

    /// Decode the JSON catalogue text
    static dm::Result<Catalogue> parse_catalogue(const std::string& text);

private:
    ExportStore(std::filesystem::path drive_root,
                std::filesystem::path photos_root,
                std::shared_ptr<const Catalogue> catalogue,
                std::size_t chunk_size);

    dm::Result<std::unique_ptr<ByteStream>> open_file(const std::filesystem::path& path,
                                                      const RequestHeaders& headers) const;

    std::filesystem::path drive_root_;
    std::filesystem::path photos_root_;
    std::shared_ptr<const Catalogue> catalogue_;
    std::unordered_map<std::string, std::size_t> album_index_;
    std::size_t chunk_size_;
};

} // namespace dm::remote
