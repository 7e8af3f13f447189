#include "dm/remote/export_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace dm::remote {
namespace fs = std::filesystem;
using json = nlohmann::json;
using mirror::MediaAsset;
using mirror::NodeKind;
using mirror::RemoteNode;

namespace {

class FileByteStream : public ByteStream {
public:
    FileByteStream(std::ifstream input, std::string name, std::size_t chunk_size)
        : input_(std::move(input)), name_(std::move(name)), chunk_size_(chunk_size) {}

    dm::Result<std::optional<ByteBlock>> next_block() override {
        if (!input_.is_open() || input_.eof()) {
            return dm::Ok<std::optional<ByteBlock>>(std::nullopt);
        }

        ByteBlock block(chunk_size_);
        input_.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
        if (input_.bad()) {
            return dm::Err<std::optional<ByteBlock>>(transfer_error("Read failed on " + name_));
        }

        block.resize(static_cast<std::size_t>(input_.gcount()));
        if (block.empty()) {
            input_.close();
            return dm::Ok<std::optional<ByteBlock>>(std::nullopt);
        }
        return dm::Ok<std::optional<ByteBlock>>(std::move(block));
    }

private:
    std::ifstream input_;
    std::string name_;
    std::size_t chunk_size_;
};

/// Hands out catalogue entries one at a time, either all of them or an album's subset
class CatalogueCursor : public AssetCursor {
public:
    CatalogueCursor(std::shared_ptr<const ExportStore::Catalogue> catalogue,
                    const std::vector<std::size_t>* indices)
        : catalogue_(std::move(catalogue)), indices_(indices) {}

    dm::Result<std::optional<MediaAsset>> next() override {
        const std::size_t total = indices_ ? indices_->size() : catalogue_->assets.size();
        if (position_ >= total) {
            return dm::Ok<std::optional<MediaAsset>>(std::nullopt);
        }
        const std::size_t index = indices_ ? (*indices_)[position_] : position_;
        ++position_;
        return dm::Ok<std::optional<MediaAsset>>(catalogue_->assets[index]);
    }

private:
    std::shared_ptr<const ExportStore::Catalogue> catalogue_;
    const std::vector<std::size_t>* indices_; ///< Points into *catalogue_; nullptr means every asset
    std::size_t position_ = 0;
};

std::optional<std::string> optional_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

dm::Result<std::optional<std::uint64_t>> optional_size(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return dm::Ok<std::optional<std::uint64_t>>(std::nullopt);
    }
    if (!it->is_number_unsigned()) {
        return dm::Err<std::optional<std::uint64_t>>(
            parse_error(std::string("\"") + key + "\" must be a non-negative integer, got " + it->dump()));
    }
    return dm::Ok<std::optional<std::uint64_t>>(it->get<std::uint64_t>());
}

/// Splits "a/b/c" into components, rejecting "." and ".." so lookups stay inside the drive
std::optional<std::vector<std::string>> split_remote_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(path);
    while (std::getline(stream, current, '/')) {
        if (current.empty()) {
            continue;
        }
        if (current == "." || current == "..") {
            return std::nullopt;
        }
        parts.push_back(current);
    }
    return parts;
}

/// True for a relative path with no "." or ".." component, i.e. one that stays below its base
bool stays_inside(const std::string& path) {
    if (path.empty() || fs::path(path).has_root_path() || path.find('\\') != std::string::npos) {
        return false;
    }
    auto parts = split_remote_path(path);
    return parts && !parts->empty();
}

} // namespace

ExportStore::ExportStore(fs::path drive_root,
                         fs::path photos_root,
                         std::shared_ptr<const Catalogue> catalogue,
                         std::size_t chunk_size)
    : drive_root_(std::move(drive_root)),
      photos_root_(std::move(photos_root)),
      catalogue_(std::move(catalogue)),
      chunk_size_(chunk_size) {
    for (std::size_t i = 0; i < catalogue_->albums.size(); ++i) {
        album_index_.emplace(catalogue_->albums[i].info.key, i);
    }
}

dm::Result<std::unique_ptr<ExportStore>> ExportStore::open(const fs::path& root, std::size_t chunk_size) {
    if (chunk_size == 0) {
        return dm::Err<std::unique_ptr<ExportStore>>(invalid_argument_error("chunk_size must be > 0"));
    }

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return dm::Err<std::unique_ptr<ExportStore>>(not_found_error("Library not found: " + root.string()));
    }

    const fs::path drive_root = root / "drive";
    const fs::path photos_root = root / "photos";
    const fs::path catalogue_path = photos_root / kCatalogueName;

    auto catalogue = std::make_shared<Catalogue>();
    if (fs::exists(catalogue_path, ec)) {
        std::ifstream input(catalogue_path, std::ios::binary);
        if (!input) {
            return dm::Err<std::unique_ptr<ExportStore>>(io_error("Failed to open " + catalogue_path.string()));
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();

        auto parsed = parse_catalogue(buffer.str());
        if (parsed.is_error()) {
            return dm::Err<std::unique_ptr<ExportStore>>(
                parse_error(catalogue_path.string() + ": " + parsed.error().message));
        }
        *catalogue = std::move(parsed.value());
    }

    return dm::Ok(std::unique_ptr<ExportStore>(
        new ExportStore(drive_root, photos_root, std::move(catalogue), chunk_size)));
}

dm::Result<ExportStore::Catalogue> ExportStore::parse_catalogue(const std::string& text) {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return dm::Err<Catalogue>(parse_error("Invalid JSON catalogue"));
    }

    Catalogue catalogue;
    std::unordered_map<std::string, std::size_t> by_id;

    try {
        for (const auto& entry : document.value("assets", json::array())) {
            MediaAsset asset;
            asset.id = entry.at("id").get<std::string>();
            asset.filename = optional_string(entry, "filename");
            if (asset.filename && !asset.filename->empty() &&
                (!stays_inside(*asset.filename) || asset.filename->find('/') != std::string::npos)) {
                return dm::Err<Catalogue>(parse_error("Asset " + asset.id + " has an unsafe filename: " + *asset.filename));
            }

            const auto versions = entry.value("versions", json::object());
            const auto original = versions.value("original", json::object());
            for (const char* key : {"size", "fileSize"}) {
                auto size = optional_size(original, key);
                if (size.is_error()) {
                    return dm::Err<Catalogue>(parse_error("Asset " + asset.id + ": " + size.error().message));
                }
                if (!asset.expected_size) {
                    asset.expected_size = size.value();
                }
            }

            asset.location = optional_string(original, "path").value_or("blobs/" + asset.id);
            if (!stays_inside(asset.location)) {
                return dm::Err<Catalogue>(
                    parse_error("Asset " + asset.id + " points outside the photo library: " + asset.location));
            }

            if (!by_id.emplace(asset.id, catalogue.assets.size()).second) {
                return dm::Err<Catalogue>(parse_error("Duplicate asset id: " + asset.id));
            }
            catalogue.assets.push_back(std::move(asset));
        }

        for (const auto& entry : document.value("albums", json::array())) {
            Album album;
            album.info.key = entry.at("key").get<std::string>();
            album.info.display_name = optional_string(entry, "name").value_or(album.info.key);

            for (const auto& id : entry.value("assets", json::array())) {
                const auto asset_id = id.get<std::string>();
                auto it = by_id.find(asset_id);
                if (it == by_id.end()) {
                    return dm::Err<Catalogue>(
                        parse_error("Album " + album.info.key + " references unknown asset " + asset_id));
                }
                album.asset_indices.push_back(it->second);
            }
            catalogue.albums.push_back(std::move(album));
        }
    } catch (const json::exception& e) {
        return dm::Err<Catalogue>(parse_error(e.what()));
    }

    return dm::Ok(std::move(catalogue));
}

dm::Result<RemoteNode> ExportStore::root() {
    std::error_code ec;
    if (!fs::is_directory(drive_root_, ec)) {
        return dm::Err<RemoteNode>(not_found_error("Drive folder missing: " + drive_root_.string()));
    }
    RemoteNode node;
    node.kind = NodeKind::Folder;
    return dm::Ok(node);
}

dm::Result<std::vector<RemoteNode>> ExportStore::children(const RemoteNode& folder) {
    if (!folder.is_folder()) {
        return dm::Err<std::vector<RemoteNode>>(invalid_argument_error("Not a folder: " + folder.path));
    }

    const fs::path directory = drive_root_ / folder.path;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return dm::Err<std::vector<RemoteNode>>(transfer_error("Failed to list " + folder.path + ": " + ec.message()));
    }

    std::vector<RemoteNode> nodes;
    for (const auto& entry : it) {
        RemoteNode node;
        node.name = entry.path().filename().string();
        node.path = folder.path.empty() ? node.name : folder.path + "/" + node.name;

        if (entry.is_directory(ec)) {
            node.kind = NodeKind::Folder;
        } else if (entry.is_regular_file(ec)) {
            node.kind = NodeKind::File;
            const auto size = entry.file_size(ec);
            if (!ec) {
                node.size = static_cast<std::uint64_t>(size);
            }
        } else {
            continue;
        }
        nodes.push_back(std::move(node));
    }

    std::sort(nodes.begin(), nodes.end(), [](const RemoteNode& lhs, const RemoteNode& rhs) {
        return lhs.name < rhs.name;
    });
    return dm::Ok(std::move(nodes));
}

dm::Result<RemoteNode> ExportStore::lookup(const std::string& path) {
    auto parts = split_remote_path(path);
    if (!parts) {
        return dm::Err<RemoteNode>(not_found_error("Not found in drive: " + path));
    }
    if (parts->empty()) {
        return root();
    }

    std::string normalized;
    for (const auto& part : *parts) {
        normalized += normalized.empty() ? part : "/" + part;
    }

    const fs::path absolute = drive_root_ / normalized;
    std::error_code ec;
    const auto status = fs::status(absolute, ec);
    if (!fs::exists(status)) {
        return dm::Err<RemoteNode>(not_found_error("Not found in drive: " + path));
    }

    RemoteNode node;
    node.name = parts->back();
    node.path = normalized;
    if (fs::is_directory(status)) {
        node.kind = NodeKind::Folder;
    } else if (fs::is_regular_file(status)) {
        node.kind = NodeKind::File;
        const auto size = fs::file_size(absolute, ec);
        if (!ec) {
            node.size = static_cast<std::uint64_t>(size);
        }
    } else {
        return dm::Err<RemoteNode>(not_found_error("Not found in drive: " + path));
    }
    return dm::Ok(node);
}

dm::Result<std::unique_ptr<ByteStream>> ExportStore::open_stream(const RemoteNode& node,
                                                                 const RequestHeaders& headers) {
    if (node.is_folder()) {
        return dm::Err<std::unique_ptr<ByteStream>>(invalid_argument_error("Cannot download a folder: " + node.path));
    }
    return open_file(drive_root_ / node.path, headers);
}

dm::Result<std::unique_ptr<AssetCursor>> ExportStore::all_assets() {
    return dm::Ok(std::unique_ptr<AssetCursor>(new CatalogueCursor(catalogue_, nullptr)));
}

dm::Result<std::vector<AlbumInfo>> ExportStore::albums() {
    std::vector<AlbumInfo> result;
    result.reserve(catalogue_->albums.size());
    for (const auto& album : catalogue_->albums) {
        result.push_back(album.info);
    }
    return dm::Ok(std::move(result));
}

dm::Result<std::unique_ptr<AssetCursor>> ExportStore::open_album(const std::string& key) {
    auto it = album_index_.find(key);
    if (it == album_index_.end()) {
        return dm::Err<std::unique_ptr<AssetCursor>>(not_found_error("Album not found: " + key));
    }
    const auto& indices = catalogue_->albums[it->second].asset_indices;
    return dm::Ok(std::unique_ptr<AssetCursor>(new CatalogueCursor(catalogue_, &indices)));
}

dm::Result<std::unique_ptr<ByteStream>> ExportStore::download_asset(const MediaAsset& asset,
                                                                    const RequestHeaders& headers) {
    if (!stays_inside(asset.location)) {
        return dm::Err<std::unique_ptr<ByteStream>>(
            transfer_error("Asset location outside the photo library: " + asset.location));
    }
    return open_file(photos_root_ / asset.location, headers);
}

dm::Result<std::unique_ptr<ByteStream>> ExportStore::open_file(const fs::path& path,
                                                               const RequestHeaders& headers) const {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return dm::Err<std::unique_ptr<ByteStream>>(transfer_error("Cannot open remote object " + path.string() + ": " + ec.message()));
    }

    std::uint64_t offset = 0;
    if (auto range = headers.find("Range"); range != headers.end()) {
        auto parsed = parse_range_value(range->second);
        if (!parsed) {
            return dm::Err<std::unique_ptr<ByteStream>>(transfer_error("Unsupported range: " + range->second));
        }
        if (*parsed > size) {
            return dm::Err<std::unique_ptr<ByteStream>>(transfer_error("Requested range not satisfiable: " + range->second));
        }
        offset = *parsed;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return dm::Err<std::unique_ptr<ByteStream>>(transfer_error("Cannot open remote object " + path.string()));
    }
    input.seekg(static_cast<std::streamoff>(offset));
    if (!input) {
        return dm::Err<std::unique_ptr<ByteStream>>(transfer_error("Cannot seek in " + path.string()));
    }

    return dm::Ok(std::unique_ptr<ByteStream>(new FileByteStream(std::move(input), path.filename().string(), chunk_size_)));
}

} // namespace dm::remote
