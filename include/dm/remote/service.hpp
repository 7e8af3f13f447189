#pragma once

#include "dm/core/result.hpp"
#include "dm/mirror/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dm::remote {

using ByteBlock = std::vector<std::uint8_t>;

/// Request headers passed along with a stream request, e.g. {"Range", "bytes=42-"}
using RequestHeaders = std::map<std::string, std::string>;

/**
 * @brief Blocking source of byte blocks for one download
 *
 * next_block() returns std::nullopt once the stream is exhausted. An
 * empty block is legal and does not end the stream.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual dm::Result<std::optional<ByteBlock>> next_block() = 0;
};

/**
 * @brief Lazy, single-pass sequence of media assets
 */
class AssetCursor {
public:
    virtual ~AssetCursor() = default;

    virtual dm::Result<std::optional<mirror::MediaAsset>> next() = 0;
};

struct AlbumInfo {
    std::string key;          ///< Lookup key accepted by open_album()
    std::string display_name; ///< Human readable title, may differ from key
};

/**
 * @brief Capabilities the download engine needs from an authenticated remote
 *
 * Implementations own whatever session state they need; the engine only
 * sees a ready handle. Failures while talking to the remote should be
 * reported as ErrorKind::Transfer, lookups of absent entries as
 * ErrorKind::NotFound.
 */
class RemoteService {
public:
    virtual ~RemoteService() = default;

    // ── Drive tree ─────────────────────────────────────────

    virtual dm::Result<mirror::RemoteNode> root() = 0;

    virtual dm::Result<std::vector<mirror::RemoteNode>> children(const mirror::RemoteNode& folder) = 0;

    virtual dm::Result<mirror::RemoteNode> lookup(const std::string& path) = 0;

    virtual dm::Result<std::unique_ptr<ByteStream>> open_stream(const mirror::RemoteNode& node,
                                                                const RequestHeaders& headers) = 0;

    // ── Photo library ──────────────────────────────────────

    virtual dm::Result<std::unique_ptr<AssetCursor>> all_assets() = 0;

    virtual dm::Result<std::vector<AlbumInfo>> albums() = 0;

    virtual dm::Result<std::unique_ptr<AssetCursor>> open_album(const std::string& key) = 0;

    virtual dm::Result<std::unique_ptr<ByteStream>> download_asset(const mirror::MediaAsset& asset,
                                                                   const RequestHeaders& headers) = 0;
};

/// "bytes=<offset>-"
std::string make_range_value(std::uint64_t offset);

/// Parses "bytes=<offset>-"; std::nullopt for anything else
std::optional<std::uint64_t> parse_range_value(const std::string& value);

} // namespace dm::remote
