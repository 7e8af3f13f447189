#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dm::mirror {

enum class NodeKind {
    Folder,
    File
};

/**
 * @brief Remote filesystem entry as reported by the remote service
 *
 * Children of a folder are not stored here; they are listed on demand
 * through RemoteService::children so large trees never sit in memory.
 */
struct RemoteNode {
    std::string name;
    NodeKind kind = NodeKind::File;
    std::optional<std::uint64_t> size; ///< Only meaningful for files; absent means unknown
    std::string path;                  ///< Opaque handle used by the remote service

    bool is_folder() const noexcept { return kind == NodeKind::Folder; }
};

/**
 * @brief Photo/video item addressed outside the folder tree
 */
struct MediaAsset {
    std::string id;
    std::optional<std::string> filename;
    std::optional<std::uint64_t> expected_size; ///< Size of the original version, when reported
    std::string location;                       ///< Opaque handle used by the remote service

    /// Local file name: the reported filename, else "<id>.bin"
    std::string local_name() const {
        if (filename && !filename->empty()) {
            return *filename;
        }
        return id + ".bin";
    }

    /// Name shown by listings: the filename, else the id
    std::string label() const {
        if (filename && !filename->empty()) {
            return *filename;
        }
        return id;
    }
};

enum class TransferDecision {
    Skip,
    Fresh,
    Resume
};

inline const char* decision_name(TransferDecision decision) {
    switch (decision) {
        case TransferDecision::Skip: return "skip";
        case TransferDecision::Fresh: return "fresh";
        case TransferDecision::Resume: return "resume";
    }
    return "unknown";
}

/**
 * @brief Per-item decision computed right before a transfer attempt
 */
struct TransferPlan {
    std::filesystem::path destination_path;
    std::uint64_t existing_local_size = 0;      ///< 0 when the destination is absent
    std::optional<std::uint64_t> expected_size;
    TransferDecision decision = TransferDecision::Fresh;
    std::optional<std::uint64_t> range_offset;  ///< Set iff decision == Resume
    bool oversized = false;                     ///< Local file larger than the remote one; Fresh overwrites it
};

/**
 * @brief Behaviour switches shared by the fetcher and the walkers
 */
struct MirrorOptions {
    bool resume = false;
    bool progress = false;
    bool keep_going = false; ///< Local I/O failures abort the item instead of the run
};

/**
 * @brief Counters accumulated by a walk
 */
struct WalkSummary {
    std::size_t planned = 0;
    std::size_t skipped = 0;
    std::size_t fresh = 0;
    std::size_t resumed = 0;
    std::size_t failed = 0;
    std::uint64_t bytes_transferred = 0;

    WalkSummary& operator+=(const WalkSummary& other) {
        planned += other.planned;
        skipped += other.skipped;
        fresh += other.fresh;
        resumed += other.resumed;
        failed += other.failed;
        bytes_transferred += other.bytes_transferred;
        return *this;
    }
};

} // namespace dm::mirror
