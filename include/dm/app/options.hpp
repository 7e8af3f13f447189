#pragma once

#include "dm/core/result.hpp"
#include "dm/mirror/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dm::app {

struct Options {
    std::optional<std::filesystem::path> library;
    std::optional<std::filesystem::path> destination;
    std::vector<std::string> items;
    bool photos_all = false;
    std::vector<std::string> photo_albums;
    bool photos_list = false;
    std::vector<std::string> photos_list_albums;
    bool photos_list_album_names = false;
    mirror::MirrorOptions mirror;
    std::string log_level = "info";
    std::optional<std::filesystem::path> log_file;
    bool show_help = false;

    [[nodiscard]] bool any_listing() const noexcept;

    /// Whole-drive download: runs when nothing more specific was asked for
    [[nodiscard]] bool implicit_drive_download() const noexcept;

    [[nodiscard]] bool drive_download() const noexcept;
    [[nodiscard]] bool photo_download() const noexcept;

    /// A destination is needed iff something is going to be downloaded
    [[nodiscard]] bool requires_destination() const noexcept;
};

/**
 * @brief Parse argv into Options
 *
 * `library_env` is the value of DRIVEMIRROR_LIBRARY, used when --library
 * is absent. Fails with ErrorKind::InvalidArgument on bad usage.
 */
dm::Result<Options> parse_options(int argc, const char* const argv[],
                                  const std::optional<std::string>& library_env = std::nullopt);

std::string usage();

} // namespace dm::app
