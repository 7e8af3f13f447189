#include "dm/app/options.hpp"

#include <spdlog/common.h>

#include <utility>

namespace dm::app {

bool Options::any_listing() const noexcept {
    return photos_list || !photos_list_albums.empty() || photos_list_album_names;
}

bool Options::implicit_drive_download() const noexcept {
    return items.empty() && !photo_download() && !any_listing();
}

bool Options::drive_download() const noexcept {
    return !items.empty() || implicit_drive_download();
}

bool Options::photo_download() const noexcept {
    return photos_all || !photo_albums.empty();
}

bool Options::requires_destination() const noexcept {
    return drive_download() || photo_download();
}

std::string usage() {
    return "Usage: drivemirror --library <dir> [--dest <dir>] [options]\n"
           "\n"
           "Downloads:\n"
           "  --item <path>               remote path to download (repeatable)\n"
           "  --photos-all                download every photo to DEST/Photos\n"
           "  --photos-album <name>       download an album to DEST/Photos/<name> (repeatable)\n"
           "  (no download or listing option: download the whole drive)\n"
           "\n"
           "Listings:\n"
           "  --photos-list               list every photo\n"
           "  --photos-list-album <name>  list the photos of an album (repeatable)\n"
           "  --photos-list-albums        list album names\n"
           "\n"
           "Behaviour:\n"
           "  --resume                    resume partial downloads with byte ranges\n"
           "  --progress                  report per-file progress\n"
           "  --keep-going                do not stop the run on local I/O errors\n"
           "  --log-level <level>         trace, debug, info, warn, err, critical, off\n"
           "  --log-file <path>           also write the log to a file\n"
           "  -h, --help                  show this message\n"
           "\n"
           "The library may also be given through DRIVEMIRROR_LIBRARY.\n";
}

dm::Result<Options> parse_options(int argc, const char* const argv[],
                                  const std::optional<std::string>& library_env) {
    Options options;
    int index = 1;

    auto next_value = [&]() -> std::optional<std::string> {
        if (index >= argc) {
            return std::nullopt;
        }
        return std::string(argv[index++]);
    };
    auto missing = [](const std::string& flag, const char* what) {
        return dm::Err<Options>(invalid_argument_error(flag + " requires " + what));
    };

    while (index < argc) {
        const std::string arg = argv[index++];
        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--library") {
            auto value = next_value();
            if (!value) {
                return missing(arg, "a directory");
            }
            options.library = std::filesystem::path(*value);
        } else if (arg == "--dest") {
            auto value = next_value();
            if (!value) {
                return missing(arg, "a directory");
            }
            options.destination = std::filesystem::path(*value);
        } else if (arg == "--item") {
            auto value = next_value();
            if (!value) {
                return missing(arg, "a remote path");
            }
            options.items.push_back(*value);
        } else if (arg == "--photos-all") {
            options.photos_all = true;
        } else if (arg == "--photos-album") {
            auto value = next_value();
            if (!value) {
                return missing(arg, "an album name");
            }
            options.photo_albums.push_back(*value);
        } else if (arg == "--photos-list") {
            options.photos_list = true;
        } else if (arg == "--photos-list-album") {
            auto value = next_value();
            if (!value) {
                return missing(arg, "an album name");
            }
            options.photos_list_albums.push_back(*value);
        } else if (arg == "--photos-list-albums") {
            options.photos_list_album_names = true;
        } else if (arg == "--resume") {
            options.mirror.resume = true;
        } else if (arg == "--progress") {
            options.mirror.progress = true;
        } else if (arg == "--keep-going") {
            options.mirror.keep_going = true;
        } else if (arg == "--log-level") {
            auto value = next_value();
            if (!value) {
                return missing(arg, "a level");
            }
            if (spdlog::level::from_str(*value) == spdlog::level::off && *value != "off") {
                return dm::Err<Options>(invalid_argument_error("Unknown log level: " + *value));
            }
            options.log_level = *value;
        } else if (arg == "--log-file") {
            auto value = next_value();
            if (!value) {
                return missing(arg, "a file path");
            }
            options.log_file = std::filesystem::path(*value);
        } else {
            return dm::Err<Options>(invalid_argument_error("Unknown argument: " + arg));
        }
    }

    if (options.show_help) {
        return dm::Ok(std::move(options));
    }

    if (!options.library && library_env && !library_env->empty()) {
        options.library = std::filesystem::path(*library_env);
    }
    if (!options.library) {
        return dm::Err<Options>(invalid_argument_error("--library is required (or set DRIVEMIRROR_LIBRARY)"));
    }
    if (options.requires_destination() && !options.destination) {
        return dm::Err<Options>(invalid_argument_error("--dest is required for download operations"));
    }

    return dm::Ok(std::move(options));
}

} // namespace dm::app
