#include "dm/app/options.hpp"
#include "dm/app/run_coordinator.hpp"
#include "dm/events/components.hpp"
#include "dm/events/event_bus.hpp"
#include "dm/remote/export_store.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

std::optional<std::string> library_from_env() {
    if (const char* value = std::getenv("DRIVEMIRROR_LIBRARY")) {
        return std::string(value);
    }
    return std::nullopt;
}

bool configure_logging(const dm::app::Options& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (options.log_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file->string(), false));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << options.log_file->string() << ": " << e.what() << std::endl;
            return false;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("drivemirror", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(options.log_level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = dm::app::parse_options(argc, argv, library_from_env());
    if (parsed.is_error()) {
        std::cerr << "Error: " << parsed.error().message << "\n\n" << dm::app::usage();
        return kExitUsage;
    }
    const auto& options = parsed.value();
    if (options.show_help) {
        std::cout << dm::app::usage();
        return kExitOk;
    }

    if (!configure_logging(options)) {
        return kExitFailure;
    }

    if (options.destination) {
        std::error_code ec;
        fs::create_directories(*options.destination, ec);
        if (ec) {
            spdlog::error("Cannot create destination {}: {}", options.destination->string(), ec.message());
            return kExitFailure;
        }
    }

    auto store = dm::remote::ExportStore::open(*options.library);
    if (store.is_error()) {
        spdlog::error("Cannot open library {}: {}", options.library->string(), store.error().message);
        return kExitFailure;
    }

    dm::events::EventBus bus;
    dm::events::LoggerComponent logger(bus);
    dm::events::TransferStatsComponent stats(bus);

    dm::app::RunCoordinator coordinator(*store.value(), bus, options.mirror, std::cout);
    auto result = coordinator.run(options);

    stats.print_stats();
    if (result.is_error()) {
        spdlog::critical("Aborted: {} ({})", result.error().message, dm::error_kind_name(result.error().kind));
        return kExitFailure;
    }

    spdlog::info("Done.");
    return kExitOk;
}
