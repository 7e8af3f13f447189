#pragma once

#include "dm/core/result.hpp"
#include "dm/events/event_bus.hpp"
#include "dm/remote/service.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dm::mirror {

enum class WriteMode {
    Truncate,
    Append
};

struct SinkRequest {
    std::filesystem::path destination;
    WriteMode mode = WriteMode::Truncate;
    std::uint64_t start_offset = 0;             ///< Bytes already on disk (Append only)
    std::optional<std::uint64_t> expected_size;
    std::string label;                          ///< Name used in progress reports
    bool report_progress = false;
};

/**
 * @brief Writes a ByteStream to a local file, one block at a time
 *
 * Local write failures are ErrorKind::Io; failures reported by the
 * stream are ErrorKind::Transfer. In both cases whatever was written so
 * far stays on disk so a later run can resume it.
 */
class ByteSink {
public:
    static constexpr std::uint64_t kMinReportInterval = 1'000'000;
    static constexpr std::uint64_t kMaxReportsPerFile = 20;

    explicit ByteSink(events::EventBus& bus) : bus_(bus) {}

    /**
     * @brief Stream every block into request.destination
     *
     * RETURNS:
     * start_offset plus the number of bytes written by this call
     */
    dm::Result<std::uint64_t> write(const SinkRequest& request, remote::ByteStream& stream) const;

    /// max(expected / 20, 1 MB)
    static std::uint64_t report_interval(std::uint64_t expected_size) noexcept;

private:
    events::EventBus& bus_;
};

} // namespace dm::mirror
