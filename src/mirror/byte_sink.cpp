#include "dm/mirror/byte_sink.hpp"

#include "dm/events/events.hpp"

#include <algorithm>
#include <fstream>

namespace dm::mirror {

std::uint64_t ByteSink::report_interval(std::uint64_t expected_size) noexcept {
    return std::max(expected_size / kMaxReportsPerFile, kMinReportInterval);
}

dm::Result<std::uint64_t> ByteSink::write(const SinkRequest& request, remote::ByteStream& stream) const {
    std::ios::openmode mode = std::ios::binary | std::ios::out;
    mode |= request.mode == WriteMode::Append ? std::ios::app : std::ios::trunc;

    std::ofstream out(request.destination, mode);
    if (!out) {
        return dm::Err<std::uint64_t>(io_error("Failed to open " + request.destination.string() + " for writing"));
    }

    std::uint64_t bytes_written = request.start_offset;
    std::uint64_t report_step = 0;
    std::uint64_t next_report = 0;
    if (request.report_progress && request.expected_size && *request.expected_size > 0) {
        report_step = report_interval(*request.expected_size);
        next_report = request.start_offset + report_step;
    }

    while (true) {
        auto block = stream.next_block();
        if (block.is_error()) {
            out.flush();
            return dm::Err<std::uint64_t>(transfer_error(block.error().message));
        }
        if (!block.value().has_value()) {
            break;
        }

        const auto& data = *block.value();
        if (data.empty()) {
            continue;
        }

        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) {
            return dm::Err<std::uint64_t>(io_error("Failed to write to " + request.destination.string()));
        }
        bytes_written += data.size();

        if (report_step != 0 && bytes_written >= next_report) {
            bus_.emit(events::ProgressEvent{request.label, bytes_written, request.expected_size});
            // One oversized block must not queue up several reports
            while (next_report <= bytes_written) {
                next_report += report_step;
            }
        }
    }

    out.flush();
    if (!out) {
        return dm::Err<std::uint64_t>(io_error("Failed to flush " + request.destination.string()));
    }

    return dm::Ok(bytes_written);
}

} // namespace dm::mirror
