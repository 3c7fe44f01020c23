
#include "log_rotator.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

LogRotator::LogRotator(LogStore& store, Clock clock)
    : store_(store), clock_(clock ? std::move(clock) : Clock(util::now_millis)) {}

std::string LogRotator::archive_id_for(const std::string& stream_id, int64_t now_millis) {
    return fmt::format("{}-{}", stream_id, now_millis);
}

RotationReport LogRotator::rotate() {
    RotationReport report;

    auto streams = store_.list_active_streams();
    if (!streams.ok()) {
        spdlog::error("Could not list log streams to rotate: {}", streams.status.message);
        report.status = streams.status;
        return report;
    }

    if (streams.value.empty()) {
        spdlog::info("No logs to rotate");
        return report;
    }

    report.streams = streams.value.size();
    for (const auto& stream_id : streams.value) {
        if (rotate_stream(stream_id)) {
            ++report.rotated;
        } else {
            ++report.failed;
        }
    }

    if (report.failed > 0) {
        report.status = Status::failure(ErrorKind::Rotation,
                                        fmt::format("{} of {} log streams failed to rotate",
                                                    report.failed, report.streams));
    }

    spdlog::info("Log rotation finished: {} rotated, {} failed", report.rotated, report.failed);
    return report;
}

bool LogRotator::rotate_stream(const std::string& stream_id) {
    const std::string archive_id = archive_id_for(stream_id, clock_());

    Status compressed = store_.compress(stream_id, archive_id);
    if (!compressed.ok()) {
        spdlog::error("Error compressing log stream {}: {}", stream_id, compressed.message);
        return false;
    }

    Status truncated = store_.truncate(stream_id);
    if (!truncated.ok()) {
        spdlog::error("Error truncating log stream {} after archiving to {}: {}",
                      stream_id, archive_id, truncated.message);
        return false;
    }

    spdlog::debug("Rotated log stream {} into {}", stream_id, archive_id);
    return true;
}
