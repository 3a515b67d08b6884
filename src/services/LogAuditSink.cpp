#include "services/LogAuditSink.hpp"

#include "util/Logger.hpp"

#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>

namespace {

auto kind_name(TaskKind kind) -> std::string_view {
    switch (kind) {
        case TaskKind::FILE:
            return "file";
        case TaskKind::DIRECTORY:
            return "directory";
        case TaskKind::FREE_SPACE_SEGMENT:
            return "free-space";
    }
    return "unknown";
}

auto iso8601(std::chrono::system_clock::time_point when) -> std::string {
    const auto time = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
    gmtime_r(&time, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}  // namespace

auto LogAuditSink::format(const AuditRecord& record) -> std::string {
    auto line = std::format(
        "time={} request={} task={} kind={} target=\"{}\" status={} passes={}/{} bytes={} "
        "verified={}",
        iso8601(record.timestamp), record.request_id, record.task_id, kind_name(record.kind),
        record.target.string(), ::to_string(record.status), record.passes_completed,
        record.passes_planned, record.bytes_overwritten, record.verified ? "yes" : "no");
    if (record.error) {
        line += std::format(" error={} message=\"{}\"", ::to_string(*record.error),
                            record.error_message);
    }
    return line;
}

void LogAuditSink::append(const AuditRecord& record) {
    if (record.status == TaskStatus::DONE && !record.error) {
        LOG_INFO("Audit", format(record));
    } else {
        LOG_WARNING("Audit", format(record));
    }
}
