/**
 * @file IAuditSink.hpp
 * @brief Append-only destination for per-task audit records
 */

#pragma once

#include "models/ShredTypes.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @struct AuditRecord
 * @brief What is certified about one task once it is terminal
 */
struct AuditRecord {
    std::chrono::system_clock::time_point timestamp{};
    RequestId request_id = 0;
    TaskId task_id = 0;
    std::filesystem::path target;
    TaskKind kind = TaskKind::FILE;
    TaskStatus status = TaskStatus::PENDING;
    int passes_completed = 0;
    int passes_planned = 0;
    uint64_t bytes_overwritten = 0;
    bool verified = false;
    std::optional<ErrorKind> error;
    std::string error_message;

    [[nodiscard]] static auto from(const OperationResult& result) -> AuditRecord {
        AuditRecord record;
        record.timestamp = result.completed_at;
        record.request_id = result.request_id;
        record.task_id = result.task_id;
        record.target = result.target;
        record.kind = result.kind;
        record.status = result.status;
        record.passes_completed = result.passes_completed;
        record.passes_planned = result.passes_planned;
        record.bytes_overwritten = result.bytes_overwritten;
        record.verified = result.verified;
        record.error = result.error;
        record.error_message = result.error_message;
        return record;
    }
};

/**
 * @class IAuditSink
 * @brief Receives exactly one record per terminal task
 *
 * Calls are serialized by the service; implementations need not lock.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    virtual void append(const AuditRecord& record) = 0;
};
