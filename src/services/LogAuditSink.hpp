/**
 * @file LogAuditSink.hpp
 * @brief Audit sink that writes records through util::Logger
 */

#pragma once

#include "interfaces/IAuditSink.hpp"

#include <string>

/**
 * @class LogAuditSink
 * @brief Default IAuditSink: one "Audit" log line per record
 *
 * Successful tasks are logged at INFO, everything else at WARNING.
 */
class LogAuditSink : public IAuditSink {
public:
    void append(const AuditRecord& record) override;

    /**
     * @brief Render a record as a single key=value line
     */
    [[nodiscard]] static auto format(const AuditRecord& record) -> std::string;
};
