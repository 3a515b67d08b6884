/**
 * @file MockAuditSink.hpp
 * @brief Google Mock implementation of IAuditSink plus a recording sink
 */

#pragma once

#include "interfaces/IAuditSink.hpp"

#include <gmock/gmock.h>

#include <mutex>
#include <vector>

class MockAuditSink : public IAuditSink {
public:
    MOCK_METHOD(void, append, (const AuditRecord& record), (override));
};

/**
 * @brief Sink that keeps every record for later inspection
 */
class RecordingAuditSink : public IAuditSink {
public:
    void append(const AuditRecord& record) override {
        std::lock_guard lock(mutex_);
        records_.push_back(record);
    }

    std::vector<AuditRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
};
