/*
 * audit_log.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Append-only audit trail of incident transitions and decisions

**************************************************/

#ifndef STORMWATCH_WORKFLOW_AUDIT_LOG_HPP
#define STORMWATCH_WORKFLOW_AUDIT_LOG_HPP

#include <atomic>
#include <cstdint>
#include <expected>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace stormwatch::workflow {

/**
 * @brief Immutable entry describing one transition or decision
 */
struct AuditRecord {
    std::uint64_t sequence{0};  ///< per Incident, 1-based
    std::string incidentId;
    std::string location;
    std::uint64_t cycle{0};
    AuditEventKind kind{AuditEventKind::Observed};
    IncidentState fromState{IncidentState::PendingObservation};
    IncidentState toState{IncidentState::PendingObservation};
    Clock::time_point timestamp;
    json payload;

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j)
        -> std::expected<AuditRecord, std::string>;
};

/**
 * @brief Decision-only kinds leave the state unchanged
 */
[[nodiscard]] auto isDecisionOnly(AuditEventKind kind) -> bool;

enum class AuditErrorCode { Unavailable };

struct AuditError {
    AuditErrorCode code{AuditErrorCode::Unavailable};
    std::string message;
};

/**
 * @brief Destination of audit records; append must be safe to call
 * concurrently
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual auto append(const AuditRecord& record)
        -> std::expected<void, AuditError> = 0;
};

/**
 * @brief Writes one JSON object per line, flushed after every record
 */
class JsonLinesAuditSink : public AuditSink {
public:
    explicit JsonLinesAuditSink(std::string path);

    auto append(const AuditRecord& record)
        -> std::expected<void, AuditError> override;

    /**
     * @brief Checks that the file can be opened for appending
     */
    [[nodiscard]] auto checkReady() -> std::expected<void, AuditError>;

    [[nodiscard]] auto path() const -> const std::string& { return path_; }

private:
    auto ensureOpen() -> bool;

    std::string path_;
    std::mutex mutex_;
    std::ofstream out_;
};

/**
 * @brief Keeps records in memory
 */
class MemoryAuditSink : public AuditSink {
public:
    auto append(const AuditRecord& record)
        -> std::expected<void, AuditError> override;

    [[nodiscard]] auto records() const -> std::vector<AuditRecord>;
    [[nodiscard]] auto recordsFor(const std::string& incidentId) const
        -> std::vector<AuditRecord>;
    [[nodiscard]] auto size() const -> size_t;

    /**
     * @brief While unavailable, append() fails with Unavailable
     */
    void setAvailable(bool available);

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
    bool available_{true};
};

/**
 * @brief Front of the audit trail used by the engine
 *
 * record() never throws and never blocks the workflow on a sink outage: a
 * failed append is counted and reported as degraded logging on the "audit"
 * logger, apart from workflow errors.
 */
class AuditLog {
public:
    explicit AuditLog(std::shared_ptr<AuditSink> sink);

    void record(const AuditRecord& record);

    [[nodiscard]] auto isDegraded() const -> bool;
    [[nodiscard]] auto failureCount() const -> std::uint64_t;
    [[nodiscard]] auto recordedCount() const -> std::uint64_t;

    /**
     * @brief Rebuilds the state of one Incident from its records.
     *
     * Records must belong to one Incident, in sequence order, and chain each
     * fromState to the previous toState.
     */
    [[nodiscard]] static auto replay(const std::vector<AuditRecord>& records)
        -> std::expected<IncidentState, std::string>;

    /**
     * @brief Reads a file written by JsonLinesAuditSink
     */
    [[nodiscard]] static auto load(const std::string& path)
        -> std::expected<std::vector<AuditRecord>, std::string>;

private:
    std::shared_ptr<AuditSink> sink_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex stateMutex_;
    bool degraded_{false};
    std::atomic<std::uint64_t> failures_{0};
    std::atomic<std::uint64_t> recorded_{0};
};

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_AUDIT_LOG_HPP
