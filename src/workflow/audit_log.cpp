/*
 * audit_log.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "audit_log.hpp"

#include <cstdio>
#include <ctime>
#include <utility>

#include <fmt/format.h>

#include "logging/logging_manager.hpp"

namespace stormwatch::workflow {

namespace {

auto parseTimestamp(const std::string& text) -> std::optional<Clock::time_point> {
    std::tm utc{};
    int millis = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ", &utc.tm_year,
                    &utc.tm_mon, &utc.tm_mday, &utc.tm_hour, &utc.tm_min,
                    &utc.tm_sec, &millis) != 7) {
        return std::nullopt;
    }
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    return Clock::from_time_t(timegm(&utc)) + std::chrono::milliseconds(millis);
}

}  // namespace

// ============================================================================
// AuditRecord
// ============================================================================

auto AuditRecord::toJson() const -> json {
    return {{"seq", sequence},
            {"incidentId", incidentId},
            {"location", location},
            {"cycle", cycle},
            {"kind", std::string(eventKindToString(kind))},
            {"fromState", std::string(stateToString(fromState))},
            {"toState", std::string(stateToString(toState))},
            {"timestamp", formatTimestamp(timestamp)},
            {"payload", payload}};
}

auto AuditRecord::fromJson(const json& j)
    -> std::expected<AuditRecord, std::string> {
    try {
        AuditRecord record;
        record.sequence = j.at("seq").get<std::uint64_t>();
        record.incidentId = j.at("incidentId").get<std::string>();
        record.location = j.value("location", "");
        record.cycle = j.value("cycle", std::uint64_t{0});

        const auto kind = j.at("kind").get<std::string>();
        const auto from = j.at("fromState").get<std::string>();
        const auto to = j.at("toState").get<std::string>();
        auto parsedKind = parseEventKind(kind);
        auto parsedFrom = parseState(from);
        auto parsedTo = parseState(to);
        if (!parsedKind || !parsedFrom || !parsedTo) {
            return std::unexpected(fmt::format(
                "record {} has unknown kind or state ({}, {} -> {})",
                record.sequence, kind, from, to));
        }
        record.kind = *parsedKind;
        record.fromState = *parsedFrom;
        record.toState = *parsedTo;

        auto timestamp = parseTimestamp(j.value("timestamp", ""));
        if (!timestamp) {
            return std::unexpected(fmt::format(
                "record {} has a malformed timestamp", record.sequence));
        }
        record.timestamp = *timestamp;
        record.payload = j.value("payload", json::object());
        return record;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("malformed audit record: ") +
                               e.what());
    }
}

auto isDecisionOnly(AuditEventKind kind) -> bool {
    return kind == AuditEventKind::PolicyDecided ||
           kind == AuditEventKind::RetryScheduled;
}

// ============================================================================
// JsonLinesAuditSink
// ============================================================================

JsonLinesAuditSink::JsonLinesAuditSink(std::string path)
    : path_(std::move(path)) {}

auto JsonLinesAuditSink::ensureOpen() -> bool {
    if (out_.is_open() && out_.good()) {
        return true;
    }
    if (out_.is_open()) {
        out_.close();
    }
    out_.clear();
    out_.open(path_, std::ios::out | std::ios::app);
    return out_.is_open() && out_.good();
}

auto JsonLinesAuditSink::append(const AuditRecord& record)
    -> std::expected<void, AuditError> {
    const std::string line = record.toJson().dump() + "\n";

    std::lock_guard lock(mutex_);
    if (!ensureOpen()) {
        return std::unexpected(
            AuditError{AuditErrorCode::Unavailable,
                       "cannot open audit file " + path_});
    }
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.flush();
    if (!out_.good()) {
        return std::unexpected(AuditError{AuditErrorCode::Unavailable,
                                          "write to " + path_ + " failed"});
    }
    return {};
}

auto JsonLinesAuditSink::checkReady() -> std::expected<void, AuditError> {
    std::lock_guard lock(mutex_);
    if (!ensureOpen()) {
        return std::unexpected(
            AuditError{AuditErrorCode::Unavailable,
                       "cannot open audit file " + path_});
    }
    return {};
}

// ============================================================================
// MemoryAuditSink
// ============================================================================

auto MemoryAuditSink::append(const AuditRecord& record)
    -> std::expected<void, AuditError> {
    std::lock_guard lock(mutex_);
    if (!available_) {
        return std::unexpected(
            AuditError{AuditErrorCode::Unavailable, "memory sink disabled"});
    }
    records_.push_back(record);
    return {};
}

auto MemoryAuditSink::records() const -> std::vector<AuditRecord> {
    std::lock_guard lock(mutex_);
    return records_;
}

auto MemoryAuditSink::recordsFor(const std::string& incidentId) const
    -> std::vector<AuditRecord> {
    std::vector<AuditRecord> result;
    std::lock_guard lock(mutex_);
    for (const auto& record : records_) {
        if (record.incidentId == incidentId) {
            result.push_back(record);
        }
    }
    return result;
}

auto MemoryAuditSink::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return records_.size();
}

void MemoryAuditSink::setAvailable(bool available) {
    std::lock_guard lock(mutex_);
    available_ = available;
}

// ============================================================================
// AuditLog
// ============================================================================

AuditLog::AuditLog(std::shared_ptr<AuditSink> sink)
    : sink_(std::move(sink)),
      logger_(logging::LoggingManager::getInstance().getLogger("audit")) {}

void AuditLog::record(const AuditRecord& record) {
    std::expected<void, AuditError> result;
    try {
        result = sink_->append(record);
    } catch (const std::exception& e) {
        result = std::unexpected(
            AuditError{AuditErrorCode::Unavailable, e.what()});
    }

    if (result) {
        recorded_.fetch_add(1);
        std::lock_guard lock(stateMutex_);
        if (degraded_) {
            degraded_ = false;
            logger_->info("Audit sink recovered after {} failed append(s)",
                          failures_.load());
        }
        return;
    }

    failures_.fetch_add(1);
    std::lock_guard lock(stateMutex_);
    if (!degraded_) {
        degraded_ = true;
        logger_->warn(
            "DEGRADED LOGGING: audit record {} #{} ({}) not persisted: {}",
            record.incidentId, record.sequence, eventKindToString(record.kind),
            result.error().message);
    } else {
        logger_->debug("Audit sink still unavailable, dropped {} #{}",
                       record.incidentId, record.sequence);
    }
}

auto AuditLog::isDegraded() const -> bool {
    std::lock_guard lock(stateMutex_);
    return degraded_;
}

auto AuditLog::failureCount() const -> std::uint64_t {
    return failures_.load();
}

auto AuditLog::recordedCount() const -> std::uint64_t {
    return recorded_.load();
}

auto AuditLog::replay(const std::vector<AuditRecord>& records)
    -> std::expected<IncidentState, std::string> {
    IncidentState state = IncidentState::PendingObservation;
    std::uint64_t lastSequence = 0;

    for (const auto& record : records) {
        if (record.incidentId != records.front().incidentId) {
            return std::unexpected(fmt::format(
                "record {} belongs to {}, expected {}", record.sequence,
                record.incidentId, records.front().incidentId));
        }
        if (record.sequence <= lastSequence) {
            return std::unexpected(fmt::format(
                "sequence {} follows {}", record.sequence, lastSequence));
        }
        if (record.fromState != state) {
            return std::unexpected(fmt::format(
                "record {} starts from {} but the incident is {}",
                record.sequence, stateToString(record.fromState),
                stateToString(state)));
        }
        if (isDecisionOnly(record.kind)) {
            if (record.toState != record.fromState) {
                return std::unexpected(fmt::format(
                    "decision record {} changes state", record.sequence));
            }
        } else if (!isValidTransition(record.fromState, record.toState)) {
            return std::unexpected(fmt::format(
                "record {} makes an invalid transition {} -> {}",
                record.sequence, stateToString(record.fromState),
                stateToString(record.toState)));
        }
        state = record.toState;
        lastSequence = record.sequence;
    }
    return state;
}

auto AuditLog::load(const std::string& path)
    -> std::expected<std::vector<AuditRecord>, std::string> {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::unexpected("cannot open " + path);
    }

    std::vector<AuditRecord> records;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (line.empty()) {
            continue;
        }
        auto document = json::parse(line, nullptr, false);
        if (document.is_discarded()) {
            return std::unexpected(
                fmt::format("{}:{}: not valid JSON", path, lineNumber));
        }
        auto record = AuditRecord::fromJson(document);
        if (!record) {
            return std::unexpected(
                fmt::format("{}:{}: {}", path, lineNumber, record.error()));
        }
        records.push_back(std::move(*record));
    }
    return records;
}

}  // namespace stormwatch::workflow
