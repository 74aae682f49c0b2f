/*
 * sections.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Configuration sections of the stormwatch settings document

**************************************************/

#ifndef STORMWATCH_CONFIG_SECTIONS_HPP
#define STORMWATCH_CONFIG_SECTIONS_HPP

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "config_section.hpp"
#include "exception.hpp"

#include "logging/types.hpp"
#include "workflow/retry.hpp"
#include "workflow/types.hpp"

namespace stormwatch::config {

// ============================================================================
// Logging
// ============================================================================

/**
 * @brief Logging configuration, see logging::LoggingConfig
 */
struct LoggingSection : ConfigSection<LoggingSection> {
    static constexpr std::string_view PATH = "/stormwatch/logging";

    logging::LoggingConfig logging;

    [[nodiscard]] json serialize() const { return logging.toJson(); }

    [[nodiscard]] static LoggingSection deserialize(const json& j) {
        LoggingSection cfg;
        if (j.is_null()) {
            return cfg;
        }
        if (!j.is_object()) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           " must be an object");
        }
        try {
            cfg.logging = logging::LoggingConfig::fromJson(j);
        } catch (const json::exception& e) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) + ": " +
                                           e.what());
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        const logging::LoggingConfig d;
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "level", "string", std::string("info"),
                          "Global log level");
        schema["properties"]["level"]["enum"] = {
            "trace", "debug", "info", "warn", "error", "critical", "off"};
        addSchemaProperty(schema, "pattern", "string", d.pattern);
        addSchemaProperty(schema, "enableConsole", "boolean", d.enableConsole);
        addSchemaProperty(schema, "enableFile", "boolean", d.enableFile);
        addSchemaProperty(schema, "logDir", "string", d.logDir);
        addSchemaProperty(schema, "logFilename", "string", d.logFilename);
        addSchemaProperty(schema, "maxFileSize", "integer", d.maxFileSize,
                          "Rotation size in bytes");
        addSchemaProperty(schema, "maxFiles", "integer", d.maxFiles);
        addSchemaProperty(schema, "sinks", "array", json::array(),
                          "Explicit sinks, replaces the console/file pair");
        return schema;
    }
};

// ============================================================================
// Retry
// ============================================================================

/**
 * @brief Retry policy of the three capabilities
 */
struct RetrySection : ConfigSection<RetrySection> {
    static constexpr std::string_view PATH = "/stormwatch/retry";

    workflow::RetryConfig observation;
    workflow::RetryConfig classification;
    workflow::RetryConfig dispatch;

    [[nodiscard]] static json policyToJson(const workflow::RetryConfig& c) {
        return {{"strategy",
                 std::string(workflow::retryStrategyToString(c.strategy))},
                {"maxRetries", c.maxRetries},
                {"initialDelayMs", c.initialDelay.count()},
                {"maxDelayMs", c.maxDelay.count()},
                {"multiplier", c.multiplier}};
    }

    [[nodiscard]] static workflow::RetryConfig policyFromJson(
        const json& j, const std::string& name) {
        workflow::RetryConfig c;
        if (j.is_null()) {
            return c;
        }
        if (!j.is_object()) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) + "/" + name +
                                           " must be an object");
        }
        const auto strategy = readValue<std::string>(
            j, "strategy",
            std::string(workflow::retryStrategyToString(c.strategy)));
        const auto parsed = workflow::parseRetryStrategy(strategy);
        if (!parsed) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) + "/" + name +
                                           ": unknown strategy '" + strategy +
                                           "'");
        }
        c.strategy = *parsed;
        c.maxRetries = readValue<int>(j, "maxRetries", c.maxRetries);
        c.initialDelay = std::chrono::milliseconds(readValue<std::int64_t>(
            j, "initialDelayMs", c.initialDelay.count()));
        c.maxDelay = std::chrono::milliseconds(
            readValue<std::int64_t>(j, "maxDelayMs", c.maxDelay.count()));
        c.multiplier = readValue<double>(j, "multiplier", c.multiplier);

        if (c.maxRetries < 0) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) + "/" + name +
                                           ": maxRetries must not be negative");
        }
        if (c.initialDelay.count() < 0 || c.maxDelay.count() < 0) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) + "/" + name +
                                           ": delays must not be negative");
        }
        if (c.multiplier < 1.0) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) + "/" + name +
                                           ": multiplier must be >= 1");
        }
        return c;
    }

    [[nodiscard]] json serialize() const {
        return {{"observation", policyToJson(observation)},
                {"classification", policyToJson(classification)},
                {"dispatch", policyToJson(dispatch)}};
    }

    [[nodiscard]] static RetrySection deserialize(const json& j) {
        RetrySection cfg;
        if (!j.is_object()) {
            return cfg;
        }
        cfg.observation =
            policyFromJson(j.value("observation", json()), "observation");
        cfg.classification = policyFromJson(j.value("classification", json()),
                                            "classification");
        cfg.dispatch = policyFromJson(j.value("dispatch", json()), "dispatch");
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json policy = {{"type", "object"}};
        const workflow::RetryConfig d;
        addSchemaProperty(policy, "strategy", "string",
                          std::string(workflow::retryStrategyToString(d.strategy)));
        policy["properties"]["strategy"]["enum"] = {"none", "linear",
                                                    "exponential"};
        addSchemaProperty(policy, "maxRetries", "integer", d.maxRetries);
        addRange(policy, "maxRetries", 0);
        addSchemaProperty(policy, "initialDelayMs", "integer",
                          d.initialDelay.count());
        addRange(policy, "initialDelayMs", 0);
        addSchemaProperty(policy, "maxDelayMs", "integer",
                          d.maxDelay.count());
        addRange(policy, "maxDelayMs", 0);
        addSchemaProperty(policy, "multiplier", "number", d.multiplier);
        addRange(policy, "multiplier", 1.0);
        return {{"type", "object"},
                {"properties",
                 {{"observation", policy},
                  {"classification", policy},
                  {"dispatch", policy}}}};
    }
};

// ============================================================================
// Timeouts
// ============================================================================

struct TimeoutsSection : ConfigSection<TimeoutsSection> {
    static constexpr std::string_view PATH = "/stormwatch/timeouts";

    std::int64_t observationMs{10000};
    std::int64_t classificationMs{30000};
    std::int64_t dispatchMs{15000};
    std::int64_t planningMs{30000};

    [[nodiscard]] json serialize() const {
        return {{"observationMs", observationMs},
                {"classificationMs", classificationMs},
                {"dispatchMs", dispatchMs},
                {"planningMs", planningMs}};
    }

    [[nodiscard]] static TimeoutsSection deserialize(const json& j) {
        TimeoutsSection cfg;
        cfg.observationMs =
            readValue<std::int64_t>(j, "observationMs", cfg.observationMs);
        cfg.classificationMs = readValue<std::int64_t>(j, "classificationMs",
                                                       cfg.classificationMs);
        cfg.dispatchMs =
            readValue<std::int64_t>(j, "dispatchMs", cfg.dispatchMs);
        cfg.planningMs =
            readValue<std::int64_t>(j, "planningMs", cfg.planningMs);
        if (cfg.observationMs <= 0 || cfg.classificationMs <= 0 ||
            cfg.dispatchMs <= 0 || cfg.planningMs <= 0) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           ": timeouts must be positive");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "observationMs", "integer",
                          std::int64_t{10000}, "Observation fetch timeout");
        addRange(schema, "observationMs", 1);
        addSchemaProperty(schema, "classificationMs", "integer",
                          std::int64_t{30000}, "Classifier call timeout");
        addRange(schema, "classificationMs", 1);
        addSchemaProperty(schema, "dispatchMs", "integer", std::int64_t{15000},
                          "Notifier call timeout");
        addRange(schema, "dispatchMs", 1);
        addSchemaProperty(schema, "planningMs", "integer", std::int64_t{30000},
                          "Response planner call timeout");
        addRange(schema, "planningMs", 1);
        return schema;
    }
};

// ============================================================================
// Approval
// ============================================================================

struct ApprovalSection : ConfigSection<ApprovalSection> {
    static constexpr std::string_view PATH = "/stormwatch/approval";

    std::int64_t timeoutSeconds{900};

    [[nodiscard]] json serialize() const {
        return {{"timeoutSeconds", timeoutSeconds}};
    }

    [[nodiscard]] static ApprovalSection deserialize(const json& j) {
        ApprovalSection cfg;
        cfg.timeoutSeconds =
            readValue<std::int64_t>(j, "timeoutSeconds", cfg.timeoutSeconds);
        if (cfg.timeoutSeconds <= 0) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           ": timeoutSeconds must be positive");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "timeoutSeconds", "integer",
                          std::int64_t{900},
                          "Time an operator has to answer an approval request");
        addRange(schema, "timeoutSeconds", 1);
        return schema;
    }
};

// ============================================================================
// Policy
// ============================================================================

struct PolicySection : ConfigSection<PolicySection> {
    static constexpr std::string_view PATH = "/stormwatch/policy";

    /// Overrides of the default severity -> approval mapping
    std::map<workflow::Severity, bool> requiresApproval;
    double minConfidence{0.0};

    [[nodiscard]] json serialize() const {
        json overrides = json::object();
        for (const auto& [severity, required] : requiresApproval) {
            overrides[std::string(workflow::severityToString(severity))] =
                required;
        }
        return {{"requiresApproval", overrides},
                {"minConfidence", minConfidence}};
    }

    [[nodiscard]] static PolicySection deserialize(const json& j) {
        PolicySection cfg;
        const auto overrides =
            readValue<json>(j, "requiresApproval", json::object());
        if (!overrides.is_object()) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::string(PATH) + ": requiresApproval must be an object");
        }
        for (const auto& [name, value] : overrides.items()) {
            const auto severity = workflow::parseSeverity(name);
            if (!severity) {
                THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                               ": unknown severity '" + name +
                                               "'");
            }
            if (!value.is_boolean()) {
                THROW_INVALID_CONFIG_EXCEPTION(
                    std::string(PATH) + ": requiresApproval/" + name +
                    " must be a boolean");
            }
            cfg.requiresApproval[*severity] = value.get<bool>();
        }
        cfg.minConfidence =
            readValue<double>(j, "minConfidence", cfg.minConfidence);
        if (cfg.minConfidence < 0.0 || cfg.minConfidence > 1.0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::string(PATH) + ": minConfidence must be within [0, 1]");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "requiresApproval", "object", json::object(),
                          "Severity name to approval requirement");
        schema["properties"]["requiresApproval"]["additionalProperties"] = {
            {"type", "boolean"}};
        addSchemaProperty(schema, "minConfidence", "number", 0.0,
                          "Classifier confidence below this needs approval");
        addRange(schema, "minConfidence", 0.0, 1.0);
        return schema;
    }
};

// ============================================================================
// Notifier
// ============================================================================

struct NotifierSection : ConfigSection<NotifierSection> {
    static constexpr std::string_view PATH = "/stormwatch/notifier";

    std::vector<std::string> recipients;
    std::string outboxPath{"outbox.jsonl"};
    std::string sender{"stormwatch@localhost"};

    [[nodiscard]] json serialize() const {
        return {{"recipients", recipients},
                {"outboxPath", outboxPath},
                {"sender", sender}};
    }

    [[nodiscard]] static NotifierSection deserialize(const json& j) {
        NotifierSection cfg;
        cfg.recipients = readValue(j, "recipients", cfg.recipients);
        cfg.outboxPath = readValue(j, "outboxPath", cfg.outboxPath);
        cfg.sender = readValue(j, "sender", cfg.sender);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "recipients", "array", json::array(),
                          "Alert recipients");
        schema["properties"]["recipients"]["items"] = {{"type", "string"}};
        addSchemaProperty(schema, "outboxPath", "string",
                          std::string("outbox.jsonl"));
        addSchemaProperty(schema, "sender", "string",
                          std::string("stormwatch@localhost"));
        return schema;
    }
};

// ============================================================================
// Monitor
// ============================================================================

struct MonitorSection : ConfigSection<MonitorSection> {
    static constexpr std::string_view PATH = "/stormwatch/monitor";

    std::vector<std::string> locations;
    std::int64_t pollIntervalSeconds{3600};
    int workerThreads{4};
    int capabilityThreads{4};
    /// 0 runs until stopped
    std::uint64_t maxCycles{0};
    /// 0 means approval timeout + 300 s
    std::int64_t cycleTimeoutSeconds{0};
    std::uint64_t retainedCycles{2};

    [[nodiscard]] json serialize() const {
        return {{"locations", locations},
                {"pollIntervalSeconds", pollIntervalSeconds},
                {"workerThreads", workerThreads},
                {"capabilityThreads", capabilityThreads},
                {"maxCycles", maxCycles},
                {"cycleTimeoutSeconds", cycleTimeoutSeconds},
                {"retainedCycles", retainedCycles}};
    }

    [[nodiscard]] static MonitorSection deserialize(const json& j) {
        MonitorSection cfg;
        cfg.locations = readValue(j, "locations", cfg.locations);
        cfg.pollIntervalSeconds = readValue<std::int64_t>(
            j, "pollIntervalSeconds", cfg.pollIntervalSeconds);
        cfg.workerThreads =
            readValue<int>(j, "workerThreads", cfg.workerThreads);
        cfg.capabilityThreads =
            readValue<int>(j, "capabilityThreads", cfg.capabilityThreads);
        cfg.maxCycles = readValue<std::uint64_t>(j, "maxCycles", cfg.maxCycles);
        cfg.cycleTimeoutSeconds = readValue<std::int64_t>(
            j, "cycleTimeoutSeconds", cfg.cycleTimeoutSeconds);
        cfg.retainedCycles = readValue<std::uint64_t>(j, "retainedCycles",
                                                      cfg.retainedCycles);

        if (cfg.workerThreads <= 0 || cfg.capabilityThreads <= 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::string(PATH) +
                ": workerThreads and capabilityThreads must be positive");
        }
        if (cfg.pollIntervalSeconds < 0 || cfg.cycleTimeoutSeconds < 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::string(PATH) + ": intervals must not be negative");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "locations", "array", json::array(),
                          "Monitored locations");
        schema["properties"]["locations"]["items"] = {{"type", "string"}};
        addSchemaProperty(schema, "pollIntervalSeconds", "integer",
                          std::int64_t{3600});
        addRange(schema, "pollIntervalSeconds", 0);
        addSchemaProperty(schema, "workerThreads", "integer", 4);
        addRange(schema, "workerThreads", 1);
        addSchemaProperty(schema, "capabilityThreads", "integer", 4,
                          "Threads running provider calls");
        addRange(schema, "capabilityThreads", 1);
        addSchemaProperty(schema, "maxCycles", "integer", 0,
                          "0 runs until stopped");
        addSchemaProperty(schema, "cycleTimeoutSeconds", "integer", 0,
                          "0 means approval timeout + 300");
        addRange(schema, "cycleTimeoutSeconds", 0);
        addSchemaProperty(schema, "retainedCycles", "integer", 2,
                          "Finished cycles kept queryable");
        addRange(schema, "retainedCycles", 0);
        return schema;
    }
};

// ============================================================================
// Audit
// ============================================================================

struct AuditSection : ConfigSection<AuditSection> {
    static constexpr std::string_view PATH = "/stormwatch/audit";

    std::string path{"audit.jsonl"};

    [[nodiscard]] json serialize() const { return {{"path", path}}; }

    [[nodiscard]] static AuditSection deserialize(const json& j) {
        AuditSection cfg;
        cfg.path = readValue(j, "path", cfg.path);
        if (cfg.path.empty()) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           ": path must not be empty");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "path", "string", std::string("audit.jsonl"),
                          "JSON-lines audit trail");
        return schema;
    }
};

// ============================================================================
// Observation source
// ============================================================================

struct SourceSection : ConfigSection<SourceSection> {
    static constexpr std::string_view PATH = "/stormwatch/source";

    std::string observationsPath{"observations.json"};

    [[nodiscard]] json serialize() const {
        return {{"observationsPath", observationsPath}};
    }

    [[nodiscard]] static SourceSection deserialize(const json& j) {
        SourceSection cfg;
        cfg.observationsPath =
            readValue(j, "observationsPath", cfg.observationsPath);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "observationsPath", "string",
                          std::string("observations.json"),
                          "Observation feed keyed by location");
        return schema;
    }
};

}  // namespace stormwatch::config

#endif  // STORMWATCH_CONFIG_SECTIONS_HPP
