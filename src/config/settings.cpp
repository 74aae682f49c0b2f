/*
 * settings.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "logging/logging_manager.hpp"
#include "yaml_parser.hpp"

namespace stormwatch::config {

namespace {

constexpr std::string_view kRootKey = "stormwatch";
constexpr std::int64_t kCycleTimeoutSlackSeconds = 300;

template <typename Section>
auto readSection(const json& root) -> Section {
    const auto key = std::string(Section::key());
    if (!root.contains(key)) {
        return Section::defaults();
    }
    return Section::fromJson(root.at(key));
}

auto lowercaseExtension(const std::filesystem::path& path) -> std::string {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

}  // namespace

auto Settings::toJson() const -> json {
    json root = json::object();
    root[std::string(LoggingSection::key())] = logging.toJson();
    root[std::string(RetrySection::key())] = retry.toJson();
    root[std::string(TimeoutsSection::key())] = timeouts.toJson();
    root[std::string(ApprovalSection::key())] = approval.toJson();
    root[std::string(PolicySection::key())] = policy.toJson();
    root[std::string(NotifierSection::key())] = notifier.toJson();
    root[std::string(MonitorSection::key())] = monitor.toJson();
    root[std::string(AuditSection::key())] = audit.toJson();
    root[std::string(SourceSection::key())] = source.toJson();
    return {{std::string(kRootKey), root}};
}

auto Settings::fromJson(const json& j) -> Settings {
    if (!j.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION("Settings document must be an object");
    }
    const auto key = std::string(kRootKey);
    const json root = j.contains(key) ? j.at(key) : json::object();
    if (!root.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION("'stormwatch' must be an object");
    }

    Settings settings;
    settings.logging = readSection<LoggingSection>(root);
    settings.retry = readSection<RetrySection>(root);
    settings.timeouts = readSection<TimeoutsSection>(root);
    settings.approval = readSection<ApprovalSection>(root);
    settings.policy = readSection<PolicySection>(root);
    settings.notifier = readSection<NotifierSection>(root);
    settings.monitor = readSection<MonitorSection>(root);
    settings.audit = readSection<AuditSection>(root);
    settings.source = readSection<SourceSection>(root);
    return settings;
}

auto Settings::schema() -> json {
    json properties = json::object();
    properties[std::string(LoggingSection::key())] = LoggingSection::schema();
    properties[std::string(RetrySection::key())] = RetrySection::schema();
    properties[std::string(TimeoutsSection::key())] = TimeoutsSection::schema();
    properties[std::string(ApprovalSection::key())] = ApprovalSection::schema();
    properties[std::string(PolicySection::key())] = PolicySection::schema();
    properties[std::string(NotifierSection::key())] = NotifierSection::schema();
    properties[std::string(MonitorSection::key())] = MonitorSection::schema();
    properties[std::string(AuditSection::key())] = AuditSection::schema();
    properties[std::string(SourceSection::key())] = SourceSection::schema();
    return {{"$schema", "http://json-schema.org/draft-07/schema#"},
            {"type", "object"},
            {"properties",
             {{std::string(kRootKey),
               {{"type", "object"}, {"properties", properties}}}}}};
}

auto Settings::effectiveCycleTimeout() const -> std::chrono::seconds {
    if (monitor.cycleTimeoutSeconds > 0) {
        return std::chrono::seconds(monitor.cycleTimeoutSeconds);
    }
    return std::chrono::seconds(approval.timeoutSeconds +
                                kCycleTimeoutSlackSeconds);
}

auto Settings::toEngineSettings() const -> workflow::EngineSettings {
    workflow::EngineSettings engine;
    engine.observationRetry = retry.observation;
    engine.classificationRetry = retry.classification;
    engine.dispatchRetry = retry.dispatch;
    engine.observationTimeout = std::chrono::milliseconds(timeouts.observationMs);
    engine.classificationTimeout =
        std::chrono::milliseconds(timeouts.classificationMs);
    engine.dispatchTimeout = std::chrono::milliseconds(timeouts.dispatchMs);
    engine.planningTimeout = std::chrono::milliseconds(timeouts.planningMs);
    engine.approvalTimeout = std::chrono::seconds(approval.timeoutSeconds);
    engine.minConfidence = policy.minConfidence;
    engine.recipients = notifier.recipients;
    engine.capabilityThreads = monitor.capabilityThreads;
    return engine;
}

auto Settings::toMonitorSettings() const -> workflow::MonitorSettings {
    workflow::MonitorSettings settings;
    settings.locations = monitor.locations;
    settings.pollInterval = std::chrono::seconds(monitor.pollIntervalSeconds);
    settings.maxCycles = monitor.maxCycles;
    settings.cycleTimeout = effectiveCycleTimeout();
    settings.retainedCycles = monitor.retainedCycles;
    return settings;
}

auto Settings::toSeverityPolicy() const -> workflow::SeverityPolicy {
    return workflow::SeverityPolicy(policy.requiresApproval);
}

auto parseSettings(std::string_view content, std::string_view format)
    -> Settings {
    json document;
    if (format == "yaml") {
        auto parsed = YamlParser::parse(content);
        if (!parsed) {
            THROW_BAD_CONFIG_EXCEPTION("Invalid YAML settings: " +
                                       YamlParser::getLastError());
        }
        document = std::move(*parsed);
    } else if (format == "json") {
        try {
            document = json::parse(content);
        } catch (const json::parse_error& e) {
            THROW_BAD_CONFIG_EXCEPTION(std::string("Invalid JSON settings: ") +
                                       e.what());
        }
    } else {
        THROW_BAD_CONFIG_EXCEPTION("Unsupported settings format: " +
                                   std::string(format));
    }

    // An empty YAML document means all defaults
    if (document.is_null()) {
        document = json::object();
    }
    return Settings::fromJson(document);
}

auto loadSettings(const std::filesystem::path& path) -> Settings {
    auto logger = logging::LoggingManager::getInstance().getLogger("config");

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        THROW_CONFIG_IO_EXCEPTION("Settings file not found: " + path.string());
    }

    const auto ext = lowercaseExtension(path);
    std::string format;
    if (ext == ".json") {
        format = "json";
    } else if (ext == ".yaml" || ext == ".yml") {
        format = "yaml";
    } else {
        THROW_BAD_CONFIG_EXCEPTION("Unsupported settings file type: " +
                                   path.string());
    }

    std::ifstream file(path);
    if (!file) {
        THROW_CONFIG_IO_EXCEPTION("Cannot open settings file: " +
                                  path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto settings = parseSettings(buffer.str(), format);
    logger->info("Loaded settings from {} ({} location(s))", path.string(),
                 settings.monitor.locations.size());
    return settings;
}

}  // namespace stormwatch::config
