/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: stormwatch command line program

**************************************************/

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

#include "atom/utils/argsview.hpp"

#include "adapters/file_observation_source.hpp"
#include "adapters/outbox_notifier.hpp"
#include "adapters/template_response_planner.hpp"
#include "adapters/threshold_classifier.hpp"
#include "app/console_approvals.hpp"
#include "app/eventloop.hpp"
#include "config/settings.hpp"
#include "logging/logging_manager.hpp"
#include "workflow/workflow.hpp"

using namespace std::string_literals;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitBadConfig = 1;
constexpr int kExitCapabilityInit = 2;

constexpr auto kShutdownGrace = std::chrono::seconds(5);

volatile std::sig_atomic_t gSignalled = 0;

void onSignal(int /*signal*/) { gSignalled = 1; }

auto splitLocations(const std::string& list) -> std::vector<std::string> {
    std::vector<std::string> result;
    std::stringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto begin = item.find_first_not_of(" \t");
        const auto end = item.find_last_not_of(" \t");
        if (begin != std::string::npos) {
            result.push_back(item.substr(begin, end - begin + 1));
        }
    }
    return result;
}

/**
 * @brief Checks that every capability can start before the first cycle
 */
auto checkCapabilities(const stormwatch::config::Settings& settings,
                       const stormwatch::adapters::FileObservationSource& source,
                       stormwatch::workflow::JsonLinesAuditSink& auditSink,
                       const std::shared_ptr<spdlog::logger>& logger) -> bool {
    bool ok = true;
    if (!source.checkReady()) {
        logger->critical("Observation feed {} is missing or unreadable",
                         source.path().string());
        ok = false;
    }
    if (settings.notifier.recipients.empty()) {
        logger->critical("No alert recipients configured");
        ok = false;
    }
    if (!auditSink.checkReady()) {
        logger->critical("Audit trail {} is not writable", auditSink.path());
        ok = false;
    }
    if (settings.monitor.locations.empty()) {
        logger->warn("No locations configured, cycles will be empty");
    }
    return ok;
}

}  // namespace

int main(int argc, char *argv[]) {
    using namespace stormwatch;

    auto &logManager = logging::LoggingManager::getInstance();
    auto logger = logManager.getLogger("stormwatch");

    atom::utils::ArgumentParser program("stormwatch"s);

    // NOTE: The command arguments' priority is higher than the config file
    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "stormwatch.yaml"s, "Path to the settings file",
                        {"c"});
    program.addArgument("locations",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Comma separated locations to monitor", {"L"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Log level (trace/debug/info/warn/error)", {"l"});
    program.addArgument("cycles", atom::utils::ArgumentParser::ArgType::INTEGER,
                        false, -1, "Number of cycles to run, 0 is unbounded",
                        {"n"});
    program.addArgument("schema", atom::utils::ArgumentParser::ArgType::BOOLEAN,
                        false, false, "Print the settings schema and exit",
                        {"s"});

    program.addDescription("stormwatch weather alert dispatcher:");
    program.addEpilog(
        "Operator commands on stdin: approve <id>, reject <id>, pending, quit");

    config::Settings settings;
    try {
        std::vector<std::string> args(argv, argv + argc);
        program.parse(argc, args);

        if (program.get<bool>("schema").value_or(false)) {
            std::cout << config::Settings::schema().dump(2) << std::endl;
            return kExitOk;
        }

        const auto configPath =
            program.get<std::string>("config").value_or("stormwatch.yaml");
        settings = config::loadSettings(configPath);

        config::json monitorOverrides = config::json::object();
        const auto cmdLocations =
            program.get<std::string>("locations").value_or("");
        if (!cmdLocations.empty()) {
            monitorOverrides["locations"] = splitLocations(cmdLocations);
        }
        const auto cmdCycles = program.get<int>("cycles").value_or(-1);
        if (cmdCycles >= 0) {
            monitorOverrides["maxCycles"] = cmdCycles;
        }
        if (!monitorOverrides.empty()) {
            settings.monitor.merge(monitorOverrides);
            logger->debug("CLI override of {}: {}",
                          config::MonitorSection::path(),
                          monitorOverrides.dump());
        }
        const auto cmdLogLevel =
            program.get<std::string>("log-level").value_or("");
        if (!cmdLogLevel.empty()) {
            if (!logging::isLevelName(cmdLogLevel)) {
                logger->error("Unknown log level '{}'", cmdLogLevel);
                return kExitBadConfig;
            }
            settings.logging.logging.level =
                logging::levelFromString(cmdLogLevel);
        }
    } catch (const config::BadConfigException &e) {
        logger->error("Configuration error: {}", e.what());
        return kExitBadConfig;
    } catch (const std::exception &e) {
        logger->error("Invalid arguments: {}", e.what());
        return kExitBadConfig;
    }

    logManager.initialize(settings.logging.logging);
    logger = logManager.getLogger("stormwatch");

    auto source = std::make_shared<adapters::FileObservationSource>(
        settings.source.observationsPath);
    auto classifier = std::make_shared<adapters::ThresholdClassifier>();
    auto notifier = std::make_shared<adapters::OutboxNotifier>(
        settings.notifier.outboxPath, settings.notifier.sender);
    auto auditSink =
        std::make_shared<workflow::JsonLinesAuditSink>(settings.audit.path);

    if (!checkCapabilities(settings, *source, *auditSink, logger)) {
        logManager.shutdown();
        return kExitCapabilityInit;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    auto loop = std::make_shared<app::EventLoop>(settings.monitor.workerThreads);
    auto engine = workflow::WorkflowEngine::create(
        loop,
        workflow::Capabilities{
            source, classifier, notifier,
            std::make_shared<adapters::TemplateResponsePlanner>()},
        settings.toSeverityPolicy(),
        std::make_shared<workflow::AuditLog>(auditSink),
        settings.toEngineSettings());
    workflow::MonitorService monitor(engine, settings.toMonitorSettings());

    std::atomic<bool> monitorDone{false};
    std::jthread monitorThread([&monitor, &monitorDone]() {
        monitor.run();
        monitorDone = true;
    });

    app::ConsoleApprovals console(engine, std::cout,
                                  [&monitor]() { monitor.stop(); });
    std::jthread consoleThread([&console](std::stop_token token) {
        console.run(token, STDIN_FILENO);
    });

    while (!monitorDone.load() && gSignalled == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (gSignalled != 0) {
        logger->info("Signal received, shutting down");
    }

    monitor.stop();
    monitorThread.join();
    consoleThread.request_stop();
    consoleThread.join();

    engine->shutdown();
    std::vector<std::string> ids;
    for (const auto &incident : engine->listIncidents()) {
        ids.push_back(incident.id);
    }
    if (!engine->waitForAll(
            ids, std::chrono::duration_cast<std::chrono::milliseconds>(
                     kShutdownGrace))) {
        logger->warn("Some incidents were still running at shutdown");
    }
    loop->stop();

    const auto audit = engine->auditLog();
    logger->info("stormwatch stopped: {} cycle(s), {} audit record(s), {} "
                 "audit failure(s)",
                 monitor.completedCycles(), audit->recordedCount(),
                 audit->failureCount());
    logManager.shutdown();
    return kExitOk;
}
