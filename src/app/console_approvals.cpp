/*
 * console_approvals.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "console_approvals.hpp"

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include <fmt/format.h>

#include "logging/logging_manager.hpp"
#include "workflow/exception.hpp"

namespace stormwatch::app {

ConsoleApprovals::ConsoleApprovals(
    std::shared_ptr<workflow::WorkflowEngine> engine, std::ostream& out,
    QuitHandler onQuit)
    : engine_(std::move(engine)),
      out_(out),
      onQuit_(std::move(onQuit)),
      logger_(logging::LoggingManager::getInstance().getLogger("approval")) {}

auto ConsoleApprovals::handleLine(const std::string& line) -> bool {
    std::istringstream stream(line);
    std::string command;
    std::string argument;
    stream >> command >> argument;

    if (command.empty()) {
        return true;
    }
    if (command == "approve" || command == "reject") {
        if (argument.empty()) {
            out_ << "usage: " << command << " <requestId>" << std::endl;
            return true;
        }
        resolve(argument, command == "approve"
                              ? workflow::ApprovalDecision::Approve
                              : workflow::ApprovalDecision::Reject);
        return true;
    }
    if (command == "pending") {
        listPending();
        return true;
    }
    if (command == "quit" || command == "exit") {
        out_ << "stopping" << std::endl;
        if (onQuit_) {
            onQuit_();
        }
        return false;
    }
    if (command == "help") {
        printHelp();
        return true;
    }
    out_ << "unknown command '" << command << "', try 'help'" << std::endl;
    return true;
}

void ConsoleApprovals::run(std::stop_token token, int fd,
                           std::chrono::milliseconds pollInterval) {
    std::string pending;
    std::array<char, 512> buffer{};

    while (!token.stop_requested()) {
        pollfd descriptor{fd, POLLIN, 0};
        const int ready =
            ::poll(&descriptor, 1, static_cast<int>(pollInterval.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_->error("Polling operator input failed: {}",
                           std::strerror(errno));
            return;
        }
        if (ready == 0) {
            continue;
        }

        const auto n = ::read(fd, buffer.data(), buffer.size());
        if (n <= 0) {
            logger_->info("Operator input closed");
            return;
        }
        pending.append(buffer.data(), static_cast<size_t>(n));

        size_t newline = 0;
        while ((newline = pending.find('\n')) != std::string::npos) {
            auto line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!handleLine(line)) {
                return;
            }
        }
    }
}

void ConsoleApprovals::resolve(const std::string& requestId,
                               workflow::ApprovalDecision decision) {
    try {
        const auto request = engine_->resolveApproval(requestId, decision);
        out_ << fmt::format("request {} for incident {}: {}", request.id,
                            request.incidentId,
                            workflow::resolutionToString(request.resolution))
             << std::endl;
    } catch (const workflow::ApprovalNotFoundException& e) {
        out_ << "unknown request " << requestId << std::endl;
        logger_->debug("Operator named unknown request: {}", e.what());
    } catch (const workflow::InvalidStateException& e) {
        out_ << "request " << requestId << " is already settled" << std::endl;
        logger_->debug("Operator decision rejected: {}", e.what());
    }
}

void ConsoleApprovals::listPending() {
    const auto pending = engine_->pendingApprovals();
    if (pending.empty()) {
        out_ << "no pending approvals" << std::endl;
        return;
    }
    for (const auto& request : pending) {
        const auto incident = engine_->getIncident(request.incidentId);
        std::string summary;
        if (incident.assessment) {
            summary = fmt::format(
                "{} / {}", incident.assessment->disasterType,
                workflow::severityToString(incident.assessment->severity));
        }
        out_ << fmt::format("{}  incident={}  deadline={}  {}", request.id,
                            request.incidentId,
                            workflow::formatTimestamp(request.deadline),
                            summary)
             << std::endl;
    }
}

void ConsoleApprovals::printHelp() {
    out_ << "commands:\n"
         << "  approve <requestId>   dispatch the alert\n"
         << "  reject <requestId>    close the incident without an alert\n"
         << "  pending               list open approval requests\n"
         << "  quit                  stop monitoring" << std::endl;
}

}  // namespace stormwatch::app
