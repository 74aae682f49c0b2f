/*
 * console_approvals.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Operator approval channel on standard input

**************************************************/

#ifndef STORMWATCH_APP_CONSOLE_APPROVALS_HPP
#define STORMWATCH_APP_CONSOLE_APPROVALS_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <ostream>
#include <stop_token>
#include <string>

#include <spdlog/spdlog.h>

#include "workflow/engine.hpp"

namespace stormwatch::app {

/**
 * @brief Reads operator commands and applies them to the engine.
 *
 * Commands:
 *   approve <requestId>
 *   reject <requestId>
 *   pending
 *   quit
 *   help
 */
class ConsoleApprovals {
public:
    using QuitHandler = std::function<void()>;

    ConsoleApprovals(std::shared_ptr<workflow::WorkflowEngine> engine,
                     std::ostream& out, QuitHandler onQuit);

    /**
     * @brief Executes one command line.
     * @return false once "quit" was handled
     */
    auto handleLine(const std::string& line) -> bool;

    /**
     * @brief Polls the file descriptor @p fd until @p token is stopped, the
     * input ends or "quit" is read.
     *
     * @param pollInterval Upper bound on the time between stop checks
     */
    void run(std::stop_token token, int fd,
             std::chrono::milliseconds pollInterval =
                 std::chrono::milliseconds(200));

private:
    void resolve(const std::string& requestId,
                 workflow::ApprovalDecision decision);
    void listPending();
    void printHelp();

    std::shared_ptr<workflow::WorkflowEngine> engine_;
    std::ostream& out_;
    QuitHandler onQuit_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace stormwatch::app

#endif  // STORMWATCH_APP_CONSOLE_APPROVALS_HPP
