/*
 * outbox_notifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Notifier appending alerts to a JSON-lines outbox

**************************************************/

#ifndef STORMWATCH_ADAPTERS_OUTBOX_NOTIFIER_HPP
#define STORMWATCH_ADAPTERS_OUTBOX_NOTIFIER_HPP

#include <filesystem>
#include <memory>
#include <mutex>

#include <spdlog/spdlog.h>

#include "workflow/capabilities.hpp"

namespace stormwatch::adapters {

/**
 * @brief Writes each alert as one JSON object per line.
 *
 * An empty recipient list or a recipient without '@' is a terminal failure;
 * an outbox that cannot be opened is transient.
 */
class OutboxNotifier : public workflow::Notifier {
public:
    OutboxNotifier(std::filesystem::path outboxPath, std::string sender);

    auto send(const std::vector<std::string>& recipients,
              const std::string& subject, const std::string& body,
              std::chrono::milliseconds timeout)
        -> std::expected<void, workflow::NotifyError> override;

    [[nodiscard]] auto sentCount() const -> size_t;

private:
    std::filesystem::path outboxPath_;
    std::string sender_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    size_t sent_{0};
};

}  // namespace stormwatch::adapters

#endif  // STORMWATCH_ADAPTERS_OUTBOX_NOTIFIER_HPP
