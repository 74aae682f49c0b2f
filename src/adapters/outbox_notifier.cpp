/*
 * outbox_notifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "outbox_notifier.hpp"

#include <fstream>
#include <utility>

#include "logging/logging_manager.hpp"

namespace stormwatch::adapters {

using workflow::NotifyError;
using workflow::NotifyErrorCode;

OutboxNotifier::OutboxNotifier(std::filesystem::path outboxPath,
                               std::string sender)
    : outboxPath_(std::move(outboxPath)),
      sender_(std::move(sender)),
      logger_(logging::LoggingManager::getInstance().getLogger("adapters")) {}

auto OutboxNotifier::send(const std::vector<std::string>& recipients,
                          const std::string& subject, const std::string& body,
                          std::chrono::milliseconds /*timeout*/)
    -> std::expected<void, NotifyError> {
    if (recipients.empty()) {
        return std::unexpected(
            NotifyError{NotifyErrorCode::Terminal, "No recipients configured"});
    }
    for (const auto& recipient : recipients) {
        if (recipient.find('@') == std::string::npos) {
            return std::unexpected(
                NotifyError{NotifyErrorCode::Terminal,
                            "Invalid recipient address '" + recipient + "'"});
        }
    }

    const workflow::json message = {
        {"from", sender_},
        {"to", recipients},
        {"subject", subject},
        {"body", body},
        {"sentAt", workflow::formatTimestamp(workflow::Clock::now())}};

    std::lock_guard lock(mutex_);
    std::ofstream out(outboxPath_, std::ios::app);
    if (!out) {
        return std::unexpected(
            NotifyError{NotifyErrorCode::Transient,
                        "Cannot open outbox " + outboxPath_.string()});
    }
    out << message.dump() << '\n';
    out.flush();
    if (!out) {
        return std::unexpected(
            NotifyError{NotifyErrorCode::Transient,
                        "Write to outbox " + outboxPath_.string() + " failed"});
    }

    ++sent_;
    logger_->info("Alert '{}' sent to {} recipient(s)", subject,
                  recipients.size());
    return {};
}

auto OutboxNotifier::sentCount() const -> size_t {
    std::lock_guard lock(mutex_);
    return sent_;
}

}  // namespace stormwatch::adapters
