/*
 * capabilities.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Interfaces of the external collaborators injected into the
workflow engine: observation source, classifier and notifier

**************************************************/

#ifndef STORMWATCH_WORKFLOW_CAPABILITIES_HPP
#define STORMWATCH_WORKFLOW_CAPABILITIES_HPP

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace stormwatch::workflow {

/**
 * @brief Retry classification of a capability failure
 */
enum class ErrorClass { Transient, Terminal };

enum class ObservationErrorCode { Timeout, NotFound, ProviderError };
enum class ClassificationErrorCode { Timeout, ModelUnavailable, MalformedOutput };
enum class NotifyErrorCode { Transient, Terminal };
enum class PlanningErrorCode { Timeout, Unavailable };

struct ObservationError {
    ObservationErrorCode code{ObservationErrorCode::ProviderError};
    std::string message;
};

struct ClassificationError {
    ClassificationErrorCode code{ClassificationErrorCode::ModelUnavailable};
    std::string message;
};

struct NotifyError {
    NotifyErrorCode code{NotifyErrorCode::Transient};
    std::string message;
};

struct PlanningError {
    PlanningErrorCode code{PlanningErrorCode::Unavailable};
    std::string message;
};

using ObservationResult = std::expected<Observation, ObservationError>;
using ClassificationResult = std::expected<ClassifierVerdict, ClassificationError>;
using NotifyResult = std::expected<void, NotifyError>;
using PlanResult = std::expected<std::string, PlanningError>;

[[nodiscard]] auto errorClassOf(const ObservationError& error) -> ErrorClass;
[[nodiscard]] auto errorClassOf(const ClassificationError& error) -> ErrorClass;
[[nodiscard]] auto errorClassOf(const NotifyError& error) -> ErrorClass;

[[nodiscard]] auto toString(ObservationErrorCode code) -> std::string_view;
[[nodiscard]] auto toString(ClassificationErrorCode code) -> std::string_view;
[[nodiscard]] auto toString(NotifyErrorCode code) -> std::string_view;
[[nodiscard]] auto toString(PlanningErrorCode code) -> std::string_view;

/**
 * @brief Supplies weather snapshots by location name
 */
class ObservationSource {
public:
    virtual ~ObservationSource() = default;

    virtual auto fetch(const std::string& location,
                       std::chrono::milliseconds timeout)
        -> std::expected<Observation, ObservationError> = 0;
};

/**
 * @brief Judges disaster type and severity of an observation
 */
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual auto classify(const Observation& observation,
                          std::chrono::milliseconds timeout)
        -> std::expected<ClassifierVerdict, ClassificationError> = 0;
};

/**
 * @brief Delivers a formatted alert to its recipients
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual auto send(const std::vector<std::string>& recipients,
                      const std::string& subject, const std::string& body,
                      std::chrono::milliseconds timeout)
        -> std::expected<void, NotifyError> = 0;
};

/**
 * @brief Drafts the response plan of the department handling an event.
 * Optional; without a plan the alert goes out without one.
 */
class ResponsePlanner {
public:
    virtual ~ResponsePlanner() = default;

    virtual auto plan(const std::string& department,
                      const std::string& location,
                      const Assessment& assessment,
                      std::chrono::milliseconds timeout) -> PlanResult = 0;
};

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_CAPABILITIES_HPP
