/*
 * capabilities.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "capabilities.hpp"

namespace stormwatch::workflow {

auto errorClassOf(const ObservationError& error) -> ErrorClass {
    return error.code == ObservationErrorCode::NotFound ? ErrorClass::Terminal
                                                        : ErrorClass::Transient;
}

auto errorClassOf(const ClassificationError& error) -> ErrorClass {
    return error.code == ClassificationErrorCode::MalformedOutput
               ? ErrorClass::Terminal
               : ErrorClass::Transient;
}

auto errorClassOf(const NotifyError& error) -> ErrorClass {
    return error.code == NotifyErrorCode::Terminal ? ErrorClass::Terminal
                                                   : ErrorClass::Transient;
}

auto toString(ObservationErrorCode code) -> std::string_view {
    switch (code) {
        case ObservationErrorCode::Timeout:
            return "Timeout";
        case ObservationErrorCode::NotFound:
            return "NotFound";
        case ObservationErrorCode::ProviderError:
            return "ProviderError";
    }
    return "ProviderError";
}

auto toString(ClassificationErrorCode code) -> std::string_view {
    switch (code) {
        case ClassificationErrorCode::Timeout:
            return "Timeout";
        case ClassificationErrorCode::ModelUnavailable:
            return "ModelUnavailable";
        case ClassificationErrorCode::MalformedOutput:
            return "MalformedOutput";
    }
    return "ModelUnavailable";
}

auto toString(NotifyErrorCode code) -> std::string_view {
    switch (code) {
        case NotifyErrorCode::Transient:
            return "Transient";
        case NotifyErrorCode::Terminal:
            return "Terminal";
    }
    return "Transient";
}

auto toString(PlanningErrorCode code) -> std::string_view {
    switch (code) {
        case PlanningErrorCode::Timeout:
            return "Timeout";
        case PlanningErrorCode::Unavailable:
            return "Unavailable";
    }
    return "Unavailable";
}

}  // namespace stormwatch::workflow
