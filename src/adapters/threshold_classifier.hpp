/*
 * threshold_classifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Rule-based classifier over observation thresholds

**************************************************/

#ifndef STORMWATCH_ADAPTERS_THRESHOLD_CLASSIFIER_HPP
#define STORMWATCH_ADAPTERS_THRESHOLD_CLASSIFIER_HPP

#include "workflow/capabilities.hpp"

namespace stormwatch::adapters {

/**
 * @brief Deterministic classifier. The first matching rule wins:
 *
 * | rule                                              | result              |
 * |---------------------------------------------------|---------------------|
 * | wind >= 33 m/s                                    | Hurricane, Critical |
 * | precipitation >= 50 mm (>= 100 Critical)          | Flood, High         |
 * | temperature >= 40 C (>= 45 Critical)              | Heatwave, High      |
 * | wind >= 17 and (humidity >= 80 or pressure <= 1010)| Severe Storm, High |
 * | temperature <= -10 and precipitation > 0          | Winter Storm, Medium|
 * | wind >= 10                                        | Severe Storm, Low   |
 * | otherwise                                         | No Immediate Threat |
 *
 * Missing wind, pressure or temperature yields MalformedOutput.
 */
class ThresholdClassifier : public workflow::Classifier {
public:
    auto classify(const workflow::Observation& observation,
                  std::chrono::milliseconds timeout)
        -> std::expected<workflow::ClassifierVerdict,
                         workflow::ClassificationError> override;
};

}  // namespace stormwatch::adapters

#endif  // STORMWATCH_ADAPTERS_THRESHOLD_CLASSIFIER_HPP
