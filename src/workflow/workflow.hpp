/*
 * workflow.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Weather incident workflow, single include

**************************************************/

#ifndef STORMWATCH_WORKFLOW_WORKFLOW_HPP
#define STORMWATCH_WORKFLOW_WORKFLOW_HPP

#include "alert_message.hpp"
#include "approval_gate.hpp"
#include "audit_log.hpp"
#include "capabilities.hpp"
#include "engine.hpp"
#include "exception.hpp"
#include "incident.hpp"
#include "monitor.hpp"
#include "retry.hpp"
#include "severity_policy.hpp"
#include "types.hpp"

#endif  // STORMWATCH_WORKFLOW_WORKFLOW_HPP
