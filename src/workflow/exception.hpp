/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Workflow Exception Types

**************************************************/

#ifndef STORMWATCH_WORKFLOW_EXCEPTION_HPP
#define STORMWATCH_WORKFLOW_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace stormwatch::workflow {

/**
 * @brief Base exception for workflow errors
 */
class WorkflowException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_WORKFLOW_EXCEPTION(...)                                \
    throw stormwatch::workflow::WorkflowException(                   \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Operation not allowed in the current state, e.g. resolving an
 * approval request that is already resolved or expired
 */
class InvalidStateException : public WorkflowException {
    using WorkflowException::WorkflowException;
};

#define THROW_INVALID_STATE_EXCEPTION(...)                           \
    throw stormwatch::workflow::InvalidStateException(               \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Unknown approval request id
 */
class ApprovalNotFoundException : public WorkflowException {
    using WorkflowException::WorkflowException;
};

#define THROW_APPROVAL_NOT_FOUND_EXCEPTION(...)                      \
    throw stormwatch::workflow::ApprovalNotFoundException(           \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Unknown incident id
 */
class IncidentNotFoundException : public WorkflowException {
    using WorkflowException::WorkflowException;
};

#define THROW_INCIDENT_NOT_FOUND_EXCEPTION(...)                      \
    throw stormwatch::workflow::IncidentNotFoundException(           \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief An incident for the same location and cycle already exists
 */
class DuplicateIncidentException : public WorkflowException {
    using WorkflowException::WorkflowException;
};

#define THROW_DUPLICATE_INCIDENT_EXCEPTION(...)                      \
    throw stormwatch::workflow::DuplicateIncidentException(          \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_EXCEPTION_HPP
