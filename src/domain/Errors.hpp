/**
 * @file Errors.hpp
 * @brief Exception taxonomy surfaced by the record store and its callers.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace jobledger::domain {

enum class ErrorKind {
    NotFound,
    AlreadyExists,
    InUse,
    Corrupt,
    IOFailure,
    SecurityViolation,
    AmbiguousSelection,
    DestinationUnresolved
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::InUse: return "InUse";
        case ErrorKind::Corrupt: return "Corrupt";
        case ErrorKind::IOFailure: return "IOFailure";
        case ErrorKind::SecurityViolation: return "SecurityViolation";
        case ErrorKind::AmbiguousSelection: return "AmbiguousSelection";
        case ErrorKind::DestinationUnresolved: return "DestinationUnresolved";
        default: return "Unknown";
    }
}

/**
 * @class JobStoreError
 * @brief Base of every store-level failure. Messages are meant for the user.
 */
class JobStoreError : public std::runtime_error {
public:
    JobStoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

class NotFoundError : public JobStoreError {
public:
    explicit NotFoundError(const std::string& jobId)
        : JobStoreError(ErrorKind::NotFound,
            "Job " + jobId + " cannot be found. Check the job number and try again.") {}
};

class ProjectNotFoundError : public JobStoreError {
public:
    ProjectNotFoundError(const std::string& jobId, const std::string& key)
        : JobStoreError(ErrorKind::NotFound, "Project '" + key + "' does not exist in job " + jobId + ".") {}
};

class AlreadyExistsError : public JobStoreError {
public:
    explicit AlreadyExistsError(const std::string& jobId)
        : JobStoreError(ErrorKind::AlreadyExists,
            "Job " + jobId + " already exists. Try opening the existing job.") {}
};

/** @brief The lock is held by someone else; owner() names them. */
class InUseError : public JobStoreError {
public:
    InUseError(const std::string& jobId, std::string owner)
        : JobStoreError(ErrorKind::InUse,
            "Job " + jobId + " is locked by user '" + owner + "'."),
          m_owner(std::move(owner)) {}

    const std::string& owner() const { return m_owner; }

private:
    std::string m_owner;
};

class CorruptRecordError : public JobStoreError {
public:
    CorruptRecordError(const std::string& jobId, const std::string& detail)
        : JobStoreError(ErrorKind::Corrupt, "Record for job " + jobId + " is unreadable: " + detail) {}
};

class StorageIOError : public JobStoreError {
public:
    explicit StorageIOError(const std::string& detail)
        : JobStoreError(ErrorKind::IOFailure, "Job storage is unavailable: " + detail) {}
};

class SecurityViolationError : public JobStoreError {
public:
    explicit SecurityViolationError(const std::string& jobId)
        : JobStoreError(ErrorKind::SecurityViolation,
            "The rights to job " + jobId + " belong to another user.") {}
};

class AmbiguousSelectionError : public JobStoreError {
public:
    AmbiguousSelectionError()
        : JobStoreError(ErrorKind::AmbiguousSelection, "Only one job may be modified at a time.") {}
};

class DestinationUnresolvedError : public JobStoreError {
public:
    DestinationUnresolvedError(const std::string& jobId, const std::string& detail)
        : JobStoreError(ErrorKind::DestinationUnresolved,
            "Cannot determine the issued documents folder for job " + jobId + ": " + detail) {}
};

} // namespace jobledger::domain
