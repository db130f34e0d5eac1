#pragma once

#include <string>
#include <utility>

namespace corral {
namespace common {

/**
 * @brief Status codes returned by registry, store and domain operations
 *
 * - OK                  -> success
 * - INVALID_ARGUMENT    -> malformed input (empty names)
 * - NOT_FOUND           -> cluster (by name or id) or host does not exist
 * - ALREADY_EXISTS      -> duplicate cluster, host or cluster-host mapping
 * - INCOMPATIBLE        -> host OS not supported by the cluster's desired stack
 * - FAILED_PRECONDITION -> cluster cannot be removed yet
 * - PERSISTENCE_FAILURE -> backing store rejected a write or read
 * - INTERNAL            -> I/O or serialization failure inside a store
 */
enum class StatusCode {
    OK,
    INVALID_ARGUMENT,
    NOT_FOUND,
    ALREADY_EXISTS,
    INCOMPATIBLE,
    FAILED_PRECONDITION,
    PERSISTENCE_FAILURE,
    INTERNAL
};

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::ALREADY_EXISTS:
            return "ALREADY_EXISTS";
        case StatusCode::INCOMPATIBLE:
            return "INCOMPATIBLE";
        case StatusCode::FAILED_PRECONDITION:
            return "FAILED_PRECONDITION";
        case StatusCode::PERSISTENCE_FAILURE:
            return "PERSISTENCE_FAILURE";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

// Result of an operation: a code plus a message naming the offending entity
struct Status {
    StatusCode code = StatusCode::OK;
    std::string message;

    Status() = default;
    Status(StatusCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool ok() const { return code == StatusCode::OK; }

    std::string to_string() const {
        if (message.empty()) {
            return status_code_to_string(code);
        }
        return status_code_to_string(code) + ": " + message;
    }

    static Status Ok() { return Status(); }
    static Status InvalidArgument(const std::string &msg) { return {StatusCode::INVALID_ARGUMENT, msg}; }
    static Status NotFound(const std::string &msg) { return {StatusCode::NOT_FOUND, msg}; }
    static Status AlreadyExists(const std::string &msg) { return {StatusCode::ALREADY_EXISTS, msg}; }
    static Status Incompatible(const std::string &msg) { return {StatusCode::INCOMPATIBLE, msg}; }
    static Status FailedPrecondition(const std::string &msg) { return {StatusCode::FAILED_PRECONDITION, msg}; }
    static Status PersistenceFailure(const std::string &msg) { return {StatusCode::PERSISTENCE_FAILURE, msg}; }
    static Status Internal(const std::string &msg) { return {StatusCode::INTERNAL, msg}; }
};

}  // namespace common
}  // namespace corral
