#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/support/status_code_enum.h>

namespace holdem {

/// Rule-violation taxonomy reported to callers.
enum class RejectionKind {
    TurnViolation,
    IllegalSizing,
    Lifecycle,
    NotFound,
    InvalidArgument
};

std::string to_string(RejectionKind kind);

/// Exception thrown by a handler when a command breaks the rules of the table.
/// Handlers throw before touching state, so a rejected command leaves the table unchanged.
class CommandRejectedError : public std::runtime_error {
public:
    RejectionKind kind;
    grpc::StatusCode status_code;

    CommandRejectedError(const std::string& message, RejectionKind kind,
                         grpc::StatusCode code = grpc::StatusCode::FAILED_PRECONDITION)
        : std::runtime_error(message), kind(kind), status_code(code) {}

    /// Acting out of turn, or when no betting round is open.
    static CommandRejectedError turn_violation(const std::string& message) {
        return CommandRejectedError(message, RejectionKind::TurnViolation,
                                    grpc::StatusCode::FAILED_PRECONDITION);
    }

    /// Bet or raise below the minimum, checking into a bet, calling nothing.
    static CommandRejectedError illegal_sizing(const std::string& message) {
        return CommandRejectedError(message, RejectionKind::IllegalSizing,
                                    grpc::StatusCode::INVALID_ARGUMENT);
    }

    /// Seating and hand start violations.
    static CommandRejectedError lifecycle(const std::string& message) {
        return CommandRejectedError(message, RejectionKind::Lifecycle,
                                    grpc::StatusCode::FAILED_PRECONDITION);
    }

    static CommandRejectedError already_exists(const std::string& message) {
        return CommandRejectedError(message, RejectionKind::Lifecycle,
                                    grpc::StatusCode::ALREADY_EXISTS);
    }

    static CommandRejectedError resource_exhausted(const std::string& message) {
        return CommandRejectedError(message, RejectionKind::Lifecycle,
                                    grpc::StatusCode::RESOURCE_EXHAUSTED);
    }

    static CommandRejectedError not_found(const std::string& message) {
        return CommandRejectedError(message, RejectionKind::NotFound,
                                    grpc::StatusCode::NOT_FOUND);
    }

    static CommandRejectedError invalid_argument(const std::string& message) {
        return CommandRejectedError(message, RejectionKind::InvalidArgument,
                                    grpc::StatusCode::INVALID_ARGUMENT);
    }
};

/// Value form of a rejection, returned by the public engine API.
struct Rejection {
    RejectionKind kind = RejectionKind::InvalidArgument;
    grpc::StatusCode status_code = grpc::StatusCode::UNKNOWN;
    std::string message;

    static Rejection from(const CommandRejectedError& error) {
        return Rejection{error.kind, error.status_code, error.what()};
    }
};

} // namespace holdem
