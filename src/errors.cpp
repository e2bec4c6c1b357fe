#include "holdem/errors.hpp"

namespace holdem {

std::string to_string(RejectionKind kind) {
    switch (kind) {
        case RejectionKind::TurnViolation: return "turn_violation";
        case RejectionKind::IllegalSizing: return "illegal_sizing";
        case RejectionKind::Lifecycle: return "lifecycle";
        case RejectionKind::NotFound: return "not_found";
        case RejectionKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

} // namespace holdem
