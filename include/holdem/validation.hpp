#pragma once

#include <string>
#include <vector>
#include "errors.hpp"

namespace holdem {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw CommandRejectedError::invalid_argument(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw CommandRejectedError::invalid_argument(field_name + " must be non-negative");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw CommandRejectedError::invalid_argument(field_name + " must not be empty");
    }
}

/**
 * Require that an index addresses an element of a collection of `size` elements.
 * When `allow_none` is set, -1 is accepted as "no element".
 */
inline void require_index(int index, std::size_t size, const std::string& field_name,
                          bool allow_none = false) {
    if (allow_none && index == -1) {
        return;
    }
    if (index < 0 || static_cast<std::size_t>(index) >= size) {
        throw CommandRejectedError::invalid_argument(field_name + " is out of range");
    }
}

/**
 * Require that a status matches one of the accepted values.
 */
template<typename T>
void require_status_in(T actual, const std::vector<T>& accepted, const CommandRejectedError& error) {
    for (const auto& value : accepted) {
        if (actual == value) {
            return;
        }
    }
    throw error;
}

} // namespace validation
} // namespace holdem
