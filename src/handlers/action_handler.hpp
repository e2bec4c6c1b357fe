#pragma once

#include <cstdint>
#include <string>
#include "holdem/table_state.hpp"

namespace holdem {
namespace handlers {

/// Validate and apply the current player's action, then move the hand on.
void handle_action(Table& table, const std::string& player_id,
                   ActionType action, int64_t amount);

} // namespace handlers
} // namespace holdem
