#pragma once

#include <string>
#include "holdem/table_state.hpp"

namespace holdem {
namespace handlers {

/// Remove a player. Mid-hand the seat is folded and sat out so seat indices hold.
void handle_leave(Table& table, const std::string& player_id);

} // namespace handlers
} // namespace holdem
