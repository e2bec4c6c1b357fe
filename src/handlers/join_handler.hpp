#pragma once

#include <string>
#include "holdem/table_state.hpp"

namespace holdem {
namespace handlers {

/// Seat a new player with the starting bank. Returns the new seat.
const Seat& handle_join(Table& table, const std::string& player_id,
                        const std::string& display_name);

} // namespace handlers
} // namespace holdem
