#include "join_handler.hpp"
#include "holdem/errors.hpp"
#include "holdem/validation.hpp"
#include <utility>

namespace holdem {
namespace handlers {

const Seat& handle_join(Table& table, const std::string& player_id,
                        const std::string& display_name) {
    // Guard
    if (table.hand_in_progress()) {
        throw CommandRejectedError::lifecycle("Cannot join mid-hand. Wait for the next hand.");
    }

    // Validate
    validation::require_not_empty(player_id, "player_id");
    if (table.is_full()) {
        throw CommandRejectedError::lifecycle("Table is full.");
    }
    if (table.find_seat(player_id) >= 0) {
        throw CommandRejectedError::lifecycle("You are already at this table.");
    }

    // Compute
    Seat seat;
    seat.player_id = player_id;
    seat.display_name = display_name.empty() ? player_id : display_name;
    seat.chips = table.config.starting_bank;
    table.seats.push_back(std::move(seat));
    return table.seats.back();
}

} // namespace handlers
} // namespace holdem
