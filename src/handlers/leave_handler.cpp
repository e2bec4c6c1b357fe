#include "leave_handler.hpp"
#include "betting_round.hpp"
#include "deal_community_handler.hpp"
#include "award_pot_handler.hpp"
#include "holdem/errors.hpp"
#include <algorithm>

namespace holdem {
namespace handlers {

namespace {

/// Drop `removed` from a list of seat indices and shift the seats after it down by one.
void forget_seat(std::vector<int>& indices, int removed) {
    indices.erase(std::remove(indices.begin(), indices.end(), removed), indices.end());
    for (int& index : indices) {
        if (index > removed) {
            --index;
        }
    }
}

/// Keep every stored seat index pointing at the same player after a seat is erased.
void erase_seat(Table& table, int index) {
    table.seats.erase(table.seats.begin() + index);
    if (index < table.dealer_index) {
        --table.dealer_index;
    }
    if (table.dealer_index >= table.seat_count()) {
        table.dealer_index = 0;
    }
    table.current_player_index = -1;
    table.last_raiser_index = -1;
    table.players_acted_this_round.clear();

    for (auto& pot : table.side_pots) {
        forget_seat(pot.eligible_seats, index);
    }
    if (table.last_result) {
        for (auto& pot : table.last_result->pots) {
            forget_seat(pot.eligible_seats, index);
        }
    }
}

} // anonymous namespace

void handle_leave(Table& table, const std::string& player_id) {
    // Validate
    int index = table.find_seat(player_id);
    if (index < 0) {
        throw CommandRejectedError::not_found("Not at this table.");
    }

    // Compute
    if (!table.hand_in_progress()) {
        erase_seat(table, index);
        return;
    }

    Seat& seat = table.seats[static_cast<size_t>(index)];
    seat.folded = true;
    seat.sitting_out = true;
    seat.last_action = "Left";

    if (table.players_in_hand() == 1) {
        award_uncontested(table);
        return;
    }
    if (table.current_player_index != index) {
        return;
    }
    if (is_betting_round_complete(table)) {
        advance_phase(table);
    } else {
        table.current_player_index = next_able_seat(table, index);
    }
}

} // namespace handlers
} // namespace holdem
