#include "action_handler.hpp"
#include "betting_round.hpp"
#include "holdem/errors.hpp"
#include "holdem/validation.hpp"
#include <algorithm>

namespace holdem {
namespace handlers {

namespace {

std::string dollars(int64_t amount) {
    return "$" + std::to_string(amount);
}

/// Push the seat's whole stack. Betting reopens only when the seat's total tops the current bet.
void go_all_in(Table& table, int seat_index) {
    Seat& seat = table.seats[static_cast<size_t>(seat_index)];
    int64_t pushed = seat.chips;
    commit_chips(table, seat_index, pushed);
    if (seat.bet > table.current_bet) {
        table.min_raise = std::max(table.min_raise, seat.bet - table.current_bet);
        reopen_betting(table, seat_index);
    }
    seat.last_action = "All-In " + dollars(pushed);
}

} // anonymous namespace

void handle_action(Table& table, const std::string& player_id,
                   ActionType action, int64_t amount) {
    // Guard
    int index = table.find_seat(player_id);
    if (index < 0) {
        throw CommandRejectedError::not_found("You are not at this table.");
    }
    validation::require_status_in(table.phase,
        {Phase::Preflop, Phase::Flop, Phase::Turn, Phase::River},
        CommandRejectedError::turn_violation("No active betting round."));
    if (table.current_player_index != index) {
        throw CommandRejectedError::turn_violation("It is not your turn.");
    }
    Seat& seat = table.seats[static_cast<size_t>(index)];
    if (!seat.can_act()) {
        throw CommandRejectedError::turn_violation("You cannot act.");
    }

    const int64_t to_call = table.current_bet - seat.bet;

    // Validate, then compute
    switch (action) {
        case ActionType::Fold: {
            seat.folded = true;
            seat.last_action = "Fold";
            break;
        }
        case ActionType::Check: {
            if (to_call > 0) {
                throw CommandRejectedError::illegal_sizing("You must call, raise, or fold.");
            }
            seat.last_action = "Check";
            break;
        }
        case ActionType::Call: {
            if (to_call <= 0) {
                throw CommandRejectedError::illegal_sizing("Nothing to call. Check instead.");
            }
            int64_t paid = std::min(to_call, seat.chips);
            commit_chips(table, index, paid);
            seat.last_action = seat.all_in ? "All-In (Call)" : "Call " + dollars(paid);
            break;
        }
        case ActionType::Bet: {
            if (table.current_bet > 0) {
                throw CommandRejectedError::illegal_sizing("There is already a bet. Use raise.");
            }
            const int64_t min_bet = std::min(table.config.big_blind, seat.chips);
            const int64_t size = amount > 0 ? amount : min_bet;
            if (size < min_bet) {
                throw CommandRejectedError::illegal_sizing("Bet must be at least " + dollars(min_bet) + ".");
            }
            if (size > seat.chips) {
                throw CommandRejectedError::illegal_sizing(
                    "Not enough chips. You have " + dollars(seat.chips) + ".");
            }
            commit_chips(table, index, size);
            table.min_raise = std::max(size, table.config.big_blind);
            reopen_betting(table, index);
            seat.last_action = (seat.all_in ? "All-In " : "Bet ") + dollars(size);
            break;
        }
        case ActionType::Raise: {
            if (table.current_bet == 0) {
                throw CommandRejectedError::illegal_sizing("No bet to raise. Use bet.");
            }
            const int64_t min_total = table.current_bet + table.min_raise;
            const int64_t max_total = seat.bet + seat.chips;
            const int64_t target = amount > 0 ? amount : min_total;
            if (max_total < min_total || target >= max_total) {
                go_all_in(table, index);
                break;
            }
            if (target < min_total) {
                throw CommandRejectedError::illegal_sizing("Raise must be to at least " + dollars(min_total) + ".");
            }
            commit_chips(table, index, target - seat.bet);
            table.min_raise = target - table.current_bet;
            reopen_betting(table, index);
            seat.last_action = "Raise to " + dollars(target);
            break;
        }
        case ActionType::AllIn: {
            if (seat.chips <= 0) {
                throw CommandRejectedError::illegal_sizing("You have no chips.");
            }
            go_all_in(table, index);
            break;
        }
    }

    table.players_acted_this_round.insert(index);
    settle_after_action(table);
}

} // namespace handlers
} // namespace holdem
