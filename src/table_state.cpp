#include "holdem/table_state.hpp"
#include <algorithm>

namespace holdem {

std::string to_string(Phase phase) {
    switch (phase) {
        case Phase::Waiting: return "waiting";
        case Phase::Preflop: return "preflop";
        case Phase::Flop: return "flop";
        case Phase::Turn: return "turn";
        case Phase::River: return "river";
        case Phase::Showdown: return "showdown";
        case Phase::Finished: return "finished";
    }
    return "unknown";
}

std::string to_string(ActionType action) {
    switch (action) {
        case ActionType::Fold: return "fold";
        case ActionType::Check: return "check";
        case ActionType::Call: return "call";
        case ActionType::Bet: return "bet";
        case ActionType::Raise: return "raise";
        case ActionType::AllIn: return "allin";
    }
    return "unknown";
}

std::string to_string(TableMode mode) {
    return mode == TableMode::Staked ? "staked" : "casual";
}

std::optional<ActionType> parse_action(const std::string& tag) {
    if (tag == "fold") return ActionType::Fold;
    if (tag == "check") return ActionType::Check;
    if (tag == "call") return ActionType::Call;
    if (tag == "bet") return ActionType::Bet;
    if (tag == "raise") return ActionType::Raise;
    if (tag == "allin" || tag == "all-in") return ActionType::AllIn;
    return std::nullopt;
}

int64_t HandOutcome::total_awarded() const {
    int64_t total = 0;
    for (const auto& winner : winners) {
        total += winner.amount;
    }
    return total;
}

int Table::find_seat(const std::string& player_id) const {
    for (size_t i = 0; i < seats.size(); ++i) {
        if (seats[i].player_id == player_id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const Seat* Table::current_seat() const {
    if (current_player_index < 0 || current_player_index >= seat_count()) {
        return nullptr;
    }
    return &seats[static_cast<size_t>(current_player_index)];
}

int Table::players_in_hand() const {
    return static_cast<int>(std::count_if(seats.begin(), seats.end(),
        [](const Seat& s) { return !s.folded; }));
}

int Table::players_able_to_act() const {
    return static_cast<int>(std::count_if(seats.begin(), seats.end(),
        [](const Seat& s) { return s.can_act(); }));
}

int Table::funded_seat_count() const {
    return static_cast<int>(std::count_if(seats.begin(), seats.end(),
        [](const Seat& s) { return s.chips > 0; }));
}

int64_t Table::total_chips() const {
    int64_t total = pot;
    for (const auto& seat : seats) {
        total += seat.chips;
    }
    return total;
}

} // namespace holdem
