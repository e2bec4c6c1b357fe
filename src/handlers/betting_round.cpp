#include "betting_round.hpp"
#include "award_pot_handler.hpp"
#include "deal_community_handler.hpp"

namespace holdem {
namespace handlers {

int next_able_seat(const Table& table, int from) {
    const int n = table.seat_count();
    if (n == 0) {
        return -1;
    }
    for (int step = 1; step <= n; ++step) {
        int index = ((from + step) % n + n) % n;
        if (table.seats[static_cast<size_t>(index)].can_act()) {
            return index;
        }
    }
    return -1;
}

bool is_betting_round_complete(const Table& table) {
    for (int i = 0; i < table.seat_count(); ++i) {
        const Seat& seat = table.seats[static_cast<size_t>(i)];
        if (!seat.can_act()) {
            continue;
        }
        if (table.players_acted_this_round.count(i) == 0) {
            return false;
        }
        if (seat.bet < table.current_bet) {
            return false;
        }
    }
    return true;
}

void commit_chips(Table& table, int seat_index, int64_t amount) {
    Seat& seat = table.seats[static_cast<size_t>(seat_index)];
    seat.chips -= amount;
    seat.bet += amount;
    seat.total_bet_this_hand += amount;
    table.pot += amount;
    if (seat.chips == 0) {
        seat.all_in = true;
    }
}

void reopen_betting(Table& table, int seat_index) {
    const Seat& seat = table.seats[static_cast<size_t>(seat_index)];
    table.current_bet = seat.bet;
    table.last_raiser_index = seat_index;
    table.players_acted_this_round = {seat_index};
}

void settle_after_action(Table& table) {
    if (table.players_in_hand() == 1) {
        award_uncontested(table);
        return;
    }
    if (is_betting_round_complete(table)) {
        advance_phase(table);
        return;
    }
    table.current_player_index = next_able_seat(table, table.current_player_index);
}

} // namespace handlers
} // namespace holdem
