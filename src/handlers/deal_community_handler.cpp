#include "deal_community_handler.hpp"
#include "award_pot_handler.hpp"
#include "betting_round.hpp"

namespace holdem {
namespace handlers {

namespace {

constexpr size_t kFlopSize = 3;
constexpr size_t kBoardSize = 5;

void reset_round(Table& table) {
    for (auto& seat : table.seats) {
        seat.bet = 0;
    }
    table.current_bet = 0;
    table.min_raise = table.config.big_blind;
    table.players_acted_this_round.clear();
    table.last_raiser_index = -1;
}

void deal_street(Table& table, size_t count) {
    burn_card(table.deck);
    for (size_t i = 0; i < count; ++i) {
        table.community_cards.push_back(draw_card(table.deck));
    }
}

} // anonymous namespace

void advance_phase(Table& table) {
    reset_round(table);

    switch (table.phase) {
        case Phase::Preflop:
            table.phase = Phase::Flop;
            deal_street(table, kFlopSize);
            break;
        case Phase::Flop:
            table.phase = Phase::Turn;
            deal_street(table, 1);
            break;
        case Phase::Turn:
            table.phase = Phase::River;
            deal_street(table, 1);
            break;
        case Phase::River:
            resolve_showdown(table);
            return;
        default:
            return;
    }

    if (table.players_able_to_act() <= 1) {
        run_out_board(table);
        return;
    }
    table.current_player_index = next_able_seat(table, table.dealer_index);
}

void run_out_board(Table& table) {
    reset_round(table);
    table.current_player_index = -1;
    while (table.community_cards.size() < kBoardSize) {
        if (table.community_cards.empty()) {
            table.phase = Phase::Flop;
            deal_street(table, kFlopSize);
        } else if (table.community_cards.size() == kFlopSize) {
            table.phase = Phase::Turn;
            deal_street(table, 1);
        } else {
            table.phase = Phase::River;
            deal_street(table, 1);
        }
    }
    resolve_showdown(table);
}

} // namespace handlers
} // namespace holdem
