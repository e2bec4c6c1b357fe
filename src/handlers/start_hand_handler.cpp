#include "start_hand_handler.hpp"
#include "betting_round.hpp"
#include "deal_community_handler.hpp"
#include "holdem/errors.hpp"
#include <algorithm>

namespace holdem {
namespace handlers {

namespace {

constexpr int kHoleCards = 2;

bool keeps_seat(const Seat& seat) {
    return !seat.sitting_out && seat.chips > 0;
}

/// Drop seats that cannot play; the button stays with its player, or passes to the next kept seat.
void prune_seats(Table& table) {
    const int before = table.seat_count();
    const int old_dealer = before > 0 ? table.dealer_index % before : 0;

    int kept_before_dealer = 0;
    for (int i = 0; i < old_dealer; ++i) {
        if (keeps_seat(table.seats[static_cast<size_t>(i)])) {
            ++kept_before_dealer;
        }
    }

    table.seats.erase(std::remove_if(table.seats.begin(), table.seats.end(),
        [](const Seat& s) { return !keeps_seat(s); }), table.seats.end());
    table.dealer_index = kept_before_dealer % table.seat_count();
}

void post_blind(Table& table, int seat_index, int64_t amount, const std::string& label) {
    Seat& seat = table.seats[static_cast<size_t>(seat_index)];
    int64_t actual = std::min(amount, seat.chips);
    commit_chips(table, seat_index, actual);
    seat.last_action = label + " $" + std::to_string(actual) + (seat.all_in ? " (All-In)" : "");
}

} // anonymous namespace

void handle_start_hand(Table& table, RandomSource& rng) {
    // Guard
    if (table.hand_in_progress()) {
        throw CommandRejectedError::lifecycle("A hand is already in progress.");
    }

    // Validate
    auto playable = std::count_if(table.seats.begin(), table.seats.end(), keeps_seat);
    if (playable < kMinPlayers) {
        throw CommandRejectedError::lifecycle("Need at least 2 players with chips to start.");
    }

    // Compute
    prune_seats(table);

    table.hand_number++;
    table.phase = Phase::Preflop;
    table.deck = shuffle_deck(create_deck(), rng);
    table.community_cards.clear();
    table.pot = 0;
    table.side_pots.clear();
    table.current_bet = 0;
    table.min_raise = table.config.big_blind;
    table.last_result.reset();
    table.last_raiser_index = -1;
    table.players_acted_this_round.clear();

    for (auto& seat : table.seats) {
        seat.hole_cards.clear();
        seat.bet = 0;
        seat.total_bet_this_hand = 0;
        seat.folded = false;
        seat.all_in = false;
        seat.last_action.clear();
    }

    const int n = table.seat_count();
    int sb_index;
    int bb_index;
    if (n == 2) {
        sb_index = table.dealer_index;
        bb_index = (table.dealer_index + 1) % n;
    } else {
        sb_index = (table.dealer_index + 1) % n;
        bb_index = (table.dealer_index + 2) % n;
    }

    post_blind(table, sb_index, table.config.small_blind, "Small Blind");
    post_blind(table, bb_index, table.config.big_blind, "Big Blind");
    table.current_bet = table.config.big_blind;
    table.min_raise = table.config.big_blind;
    table.last_raiser_index = bb_index;

    for (int round = 0; round < kHoleCards; ++round) {
        for (auto& seat : table.seats) {
            seat.hole_cards.push_back(draw_card(table.deck));
        }
    }

    int first = n == 2 ? sb_index : (bb_index + 1) % n;
    if (!table.seats[static_cast<size_t>(first)].can_act()) {
        first = next_able_seat(table, first);
    }
    table.current_player_index = first;

    // Blinds can leave nobody with a decision to make.
    const Seat* actor = table.current_seat();
    bool no_decision = actor == nullptr ||
        (table.players_able_to_act() == 1 && actor->bet >= table.current_bet);
    if (no_decision) {
        run_out_board(table);
    }
}

} // namespace handlers
} // namespace holdem
