#include "award_pot_handler.hpp"
#include "holdem/hand_evaluator.hpp"
#include <algorithm>
#include <optional>
#include <set>

namespace holdem {
namespace handlers {

namespace {

void close_hand(Table& table) {
    table.pot = 0;
    table.current_player_index = -1;
    table.last_raiser_index = -1;
    table.players_acted_this_round.clear();
    table.phase = Phase::Finished;
    if (table.seat_count() > 0) {
        table.dealer_index = (table.dealer_index + 1) % table.seat_count();
    }
}

/// Winners of one pot ordered so the odd chip goes to the first entry.
std::vector<int> order_for_odd_chip(const Table& table, std::vector<int> winners) {
    if (table.config.odd_chip_policy == OddChipPolicy::LeftOfDealer) {
        const int n = table.seat_count();
        auto distance = [&](int seat) { return (seat - table.dealer_index - 1 + n) % n; };
        std::sort(winners.begin(), winners.end(),
            [&](int a, int b) { return distance(a) < distance(b); });
    }
    return winners;
}

void credit(std::vector<Winner>& winners, const Seat& seat, int64_t amount, const std::string& hand) {
    for (auto& winner : winners) {
        if (winner.player_id == seat.player_id) {
            winner.amount += amount;
            return;
        }
    }
    winners.push_back(Winner{seat.player_id, seat.display_name, amount, hand, seat.hole_cards});
}

} // anonymous namespace

std::vector<SidePot> compute_side_pots(const Table& table) {
    std::set<int64_t> tiers;
    for (const auto& seat : table.seats) {
        if (seat.total_bet_this_hand > 0) {
            tiers.insert(seat.total_bet_this_hand);
        }
    }

    std::vector<SidePot> pots;
    int64_t processed = 0;
    int64_t carry = 0;

    for (int64_t tier : tiers) {
        SidePot pot;
        for (int i = 0; i < table.seat_count(); ++i) {
            const Seat& seat = table.seats[static_cast<size_t>(i)];
            int64_t contribution = std::min(seat.total_bet_this_hand, tier) - processed;
            if (contribution > 0) {
                pot.amount += contribution;
            }
            if (!seat.folded && seat.total_bet_this_hand >= tier) {
                pot.eligible_seats.push_back(i);
            }
        }
        processed = tier;

        if (pot.eligible_seats.empty()) {
            if (pots.empty()) {
                carry += pot.amount;
            } else {
                pots.back().amount += pot.amount;
            }
        } else if (!pots.empty() && pots.back().eligible_seats == pot.eligible_seats) {
            pots.back().amount += pot.amount;
        } else {
            pot.amount += carry;
            carry = 0;
            pots.push_back(std::move(pot));
        }
    }
    return pots;
}

void resolve_showdown(Table& table) {
    table.phase = Phase::Showdown;
    table.current_player_index = -1;

    std::vector<std::optional<HandResult>> hands(table.seats.size());
    HandOutcome outcome;
    for (size_t i = 0; i < table.seats.size(); ++i) {
        const Seat& seat = table.seats[i];
        if (seat.folded) {
            continue;
        }
        std::vector<Card> cards = seat.hole_cards;
        cards.insert(cards.end(), table.community_cards.begin(), table.community_cards.end());
        hands[i] = evaluate_hand(cards);
        outcome.showdown.push_back(ShowdownEntry{seat.player_id, seat.display_name, *hands[i], seat.hole_cards});
    }

    outcome.pots = compute_side_pots(table);
    for (auto& pot : outcome.pots) {
        std::vector<int> pot_winners;
        const HandResult* best = nullptr;
        for (int index : pot.eligible_seats) {
            const HandResult& hand = *hands[static_cast<size_t>(index)];
            int cmp = best ? compare_hands(hand, *best) : 1;
            if (cmp > 0) {
                best = &hand;
                pot_winners = {index};
            } else if (cmp == 0) {
                pot_winners.push_back(index);
            }
        }

        const auto count = static_cast<int64_t>(pot_winners.size());
        const int64_t share = pot.amount / count;
        const int64_t remainder = pot.amount - share * count;
        auto paid_order = order_for_odd_chip(table, pot_winners);
        for (int index : pot_winners) {
            Seat& seat = table.seats[static_cast<size_t>(index)];
            int64_t amount = share + (index == paid_order.front() ? remainder : 0);
            seat.chips += amount;
            pot.winners.push_back(seat.player_id);
            credit(outcome.winners, seat, amount, hands[static_cast<size_t>(index)]->name());
        }
    }

    table.side_pots = outcome.pots;
    table.last_result = std::move(outcome);
    close_hand(table);
}

void award_uncontested(Table& table) {
    auto it = std::find_if(table.seats.begin(), table.seats.end(),
        [](const Seat& s) { return !s.folded; });
    int index = static_cast<int>(it - table.seats.begin());
    Seat& seat = *it;

    int64_t amount = table.pot;
    seat.chips += amount;

    HandOutcome outcome;
    outcome.uncontested = true;
    outcome.winners.push_back(Winner{seat.player_id, seat.display_name, amount, "Everyone folded", seat.hole_cards});
    outcome.pots.push_back(SidePot{amount, {index}, {seat.player_id}});

    table.side_pots = outcome.pots;
    table.last_result = std::move(outcome);
    close_hand(table);
}

} // namespace handlers
} // namespace holdem
