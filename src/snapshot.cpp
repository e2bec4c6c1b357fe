#include "holdem/snapshot.hpp"
#include "holdem/errors.hpp"
#include "holdem/validation.hpp"
#include <set>
#include <utility>

namespace holdem {
namespace snapshot {

namespace {

template<typename Repeated>
std::vector<Card> cards_from(const Repeated& cards) {
    std::vector<Card> out;
    out.reserve(static_cast<size_t>(cards.size()));
    for (const auto& card : cards) {
        out.push_back(from_proto(card));
    }
    return out;
}

template<typename Repeated>
void cards_into(const std::vector<Card>& cards, Repeated* out) {
    for (const auto& card : cards) {
        *out->Add() = to_proto(card);
    }
}

v1::PotSnapshot pot_to_proto(const SidePot& pot) {
    v1::PotSnapshot out;
    out.set_amount(pot.amount);
    for (int seat : pot.eligible_seats) {
        out.add_eligible_seats(seat);
    }
    for (const auto& winner : pot.winners) {
        out.add_winners(winner);
    }
    return out;
}

SidePot pot_from_proto(const v1::PotSnapshot& pot, size_t seat_count) {
    validation::require_non_negative(pot.amount(), "pot amount");
    SidePot out;
    out.amount = pot.amount();
    for (int seat : pot.eligible_seats()) {
        validation::require_index(seat, seat_count, "eligible seat");
        out.eligible_seats.push_back(seat);
    }
    out.winners.assign(pot.winners().begin(), pot.winners().end());
    return out;
}

HandRank rank_from_proto(v1::HandRank rank) {
    if (rank == v1::INCOMPLETE) {
        return HandRank::Incomplete;
    }
    int value = static_cast<int>(rank);
    if (value < static_cast<int>(HandRank::HighCard) || value > static_cast<int>(HandRank::RoyalFlush)) {
        throw CommandRejectedError::invalid_argument("hand rank is out of range");
    }
    return static_cast<HandRank>(value);
}

HandResult hand_from_proto(const v1::HandResultSnapshot& hand) {
    HandResult out;
    out.rank = rank_from_proto(hand.rank());
    out.kickers.assign(hand.kickers().begin(), hand.kickers().end());
    out.cards = cards_from(hand.cards());
    return out;
}

HandOutcome outcome_from_proto(const v1::HandOutcomeSnapshot& outcome, size_t seat_count) {
    HandOutcome out;
    for (const auto& winner : outcome.winners()) {
        validation::require_non_negative(winner.amount(), "winner amount");
        out.winners.push_back(Winner{winner.player_id(), winner.display_name(),
                                     winner.amount(), winner.hand(),
                                     cards_from(winner.cards())});
    }
    for (const auto& entry : outcome.showdown()) {
        out.showdown.push_back(ShowdownEntry{entry.player_id(), entry.display_name(),
                                             hand_from_proto(entry.hand()),
                                             cards_from(entry.hole_cards())});
    }
    for (const auto& pot : outcome.pots()) {
        out.pots.push_back(pot_from_proto(pot, seat_count));
    }
    out.uncontested = outcome.uncontested();
    return out;
}

Seat seat_from_proto(const v1::SeatSnapshot& seat) {
    validation::require_not_empty(seat.player_id(), "player_id");
    validation::require_non_negative(seat.chips(), "chips");
    validation::require_non_negative(seat.bet(), "bet");
    validation::require_non_negative(seat.total_bet_this_hand(), "total_bet_this_hand");

    Seat out;
    out.player_id = seat.player_id();
    out.display_name = seat.display_name();
    out.chips = seat.chips();
    out.hole_cards = cards_from(seat.hole_cards());
    out.bet = seat.bet();
    out.total_bet_this_hand = seat.total_bet_this_hand();
    out.folded = seat.folded();
    out.all_in = seat.all_in();
    out.last_action = seat.last_action();
    out.sitting_out = seat.sitting_out();
    return out;
}

/// Every live card (deck, board, hole cards) must be distinct.
void require_unique_cards(const Table& table) {
    std::set<std::pair<int, int>> seen;
    auto claim = [&seen](const Card& card) {
        if (!seen.insert({static_cast<int>(card.suit), card.rank}).second) {
            throw CommandRejectedError::invalid_argument("duplicate card " + card_to_string(card));
        }
    };
    for (const auto& card : table.deck) claim(card);
    for (const auto& card : table.community_cards) claim(card);
    for (const auto& seat : table.seats) {
        for (const auto& card : seat.hole_cards) claim(card);
    }
}

} // anonymous namespace

v1::Card to_proto(const Card& card) {
    v1::Card out;
    switch (card.suit) {
        case Suit::Spades: out.set_suit(v1::SPADES); break;
        case Suit::Hearts: out.set_suit(v1::HEARTS); break;
        case Suit::Diamonds: out.set_suit(v1::DIAMONDS); break;
        case Suit::Clubs: out.set_suit(v1::CLUBS); break;
    }
    out.set_rank(card.rank);
    return out;
}

Card from_proto(const v1::Card& card) {
    Card out;
    switch (card.suit()) {
        case v1::SPADES: out.suit = Suit::Spades; break;
        case v1::HEARTS: out.suit = Suit::Hearts; break;
        case v1::DIAMONDS: out.suit = Suit::Diamonds; break;
        case v1::CLUBS: out.suit = Suit::Clubs; break;
        default:
            throw CommandRejectedError::invalid_argument("card suit is unspecified");
    }
    out.rank = card.rank();
    if (!is_valid_card(out)) {
        throw CommandRejectedError::invalid_argument(
            "card rank " + std::to_string(card.rank()) + " is out of range");
    }
    return out;
}

v1::Phase to_proto(Phase phase) {
    switch (phase) {
        case Phase::Waiting: return v1::WAITING;
        case Phase::Preflop: return v1::PREFLOP;
        case Phase::Flop: return v1::FLOP;
        case Phase::Turn: return v1::TURN;
        case Phase::River: return v1::RIVER;
        case Phase::Showdown: return v1::SHOWDOWN;
        case Phase::Finished: return v1::FINISHED;
    }
    return v1::PHASE_UNSPECIFIED;
}

Phase from_proto(v1::Phase phase) {
    switch (phase) {
        case v1::WAITING: return Phase::Waiting;
        case v1::PREFLOP: return Phase::Preflop;
        case v1::FLOP: return Phase::Flop;
        case v1::TURN: return Phase::Turn;
        case v1::RIVER: return Phase::River;
        case v1::SHOWDOWN: return Phase::Showdown;
        case v1::FINISHED: return Phase::Finished;
        default:
            throw CommandRejectedError::invalid_argument("phase is unspecified");
    }
}

v1::ActionType to_proto(ActionType action) {
    switch (action) {
        case ActionType::Fold: return v1::FOLD;
        case ActionType::Check: return v1::CHECK;
        case ActionType::Call: return v1::CALL;
        case ActionType::Bet: return v1::BET;
        case ActionType::Raise: return v1::RAISE;
        case ActionType::AllIn: return v1::ALL_IN;
    }
    return v1::ACTION_TYPE_UNSPECIFIED;
}

ActionType from_proto(v1::ActionType action) {
    switch (action) {
        case v1::FOLD: return ActionType::Fold;
        case v1::CHECK: return ActionType::Check;
        case v1::CALL: return ActionType::Call;
        case v1::BET: return ActionType::Bet;
        case v1::RAISE: return ActionType::Raise;
        case v1::ALL_IN: return ActionType::AllIn;
        default:
            throw CommandRejectedError::invalid_argument("action is unspecified");
    }
}

v1::TableSettings to_proto(const TableConfig& config) {
    v1::TableSettings out;
    out.set_table_id(config.table_id);
    out.set_host_id(config.host_id);
    out.set_mode(config.mode == TableMode::Staked ? v1::STAKED : v1::CASUAL);
    out.set_max_players(config.max_players);
    out.set_starting_bank(config.starting_bank);
    out.set_small_blind(config.small_blind);
    out.set_big_blind(config.big_blind);
    out.set_turn_timer_seconds(config.turn_timer_seconds);
    out.set_buy_in(config.buy_in);
    out.set_currency(config.currency);
    out.set_odd_chip_policy(config.odd_chip_policy == OddChipPolicy::LeftOfDealer
                                ? v1::LEFT_OF_DEALER : v1::FIRST_IN_SEAT_ORDER);
    return out;
}

// Zero and unspecified fields are left for create_table to default.
TableConfig from_proto(const v1::TableSettings& settings) {
    TableConfig out;
    out.table_id = settings.table_id();
    out.host_id = settings.host_id();
    out.mode = settings.mode() == v1::STAKED ? TableMode::Staked : TableMode::Casual;
    out.max_players = settings.max_players();
    out.starting_bank = settings.starting_bank();
    out.small_blind = settings.small_blind();
    out.big_blind = settings.big_blind();
    out.turn_timer_seconds = settings.turn_timer_seconds();
    out.buy_in = settings.buy_in();
    out.currency = settings.currency();
    out.odd_chip_policy = settings.odd_chip_policy() == v1::LEFT_OF_DEALER
        ? OddChipPolicy::LeftOfDealer : OddChipPolicy::FirstInSeatOrder;
    return out;
}

v1::SeatSnapshot to_proto(const Seat& seat) {
    v1::SeatSnapshot out;
    out.set_player_id(seat.player_id);
    out.set_display_name(seat.display_name);
    out.set_chips(seat.chips);
    cards_into(seat.hole_cards, out.mutable_hole_cards());
    out.set_bet(seat.bet);
    out.set_total_bet_this_hand(seat.total_bet_this_hand);
    out.set_folded(seat.folded);
    out.set_all_in(seat.all_in);
    out.set_last_action(seat.last_action);
    out.set_sitting_out(seat.sitting_out);
    return out;
}

v1::HandResultSnapshot to_proto(const HandResult& result) {
    v1::HandResultSnapshot out;
    out.set_rank(result.rank == HandRank::Incomplete
                     ? v1::INCOMPLETE : static_cast<v1::HandRank>(result.category()));
    for (int kicker : result.kickers) {
        out.add_kickers(kicker);
    }
    cards_into(result.cards, out.mutable_cards());
    out.set_name(result.name());
    return out;
}

v1::HandOutcomeSnapshot to_proto(const HandOutcome& outcome) {
    v1::HandOutcomeSnapshot out;
    for (const auto& winner : outcome.winners) {
        auto* w = out.add_winners();
        w->set_player_id(winner.player_id);
        w->set_display_name(winner.display_name);
        w->set_amount(winner.amount);
        w->set_hand(winner.hand);
        cards_into(winner.cards, w->mutable_cards());
    }
    for (const auto& entry : outcome.showdown) {
        auto* s = out.add_showdown();
        s->set_player_id(entry.player_id);
        s->set_display_name(entry.display_name);
        *s->mutable_hand() = to_proto(entry.hand);
        cards_into(entry.hole_cards, s->mutable_hole_cards());
    }
    for (const auto& pot : outcome.pots) {
        *out.add_pots() = pot_to_proto(pot);
    }
    out.set_uncontested(outcome.uncontested);
    return out;
}

v1::TableSnapshot to_proto(const Table& table, bool include_deck) {
    v1::TableSnapshot out;
    *out.mutable_settings() = to_proto(table.config);
    out.set_phase(to_proto(table.phase));
    for (const auto& seat : table.seats) {
        *out.add_seats() = to_proto(seat);
    }
    if (include_deck) {
        cards_into(table.deck, out.mutable_deck());
    }
    cards_into(table.community_cards, out.mutable_community_cards());
    out.set_pot(table.pot);
    for (const auto& pot : table.side_pots) {
        *out.add_side_pots() = pot_to_proto(pot);
    }
    out.set_current_bet(table.current_bet);
    out.set_min_raise(table.min_raise);
    out.set_dealer_index(table.dealer_index);
    out.set_current_player_index(table.current_player_index);
    out.set_last_raiser_index(table.last_raiser_index);
    for (int index : table.players_acted_this_round) {
        out.add_players_acted_this_round(index);
    }
    out.set_hand_number(table.hand_number);
    if (table.last_result) {
        *out.mutable_last_result() = to_proto(*table.last_result);
    }
    return out;
}

Table from_proto(const v1::TableSnapshot& snapshot) {
    Table table;
    table.config = from_proto(snapshot.settings());
    table.phase = from_proto(snapshot.phase());
    for (const auto& seat : snapshot.seats()) {
        table.seats.push_back(seat_from_proto(seat));
    }
    const size_t seat_count = table.seats.size();

    table.deck = cards_from(snapshot.deck());
    table.community_cards = cards_from(snapshot.community_cards());
    require_unique_cards(table);

    validation::require_non_negative(snapshot.pot(), "pot");
    validation::require_non_negative(snapshot.current_bet(), "current_bet");
    validation::require_non_negative(snapshot.min_raise(), "min_raise");
    table.pot = snapshot.pot();
    for (const auto& pot : snapshot.side_pots()) {
        table.side_pots.push_back(pot_from_proto(pot, seat_count));
    }
    table.current_bet = snapshot.current_bet();
    table.min_raise = snapshot.min_raise();

    if (seat_count > 0) {
        validation::require_index(snapshot.dealer_index(), seat_count, "dealer_index");
    } else if (snapshot.dealer_index() != 0) {
        throw CommandRejectedError::invalid_argument("dealer_index is out of range");
    }
    validation::require_index(snapshot.current_player_index(), seat_count, "current_player_index", true);
    validation::require_index(snapshot.last_raiser_index(), seat_count, "last_raiser_index", true);
    table.dealer_index = snapshot.dealer_index();
    table.current_player_index = snapshot.current_player_index();
    table.last_raiser_index = snapshot.last_raiser_index();
    for (int index : snapshot.players_acted_this_round()) {
        validation::require_index(index, seat_count, "players_acted_this_round");
        table.players_acted_this_round.insert(index);
    }

    validation::require_non_negative(snapshot.hand_number(), "hand_number");
    table.hand_number = snapshot.hand_number();
    if (snapshot.has_last_result()) {
        table.last_result = outcome_from_proto(snapshot.last_result(), seat_count);
    }
    return table;
}

} // namespace snapshot
} // namespace holdem
