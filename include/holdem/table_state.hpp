#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "card.hpp"
#include "hand_evaluator.hpp"

namespace holdem {

enum class Phase {
    Waiting,
    Preflop,
    Flop,
    Turn,
    River,
    Showdown,
    Finished
};

enum class ActionType {
    Fold,
    Check,
    Call,
    Bet,
    Raise,
    AllIn
};

/// Play money, or chips backed by a staked buy-in settled outside the engine.
enum class TableMode {
    Casual,
    Staked
};

/// Who receives the indivisible remainder of a split pot.
enum class OddChipPolicy {
    FirstInSeatOrder,
    LeftOfDealer
};

std::string to_string(Phase phase);
std::string to_string(ActionType action);
std::string to_string(TableMode mode);
std::optional<ActionType> parse_action(const std::string& tag);

constexpr int kMinPlayers = 2;
constexpr int kMaxPlayers = 8;

struct TableConfig {
    std::string table_id;
    std::string host_id;
    TableMode mode = TableMode::Casual;
    int max_players = 6;
    int64_t starting_bank = 1000;
    int64_t small_blind = 5;
    int64_t big_blind = 10;
    /// Consumed only by external turn schedulers.
    int turn_timer_seconds = 30;
    /// Currency amount a staked seat pays in; zero for casual tables.
    double buy_in = 0.0;
    std::string currency = "SOL";
    OddChipPolicy odd_chip_policy = OddChipPolicy::FirstInSeatOrder;

    /// Currency value of one chip.
    double chip_value() const {
        return starting_bank > 0 ? buy_in / static_cast<double>(starting_bank) : 0.0;
    }
};

struct Seat {
    std::string player_id;
    std::string display_name;
    int64_t chips = 0;
    std::vector<Card> hole_cards;
    /// Wagered in the current betting round.
    int64_t bet = 0;
    int64_t total_bet_this_hand = 0;
    bool folded = false;
    bool all_in = false;
    /// Display label such as "Call $20" or "All-In $350".
    std::string last_action;
    bool sitting_out = false;

    bool can_act() const { return !folded && !all_in; }
};

/// A slice of the pot and the seats entitled to contest it.
struct SidePot {
    int64_t amount = 0;
    std::vector<int> eligible_seats;
    /// Player ids that took a share, in seat order.
    std::vector<std::string> winners;
};

struct Winner {
    std::string player_id;
    std::string display_name;
    int64_t amount = 0;
    /// Hand name, or "Everyone folded" for an uncontested pot.
    std::string hand;
    std::vector<Card> cards;
};

struct ShowdownEntry {
    std::string player_id;
    std::string display_name;
    HandResult hand;
    std::vector<Card> hole_cards;
};

/// Settlement record read by the payment layer once a hand is finished.
struct HandOutcome {
    /// One entry per winning player, amounts summed across pots.
    std::vector<Winner> winners;
    /// Every seat still in the hand at showdown; empty when everyone else folded.
    std::vector<ShowdownEntry> showdown;
    std::vector<SidePot> pots;
    bool uncontested = false;

    int64_t total_awarded() const;
};

/**
 * Complete state of one poker table.
 *
 * A plain value: copying it snapshots the table, and nothing outside it is
 * touched by the engine. Seats keep their indices for the whole hand.
 */
struct Table {
    TableConfig config;
    Phase phase = Phase::Waiting;
    std::vector<Seat> seats;
    Deck deck;
    std::vector<Card> community_cards;
    int64_t pot = 0;
    /// Partition of the pot computed at showdown.
    std::vector<SidePot> side_pots;
    int64_t current_bet = 0;
    int64_t min_raise = 0;
    int dealer_index = 0;
    /// -1 when nobody may act.
    int current_player_index = -1;
    int last_raiser_index = -1;
    std::set<int> players_acted_this_round;
    int64_t hand_number = 0;
    std::optional<HandOutcome> last_result;

    bool hand_in_progress() const {
        return phase != Phase::Waiting && phase != Phase::Finished;
    }
    bool is_betting_phase() const {
        return phase == Phase::Preflop || phase == Phase::Flop ||
               phase == Phase::Turn || phase == Phase::River;
    }
    bool is_full() const {
        return static_cast<int>(seats.size()) >= config.max_players;
    }
    int seat_count() const { return static_cast<int>(seats.size()); }

    /// Index of the player's seat, or -1.
    int find_seat(const std::string& player_id) const;
    const Seat* current_seat() const;

    /// Seats not folded.
    int players_in_hand() const;
    /// Seats neither folded nor all-in.
    int players_able_to_act() const;
    int funded_seat_count() const;
    /// Chips on the table: every stack plus the pot.
    int64_t total_chips() const;
};

} // namespace holdem
