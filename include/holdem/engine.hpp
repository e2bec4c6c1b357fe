#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "random_source.hpp"
#include "table_state.hpp"

namespace holdem {

/// Outcome of a table operation. On rejection the table is unchanged.
struct OperationResult {
    Phase phase = Phase::Waiting;
    /// The new seat, for add_player.
    std::optional<Seat> seat;
    /// Set when the operation finished a hand.
    std::optional<HandOutcome> result;
    std::optional<Rejection> error;

    bool ok() const { return !error.has_value(); }
};

/// Build an empty table in the waiting phase. Out-of-range settings fall back to defaults.
Table create_table(const TableConfig& config = {});

/// Seat a player with the table's starting bank.
OperationResult add_player(Table& table, const std::string& player_id,
                           const std::string& display_name);

/// Unseat a player between hands, or fold and sit them out mid-hand.
OperationResult remove_player(Table& table, const std::string& player_id);

/// Deal a new hand: shuffle, move blinds, deal hole cards.
OperationResult start_hand(Table& table, RandomSource& rng);
OperationResult start_hand(Table& table);

/**
 * Apply the current player's action.
 *
 * `amount` is the bet size for a bet and the raise-to total for a raise; zero
 * selects the minimum. It is ignored for every other action.
 */
OperationResult player_action(Table& table, const std::string& player_id,
                              ActionType action, int64_t amount = 0);
OperationResult player_action(Table& table, const std::string& player_id,
                              const std::string& action, int64_t amount = 0);

/// Actions the current player may take. Empty when nobody may act.
std::vector<ActionType> get_valid_actions(const Table& table);

/// Chips the current player needs to call, capped at their stack.
int64_t amount_to_call(const Table& table);

/// Smallest legal raise-to total for the current player.
int64_t min_raise_to(const Table& table);

} // namespace holdem
