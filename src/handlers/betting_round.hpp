#pragma once

#include "holdem/table_state.hpp"

namespace holdem {
namespace handlers {

/// First seat after `from` (wrapping, `from` itself last) that is neither folded nor all-in; -1 if none.
int next_able_seat(const Table& table, int from);

/**
 * True when every seat still able to act has acted this round and matched the
 * current bet, or when no seat is able to act.
 */
bool is_betting_round_complete(const Table& table);

/// Move `amount` from the seat's stack into the pot. Marks the seat all-in at zero.
void commit_chips(Table& table, int seat_index, int64_t amount);

/// Record a bet or raise that sets a new current bet; everyone else must act again.
void reopen_betting(Table& table, int seat_index);

/**
 * Continue the hand after a seat acted or left: award an uncontested pot,
 * close the round, or pass the turn.
 */
void settle_after_action(Table& table);

} // namespace handlers
} // namespace holdem
