#pragma once

#include "holdem/table_state.hpp"

namespace holdem {
namespace handlers {

/**
 * Close the current betting round and move to the next street: burn one card,
 * then deal three (flop) or one (turn, river). After the river, resolve the
 * showdown. When at most one seat can still bet, the board is run out.
 */
void advance_phase(Table& table);

/// Deal every remaining street without betting, then resolve the showdown.
void run_out_board(Table& table);

} // namespace handlers
} // namespace holdem
