#pragma once

#include "holdem/random_source.hpp"
#include "holdem/table_state.hpp"

namespace holdem {
namespace handlers {

/**
 * Begin a new hand: drop sitting-out and busted seats, shuffle a fresh deck,
 * post blinds, deal two hole cards to every seat and hand the turn to the
 * first player. Heads-up, the dealer posts the small blind and acts first.
 */
void handle_start_hand(Table& table, RandomSource& rng);

} // namespace handlers
} // namespace holdem
