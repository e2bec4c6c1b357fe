#pragma once

#include <vector>
#include "holdem/table_state.hpp"

namespace holdem {
namespace handlers {

/**
 * Partition the pot by all-in tier.
 *
 * Each distinct total wager is a tier; a tier's pot collects every seat's
 * contribution between the previous tier and this one, and is contested by the
 * unfolded seats whose total reached it. Neighbouring tiers with the same
 * contestants are merged. A tier nobody unfolded reached joins the pot below it.
 */
std::vector<SidePot> compute_side_pots(const Table& table);

/// Evaluate every unfolded hand, pay each side pot, and finish the hand.
void resolve_showdown(Table& table);

/// Pay the whole pot to the last unfolded seat without a showdown.
void award_uncontested(Table& table);

} // namespace handlers
} // namespace holdem
