#pragma once

#include "holdem/table.pb.h"
#include "holdem/poker_types.pb.h"
#include "hand_evaluator.hpp"
#include "table_state.hpp"

namespace holdem {
namespace snapshot {

v1::Card to_proto(const Card& card);
Card from_proto(const v1::Card& card);

v1::Phase to_proto(Phase phase);
Phase from_proto(v1::Phase phase);

v1::ActionType to_proto(ActionType action);
ActionType from_proto(v1::ActionType action);

v1::TableSettings to_proto(const TableConfig& config);
TableConfig from_proto(const v1::TableSettings& settings);

v1::SeatSnapshot to_proto(const Seat& seat);
v1::HandResultSnapshot to_proto(const HandResult& result);
v1::HandOutcomeSnapshot to_proto(const HandOutcome& outcome);

/**
 * Full table, including the undealt deck. Pass `include_deck = false` for views
 * shown to players.
 */
v1::TableSnapshot to_proto(const Table& table, bool include_deck = true);

/**
 * Restore a table from a snapshot.
 * Throws CommandRejectedError (InvalidArgument) for invalid cards, duplicate
 * cards or out-of-range seat indices.
 */
Table from_proto(const v1::TableSnapshot& snapshot);

} // namespace snapshot
} // namespace holdem
