#include "holdem/engine.hpp"
#include "handlers/action_handler.hpp"
#include "handlers/create_handler.hpp"
#include "handlers/join_handler.hpp"
#include "handlers/leave_handler.hpp"
#include "handlers/start_hand_handler.hpp"
#include <algorithm>

namespace holdem {

namespace {

/**
 * Run a handler against a working copy and commit it only on success.
 * A hand result is reported when this call is the one that finished the hand.
 */
template<typename Handler>
OperationResult run(Table& table, Handler&& handler) {
    OperationResult result;
    Table working = table;
    try {
        handler(working);
    } catch (const CommandRejectedError& e) {
        result.phase = table.phase;
        result.error = Rejection::from(e);
        return result;
    }

    const bool finished_now = working.phase == Phase::Finished &&
        (table.phase != Phase::Finished || table.hand_number != working.hand_number);
    table = std::move(working);
    result.phase = table.phase;
    if (finished_now) {
        result.result = table.last_result;
    }
    return result;
}

} // anonymous namespace

Table create_table(const TableConfig& config) {
    return handlers::handle_create(config);
}

OperationResult add_player(Table& table, const std::string& player_id,
                           const std::string& display_name) {
    std::optional<Seat> seated;
    OperationResult result = run(table, [&](Table& t) {
        seated = handlers::handle_join(t, player_id, display_name);
    });
    if (result.ok()) {
        result.seat = seated;
    }
    return result;
}

OperationResult remove_player(Table& table, const std::string& player_id) {
    return run(table, [&](Table& t) { handlers::handle_leave(t, player_id); });
}

OperationResult start_hand(Table& table, RandomSource& rng) {
    return run(table, [&](Table& t) { handlers::handle_start_hand(t, rng); });
}

OperationResult start_hand(Table& table) {
    return start_hand(table, default_random_source());
}

OperationResult player_action(Table& table, const std::string& player_id,
                              ActionType action, int64_t amount) {
    return run(table, [&](Table& t) {
        handlers::handle_action(t, player_id, action, amount);
    });
}

OperationResult player_action(Table& table, const std::string& player_id,
                              const std::string& action, int64_t amount) {
    auto parsed = parse_action(action);
    if (!parsed) {
        OperationResult result;
        result.phase = table.phase;
        result.error = Rejection::from(
            CommandRejectedError::invalid_argument("Unknown action: " + action));
        return result;
    }
    return player_action(table, player_id, *parsed, amount);
}

std::vector<ActionType> get_valid_actions(const Table& table) {
    std::vector<ActionType> actions;
    if (!table.is_betting_phase()) {
        return actions;
    }
    const Seat* seat = table.current_seat();
    if (seat == nullptr || !seat->can_act()) {
        return actions;
    }

    const int64_t to_call = table.current_bet - seat->bet;
    actions.push_back(ActionType::Fold);
    if (to_call <= 0) {
        actions.push_back(ActionType::Check);
        // The big blind's preflop option is a raise over the blind, not a bet.
        if (seat->chips > 0) {
            actions.push_back(table.current_bet > 0 ? ActionType::Raise : ActionType::Bet);
        }
    } else {
        actions.push_back(ActionType::Call);
        if (seat->chips > to_call) {
            actions.push_back(ActionType::Raise);
        }
    }
    if (seat->chips > 0) {
        actions.push_back(ActionType::AllIn);
    }
    return actions;
}

int64_t amount_to_call(const Table& table) {
    const Seat* seat = table.current_seat();
    if (seat == nullptr) {
        return 0;
    }
    return std::max<int64_t>(0, std::min(table.current_bet - seat->bet, seat->chips));
}

int64_t min_raise_to(const Table& table) {
    const Seat* seat = table.current_seat();
    if (seat == nullptr) {
        return 0;
    }
    if (table.current_bet == 0) {
        return std::min(table.config.big_blind, seat->chips);
    }
    return std::min(table.current_bet + table.min_raise, seat->bet + seat->chips);
}

} // namespace holdem
