#include "create_handler.hpp"
#include <algorithm>

namespace holdem {
namespace handlers {

Table handle_create(const TableConfig& config) {
    const TableConfig defaults;
    TableConfig settings = config;

    int max_players = settings.max_players > 0 ? settings.max_players : defaults.max_players;
    settings.max_players = std::clamp(max_players, kMinPlayers, kMaxPlayers);
    settings.starting_bank = settings.starting_bank > 0 ? settings.starting_bank : defaults.starting_bank;
    settings.small_blind = settings.small_blind > 0 ? settings.small_blind : defaults.small_blind;
    settings.big_blind = settings.big_blind > 0 ? settings.big_blind : defaults.big_blind;
    settings.big_blind = std::max(settings.big_blind, settings.small_blind);
    settings.turn_timer_seconds = settings.turn_timer_seconds > 0
        ? settings.turn_timer_seconds : defaults.turn_timer_seconds;
    settings.buy_in = std::max(settings.buy_in, 0.0);
    if (settings.currency.empty()) {
        settings.currency = defaults.currency;
    }

    Table table;
    table.config = settings;
    table.phase = Phase::Waiting;
    return table;
}

} // namespace handlers
} // namespace holdem
