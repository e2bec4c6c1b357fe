#pragma once

#include <gtest/gtest.h>
#include <algorithm>
#include <initializer_list>
#include <string>
#include <vector>
#include "holdem/card.hpp"
#include "holdem/engine.hpp"
#include "holdem/snapshot.hpp"

namespace holdem {
namespace test {

inline Card card(const std::string& text) {
    auto parsed = parse_card(text);
    EXPECT_TRUE(parsed.has_value()) << "bad card literal " << text;
    return parsed.value_or(Card{});
}

inline std::vector<Card> cards(std::initializer_list<const char*> texts) {
    std::vector<Card> out;
    for (const char* text : texts) {
        out.push_back(card(text));
    }
    return out;
}

/// Table with players "p1".."pN" seated in order.
inline Table seated_table(int players, TableConfig config = {}) {
    Table table = create_table(config);
    for (int i = 1; i <= players; ++i) {
        auto result = add_player(table, "p" + std::to_string(i), "Player " + std::to_string(i));
        EXPECT_TRUE(result.ok());
    }
    return table;
}

/**
 * Replace every seat's hole cards and stack the deck so the remaining streets
 * come out as `board` (burn cards are taken from the unused cards).
 */
inline void rig_hand(Table& table, const std::vector<std::vector<Card>>& holes,
                     const std::vector<Card>& board) {
    std::vector<Card> used;
    for (size_t i = 0; i < holes.size(); ++i) {
        table.seats[i].hole_cards = holes[i];
        used.insert(used.end(), holes[i].begin(), holes[i].end());
    }
    used.insert(used.end(), board.begin(), board.end());

    std::vector<Card> spare;
    for (const auto& c : create_deck()) {
        if (std::find(used.begin(), used.end(), c) == used.end()) {
            spare.push_back(c);
        }
    }

    // Draw order: burn, flop x3, burn, turn, burn, river, then the rest.
    std::vector<Card> draws = {spare[0], board[0], board[1], board[2],
                               spare[1], board[3], spare[2], board[4]};
    draws.insert(draws.end(), spare.begin() + 3, spare.end());
    table.deck.assign(draws.rbegin(), draws.rend());
}

inline int64_t stacks(const Table& table) {
    int64_t total = 0;
    for (const auto& seat : table.seats) {
        total += seat.chips;
    }
    return total;
}

/// Byte-level fingerprint used to assert a table did not change.
inline std::string fingerprint(const Table& table) {
    return snapshot::to_proto(table).SerializeAsString();
}

} // namespace test
} // namespace holdem
