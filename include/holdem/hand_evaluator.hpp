#pragma once

#include <string>
#include <vector>
#include "card.hpp"

namespace holdem {

/// Hand categories, weakest to strongest. Incomplete marks fewer than five cards.
enum class HandRank : int {
    Incomplete = -1,
    HighCard = 0,
    OnePair = 1,
    TwoPair = 2,
    ThreeOfAKind = 3,
    Straight = 4,
    Flush = 5,
    FullHouse = 6,
    FourOfAKind = 7,
    StraightFlush = 8,
    RoyalFlush = 9
};

/// Best five-card hand found in a card set.
struct HandResult {
    HandRank rank = HandRank::Incomplete;
    /// Tie-break values, most significant first. A wheel reports 5,4,3,2,1.
    std::vector<int> kickers;
    /// The five cards making the hand.
    std::vector<Card> cards;

    int category() const { return static_cast<int>(rank); }
    std::string name() const;
};

/**
 * Score a set of cards.
 *
 * Every five-card subset is scored and the strictly highest one is returned;
 * the first of several equal subsets wins. Fewer than five cards yields an
 * Incomplete result with no kickers.
 */
HandResult evaluate_hand(const std::vector<Card>& cards);

/// Score exactly five cards.
HandResult evaluate_five(const std::vector<Card>& cards);

/**
 * Order two results: category first, then kickers element-wise.
 * Returns a negative value, zero or a positive value as `a` is worse than,
 * equal to or better than `b`. Zero means a split pot.
 */
int compare_hands(const HandResult& a, const HandResult& b);

std::string hand_name(HandRank rank);

} // namespace holdem
