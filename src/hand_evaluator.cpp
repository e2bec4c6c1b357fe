#include "holdem/hand_evaluator.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <utility>

namespace holdem {

namespace {

bool is_consecutive(const std::vector<int>& values_desc) {
    for (size_t i = 0; i + 1 < values_desc.size(); ++i) {
        if (values_desc[i] - values_desc[i + 1] != 1) {
            return false;
        }
    }
    return true;
}

bool is_wheel(const std::vector<int>& values_desc) {
    return values_desc == std::vector<int>{14, 5, 4, 3, 2};
}

/// (count, value) pairs: larger groups first, higher values first within a size.
std::vector<std::pair<int, int>> rank_groups(const std::vector<int>& values) {
    std::map<int, int> counts;
    for (int v : values) {
        counts[v]++;
    }
    std::vector<std::pair<int, int>> groups;
    for (const auto& [value, count] : counts) {
        groups.emplace_back(count, value);
    }
    std::sort(groups.begin(), groups.end(), std::greater<std::pair<int, int>>());
    return groups;
}

std::vector<int> values_except(const std::vector<int>& values_desc, int skip_a, int skip_b = 0) {
    std::vector<int> rest;
    for (int v : values_desc) {
        if (v != skip_a && v != skip_b) {
            rest.push_back(v);
        }
    }
    return rest;
}

/// Step `indices` to the next k-combination of n in lexicographic order.
bool next_combination(std::vector<size_t>& indices, size_t n) {
    const size_t k = indices.size();
    for (size_t i = k; i-- > 0;) {
        if (indices[i] < n - k + i) {
            ++indices[i];
            for (size_t j = i + 1; j < k; ++j) {
                indices[j] = indices[j - 1] + 1;
            }
            return true;
        }
    }
    return false;
}

} // anonymous namespace

std::string hand_name(HandRank rank) {
    switch (rank) {
        case HandRank::Incomplete: return "Incomplete";
        case HandRank::HighCard: return "High Card";
        case HandRank::OnePair: return "One Pair";
        case HandRank::TwoPair: return "Two Pair";
        case HandRank::ThreeOfAKind: return "Three of a Kind";
        case HandRank::Straight: return "Straight";
        case HandRank::Flush: return "Flush";
        case HandRank::FullHouse: return "Full House";
        case HandRank::FourOfAKind: return "Four of a Kind";
        case HandRank::StraightFlush: return "Straight Flush";
        case HandRank::RoyalFlush: return "Royal Flush";
    }
    return "Unknown";
}

std::string HandResult::name() const {
    return hand_name(rank);
}

HandResult evaluate_five(const std::vector<Card>& cards) {
    HandResult result;
    if (cards.size() != 5) {
        return result;
    }
    result.cards = cards;

    std::vector<int> values;
    for (const auto& card : cards) {
        values.push_back(card.rank);
    }
    std::sort(values.begin(), values.end(), std::greater<int>());

    bool flush = std::all_of(cards.begin(), cards.end(),
        [&](const Card& c) { return c.suit == cards[0].suit; });
    bool wheel = is_wheel(values);
    bool straight = is_consecutive(values) || wheel;
    std::vector<int> straight_kickers = wheel ? std::vector<int>{5, 4, 3, 2, 1} : values;

    auto groups = rank_groups(values);

    if (flush && straight) {
        result.rank = straight_kickers[0] == kAceRank ? HandRank::RoyalFlush : HandRank::StraightFlush;
        result.kickers = straight_kickers;
        return result;
    }
    if (groups[0].first == 4) {
        result.rank = HandRank::FourOfAKind;
        result.kickers = {groups[0].second, groups[1].second};
        return result;
    }
    if (groups[0].first == 3 && groups[1].first == 2) {
        result.rank = HandRank::FullHouse;
        result.kickers = {groups[0].second, groups[1].second};
        return result;
    }
    if (flush) {
        result.rank = HandRank::Flush;
        result.kickers = values;
        return result;
    }
    if (straight) {
        result.rank = HandRank::Straight;
        result.kickers = straight_kickers;
        return result;
    }
    if (groups[0].first == 3) {
        int trips = groups[0].second;
        result.rank = HandRank::ThreeOfAKind;
        result.kickers = {trips};
        auto rest = values_except(values, trips);
        result.kickers.insert(result.kickers.end(), rest.begin(), rest.begin() + 2);
        return result;
    }
    if (groups[0].first == 2 && groups[1].first == 2) {
        int high = std::max(groups[0].second, groups[1].second);
        int low = std::min(groups[0].second, groups[1].second);
        result.rank = HandRank::TwoPair;
        result.kickers = {high, low, values_except(values, high, low)[0]};
        return result;
    }
    if (groups[0].first == 2) {
        int pair = groups[0].second;
        result.rank = HandRank::OnePair;
        result.kickers = {pair};
        auto rest = values_except(values, pair);
        result.kickers.insert(result.kickers.end(), rest.begin(), rest.begin() + 3);
        return result;
    }
    result.rank = HandRank::HighCard;
    result.kickers = values;
    return result;
}

HandResult evaluate_hand(const std::vector<Card>& cards) {
    if (cards.size() < 5) {
        return HandResult{};
    }

    std::vector<size_t> indices = {0, 1, 2, 3, 4};
    std::vector<Card> subset(5);
    HandResult best;
    bool found = false;

    do {
        for (size_t i = 0; i < indices.size(); ++i) {
            subset[i] = cards[indices[i]];
        }
        HandResult candidate = evaluate_five(subset);
        if (!found || compare_hands(candidate, best) > 0) {
            best = std::move(candidate);
            found = true;
        }
    } while (next_combination(indices, cards.size()));

    return best;
}

int compare_hands(const HandResult& a, const HandResult& b) {
    if (a.rank != b.rank) {
        return a.category() - b.category();
    }
    size_t n = std::min(a.kickers.size(), b.kickers.size());
    for (size_t i = 0; i < n; ++i) {
        if (a.kickers[i] != b.kickers[i]) {
            return a.kickers[i] - b.kickers[i];
        }
    }
    return 0;
}

} // namespace holdem
