#pragma once

#include <optional>
#include <string>
#include <vector>

namespace holdem {

class RandomSource;

enum class Suit {
    Spades,
    Hearts,
    Diamonds,
    Clubs
};

constexpr int kLowestRank = 2;
constexpr int kAceRank = 14;
constexpr int kDeckSize = 52;

/// A playing card. `rank` is the numeric value 2-14 (ace high).
struct Card {
    Suit suit = Suit::Spades;
    int rank = kLowestRank;

    bool operator==(const Card& other) const {
        return suit == other.suit && rank == other.rank;
    }
    bool operator!=(const Card& other) const { return !(*this == other); }
};

/// Ordered card sequence; cards are dealt from the back.
using Deck = std::vector<Card>;

/// All 52 cards in canonical order: spades, hearts, diamonds, clubs; 2 through ace in each suit.
Deck create_deck();

/// Uniform permutation of `deck` drawn from `rng`.
Deck shuffle_deck(Deck deck, RandomSource& rng);

/// Remove and return the top card. Throws std::out_of_range on an empty deck.
Card draw_card(Deck& deck);

/// Discard the top card.
void burn_card(Deck& deck);

bool is_valid_card(const Card& card);

/// "2".."10", "J", "Q", "K", "A".
std::string rank_label(int rank);
std::string suit_symbol(Suit suit);

/// Display form, e.g. "10♠" or "A♥".
std::string card_to_string(const Card& card);
std::string cards_to_string(const std::vector<Card>& cards);

/// Parse short text such as "As", "10h", "Td" or "kc". Returns nullopt on malformed input.
std::optional<Card> parse_card(const std::string& text);

} // namespace holdem
