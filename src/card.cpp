#include "holdem/card.hpp"
#include "holdem/random_source.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace holdem {

Deck create_deck() {
    Deck deck;
    deck.reserve(kDeckSize);
    const Suit suits[] = {Suit::Spades, Suit::Hearts, Suit::Diamonds, Suit::Clubs};
    for (Suit suit : suits) {
        for (int rank = kLowestRank; rank <= kAceRank; ++rank) {
            deck.push_back(Card{suit, rank});
        }
    }
    return deck;
}

Deck shuffle_deck(Deck deck, RandomSource& rng) {
    std::shuffle(deck.begin(), deck.end(), rng);
    return deck;
}

Card draw_card(Deck& deck) {
    if (deck.empty()) {
        throw std::out_of_range("Deck is empty");
    }
    Card card = deck.back();
    deck.pop_back();
    return card;
}

void burn_card(Deck& deck) {
    draw_card(deck);
}

bool is_valid_card(const Card& card) {
    return card.rank >= kLowestRank && card.rank <= kAceRank;
}

std::string rank_label(int rank) {
    switch (rank) {
        case 11: return "J";
        case 12: return "Q";
        case 13: return "K";
        case 14: return "A";
        default: return std::to_string(rank);
    }
}

std::string suit_symbol(Suit suit) {
    switch (suit) {
        case Suit::Spades: return "♠";
        case Suit::Hearts: return "♥";
        case Suit::Diamonds: return "♦";
        case Suit::Clubs: return "♣";
    }
    return "?";
}

std::string card_to_string(const Card& card) {
    return rank_label(card.rank) + suit_symbol(card.suit);
}

std::string cards_to_string(const std::vector<Card>& cards) {
    std::string out;
    for (const auto& card : cards) {
        if (!out.empty()) {
            out += ' ';
        }
        out += card_to_string(card);
    }
    return out;
}

std::optional<Card> parse_card(const std::string& text) {
    if (text.size() < 2 || text.size() > 3) {
        return std::nullopt;
    }

    std::string rank_text = text.substr(0, text.size() - 1);
    char suit_char = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));

    Card card;
    switch (suit_char) {
        case 's': card.suit = Suit::Spades; break;
        case 'h': card.suit = Suit::Hearts; break;
        case 'd': card.suit = Suit::Diamonds; break;
        case 'c': card.suit = Suit::Clubs; break;
        default: return std::nullopt;
    }

    if (rank_text == "10") {
        card.rank = 10;
        return card;
    }
    if (rank_text.size() != 1) {
        return std::nullopt;
    }

    char r = static_cast<char>(std::toupper(static_cast<unsigned char>(rank_text[0])));
    if (r >= '2' && r <= '9') {
        card.rank = r - '0';
    } else if (r == 'T') {
        card.rank = 10;
    } else if (r == 'J') {
        card.rank = 11;
    } else if (r == 'Q') {
        card.rank = 12;
    } else if (r == 'K') {
        card.rank = 13;
    } else if (r == 'A') {
        card.rank = 14;
    } else {
        return std::nullopt;
    }
    return card;
}

} // namespace holdem
