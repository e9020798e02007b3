#pragma once
#include <array>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"

// Summary figures shown on the statistics screen
struct DeckStats {
    std::size_t total_cards = 0;
    std::array<std::size_t, Card::MAX_DIFFICULTY> difficulty_counts{};  // index 0 = level 1
    std::array<double, Card::MAX_DIFFICULTY> difficulty_percentages{};
    std::size_t mastered_cards = 0;
    double mastery_percentage = 0.0;
    std::size_t due_cards = 0;
    std::optional<std::time_t> last_studied;
};

class Deck {
public:
    Deck() = default;
    Deck(const std::string& name, const std::string& targetLanguage,
        const std::string& nativeLanguage, std::time_t created = std::time(nullptr));

    std::string id;
    std::string name;              // e.g. "Spanish Basics"
    std::string target_language;   // language being learned
    std::string native_language;
    std::vector<Card> cards;       // insertion order = display order
    std::time_t created_at = 0;
    std::optional<std::time_t> last_studied;

    std::size_t dueCardCount(std::time_t now) const;
    std::vector<Card> dueCards(std::time_t now) const;
    std::vector<Card> newCards() const;

    // Lookup by id; throws NotFoundError when absent.
    Card& findCard(const std::string& cardId);
    const Card& findCard(const std::string& cardId) const;
    bool hasCard(const std::string& cardId) const;

    DeckStats stats(std::time_t now) const;

    bool operator==(const Deck& other) const;
    bool operator!=(const Deck& other) const { return !(*this == other); }
};
