#include "Deck.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

Deck::Deck(const std::string& n, const std::string& target, const std::string& native, std::time_t created)
    : name(n), target_language(target), native_language(native), created_at(created)
{
    id = Card::generateID();
    spdlog::debug("Created Deck: ID={}, name='{}' ({} / {})", id, name, target_language, native_language);
}

std::size_t Deck::dueCardCount(std::time_t now) const {
    return static_cast<std::size_t>(std::count_if(cards.begin(), cards.end(),
        [now](const Card& c) { return c.isDue(now); }));
}

std::vector<Card> Deck::dueCards(std::time_t now) const {
    std::vector<Card> due;
    for (const auto& c : cards) {
        if (c.isDue(now)) due.push_back(c);
    }
    return due;
}

std::vector<Card> Deck::newCards() const {
    std::vector<Card> fresh;
    for (const auto& c : cards) {
        if (c.isNew()) fresh.push_back(c);
    }
    return fresh;
}

Card& Deck::findCard(const std::string& cardId) {
    auto it = std::find_if(cards.begin(), cards.end(),
        [&cardId](const Card& c) { return c.id == cardId; });
    if (it == cards.end()) {
        spdlog::warn("Card '{}' not found in deck '{}'", cardId, name);
        throw NotFoundError("card '" + cardId + "' not found in deck '" + name + "'");
    }
    return *it;
}

const Card& Deck::findCard(const std::string& cardId) const {
    return const_cast<Deck*>(this)->findCard(cardId);
}

bool Deck::hasCard(const std::string& cardId) const {
    return std::any_of(cards.begin(), cards.end(),
        [&cardId](const Card& c) { return c.id == cardId; });
}

DeckStats Deck::stats(std::time_t now) const {
    DeckStats s;
    s.total_cards = cards.size();
    s.last_studied = last_studied;
    s.due_cards = dueCardCount(now);

    for (const auto& c : cards) {
        if (Card::isValidDifficulty(c.difficulty))
            s.difficulty_counts[c.difficulty - 1]++;
        if (c.isMastered())
            s.mastered_cards++;
    }

    if (s.total_cards == 0) return s;

    const double total = static_cast<double>(s.total_cards);
    for (std::size_t i = 0; i < s.difficulty_counts.size(); ++i) {
        s.difficulty_percentages[i] = static_cast<double>(s.difficulty_counts[i]) / total * 100.0;
    }
    s.mastery_percentage = static_cast<double>(s.mastered_cards) / total * 100.0;
    return s;
}

bool Deck::operator==(const Deck& other) const {
    return id == other.id
        && name == other.name
        && target_language == other.target_language
        && native_language == other.native_language
        && cards == other.cards
        && created_at == other.created_at
        && last_studied == other.last_studied;
}
