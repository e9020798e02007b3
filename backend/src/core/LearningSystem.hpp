#pragma once

#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "Deck.hpp"
#include "Scheduler.hpp"
#include "../storage/Storage.hpp"

using Clock = std::function<std::time_t()>;

Clock systemClock();

// Owns the deck collection and is the only place that mutates it.
// Every successful mutation rewrites the whole collection through Storage.
class LearningSystem {
public:
    explicit LearningSystem(const Storage& storage, Clock clock = systemClock());

    // Reads the persisted document. A corrupt document is logged and
    // leaves the collection empty; returns false in that case.
    bool loadDecks();

    const std::vector<Deck>& getDecks() const { return decks; }

    // ValidationError on any empty field
    const Deck& createDeck(const std::string& name, const std::string& targetLanguage,
        const std::string& nativeLanguage);

    // ValidationError for empty front/back or difficulty outside [1,5],
    // NotFoundError for an unknown deck
    const Card& addCard(const std::string& deckId, const std::string& front, const std::string& back,
        int difficulty = Card::DEFAULT_DIFFICULTY, std::optional<std::string> notes = std::nullopt);

    // Applies one review outcome to a card. rating and isCorrect are
    // independent inputs.
    const Card& reviewCard(const std::string& deckId, const std::string& cardId,
        int rating, bool isCorrect);

    const Deck& getDeck(const std::string& deckId) const;

    // 1-based display position; ValidationError when out of range
    const Deck& deckAt(int position) const;

    std::vector<Card> getDueCards(const std::string& deckId) const;
    std::vector<Card> getNewCards(const std::string& deckId) const;

    std::time_t now() const { return clock(); }

    // Message of the most recent failed save, cleared by the next good one
    const std::optional<std::string>& lastSaveError() const { return last_save_error; }

    // Persist the collection
    bool save();

private:
    std::vector<Deck> decks;
    Storage store;
    Scheduler scheduler;
    Clock clock;
    std::optional<std::string> last_save_error;

    Deck& findDeck(const std::string& deckId);
};
