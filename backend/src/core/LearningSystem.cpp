#include "LearningSystem.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

/*
  Accepts well-formed UTF-8 only: no overlong forms, no surrogates,
  nothing above U+10FFFF. The data file is JSON, which cannot carry
  anything else.
*/
static bool isValidUtf8(const std::string& text) {
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        std::size_t extra;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c < 0x80) { i++; continue; }
        else if (c >= 0xC2 && c <= 0xDF) extra = 1;
        else if (c == 0xE0) { extra = 2; lo = 0xA0; }
        else if (c == 0xED) { extra = 2; hi = 0x9F; }
        else if (c >= 0xE1 && c <= 0xEF) extra = 2;
        else if (c == 0xF0) { extra = 3; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) extra = 3;
        else if (c == 0xF4) { extra = 3; hi = 0x8F; }
        else return false;

        if (i + extra >= n) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(text[i + k]);
            const unsigned char min = (k == 1) ? lo : 0x80;
            const unsigned char max = (k == 1) ? hi : 0xBF;
            if (cc < min || cc > max) return false;
        }
        i += extra + 1;
    }
    return true;
}

static void requireUtf8(const std::string& value, const char* field) {
    if (!isValidUtf8(value)) {
        throw ValidationError(std::string(field) + " is not valid UTF-8 text");
    }
}

Clock systemClock() {
    return [] { return std::time(nullptr); };
}

LearningSystem::LearningSystem(const Storage& storage, Clock clk)
    : store(storage), clock(std::move(clk))
{
    spdlog::info("LearningSystem initialized with data file '{}'", store.path());
}

bool LearningSystem::loadDecks() {
    try {
        auto loaded = store.load();
        decks = loaded ? std::move(*loaded) : std::vector<Deck>{};
        spdlog::info("{} decks available", decks.size());
        return true;
    }
    catch (const CorruptDataError& e) {
        spdlog::error("Ignoring unreadable data file, starting empty: {}", e.what());
        decks.clear();
        return false;
    }
}

bool LearningSystem::save() {
    try {
        store.save(decks);
        last_save_error.reset();
        return true;
    }
    catch (const PersistenceWriteError& e) {
        spdlog::error("Save failed, keeping in-memory state: {}", e.what());
        last_save_error = e.what();
        return false;
    }
}

const Deck& LearningSystem::createDeck(const std::string& name, const std::string& targetLanguage,
    const std::string& nativeLanguage)
{
    spdlog::info("Creating deck '{}' ({} / {})", name, targetLanguage, nativeLanguage);

    if (name.empty()) throw ValidationError("deck name cannot be empty");
    if (targetLanguage.empty()) throw ValidationError("target language cannot be empty");
    if (nativeLanguage.empty()) throw ValidationError("native language cannot be empty");
    requireUtf8(name, "deck name");
    requireUtf8(targetLanguage, "target language");
    requireUtf8(nativeLanguage, "native language");

    decks.emplace_back(name, targetLanguage, nativeLanguage, clock());
    save();
    return decks.back();
}

const Card& LearningSystem::addCard(const std::string& deckId, const std::string& front,
    const std::string& back, int difficulty, std::optional<std::string> notes)
{
    if (front.empty()) throw ValidationError("word/phrase cannot be empty");
    if (back.empty()) throw ValidationError("translation cannot be empty");
    if (!Card::isValidDifficulty(difficulty)) {
        throw ValidationError("difficulty must be between 1 and 5, got " + std::to_string(difficulty));
    }
    requireUtf8(front, "word/phrase");
    requireUtf8(back, "translation");
    if (notes) requireUtf8(*notes, "notes");

    Deck& deck = findDeck(deckId);
    deck.cards.emplace_back(front, back, difficulty, std::move(notes), clock());
    spdlog::info("Added card '{}' to deck '{}' ({} cards)", front, deck.name, deck.cards.size());

    save();
    return deck.cards.back();
}

/*
  Review update:
   - difficulty drifts up on a lapse (rating <= 1), down on a strong recall (rating >= 4)
   - the next date is scheduled from the drifted difficulty and the card's
     history before this review, so the first review takes the first-review branch
   - counters, timestamps and the deck's last_studied follow
*/
const Card& LearningSystem::reviewCard(const std::string& deckId, const std::string& cardId,
    int rating, bool isCorrect)
{
    spdlog::info("Review card {} in deck {} | rating={} correct={}", cardId, deckId, rating, isCorrect);

    if (!Scheduler::isValidRating(rating)) {
        throw ValidationError("rating must be between 0 and 5, got " + std::to_string(rating));
    }

    Deck& deck = findDeck(deckId);
    Card& card = deck.findCard(cardId);
    const std::time_t reviewedAt = clock();

    Card updated = card;
    updated.difficulty = Scheduler::driftDifficulty(card.difficulty, rating);
    updated.next_review = scheduler.computeNextReview(updated, rating, reviewedAt);

    updated.review_count++;
    updated.last_reviewed = reviewedAt;
    updated.consecutive_correct = isCorrect ? card.consecutive_correct + 1 : 0;

    card = std::move(updated);
    deck.last_studied = reviewedAt;

    spdlog::debug("Card {} now difficulty={} reviews={} streak={} next={}",
        card.id, card.difficulty, card.review_count, card.consecutive_correct, card.next_review);

    save();
    return card;
}

const Deck& LearningSystem::getDeck(const std::string& deckId) const {
    return const_cast<LearningSystem*>(this)->findDeck(deckId);
}

const Deck& LearningSystem::deckAt(int position) const {
    if (position < 1 || static_cast<std::size_t>(position) > decks.size()) {
        throw ValidationError("invalid deck selection " + std::to_string(position));
    }
    return decks[static_cast<std::size_t>(position) - 1];
}

std::vector<Card> LearningSystem::getDueCards(const std::string& deckId) const {
    return getDeck(deckId).dueCards(clock());
}

std::vector<Card> LearningSystem::getNewCards(const std::string& deckId) const {
    return getDeck(deckId).newCards();
}

Deck& LearningSystem::findDeck(const std::string& deckId) {
    auto it = std::find_if(decks.begin(), decks.end(),
        [&deckId](const Deck& d) { return d.id == deckId; });
    if (it == decks.end()) {
        spdlog::warn("Deck '{}' not found", deckId);
        throw NotFoundError("deck '" + deckId + "' not found");
    }
    return *it;
}
