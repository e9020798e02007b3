#include "SessionRunner.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <utility>
#include <sodium.h>
#include <spdlog/spdlog.h>

SessionRunner::SessionRunner(LearningSystem& sys, ReviewPrompter& p)
    : system(sys), prompter(p)
{
}

std::vector<Card> SessionRunner::selectCards(const std::string& deckId, bool includeNewWhenNoneDue) const {
    auto due = system.getDueCards(deckId);
    if (!due.empty()) {
        spdlog::info("{} cards due in deck {}", due.size(), deckId);
        return due;
    }

    if (!includeNewWhenNoneDue) {
        spdlog::debug("No cards due in deck {}", deckId);
        return {};
    }

    auto fresh = system.getNewCards(deckId);
    spdlog::info("No cards due in deck {}; {} new cards selected", deckId, fresh.size());
    return fresh;
}

StudySession SessionRunner::run(const std::string& deckId, std::vector<Card> cards) {
    StudySession session(system.getDeck(deckId), system.now());
    const std::size_t total = cards.size();

    shuffle(cards);
    prompter.sessionStarted(session, total);

    for (const auto& card : cards) {
        std::string answer = prompter.askAnswer(session.deck, card);
        bool exactMatch = answersMatch(answer, card.front);

        int rating = prompter.askRating(session.deck, card, exactMatch);
        bool isCorrect = prompter.judgeCorrect(rating, exactMatch);

        try {
            system.reviewCard(deckId, card.id, rating, isCorrect);
        }
        catch (const LexideckError& e) {
            // card vanished or rating out of range: skip it, keep the session going
            spdlog::warn("Skipping card {}: {}", card.id, e.what());
            continue;
        }

        session.recordResult(isCorrect);
        prompter.cardReviewed(session, total);
    }

    session.finish(system.now());
    return session;
}

// Fisher-Yates with libsodium's unbiased bounded random
void SessionRunner::shuffle(std::vector<Card>& cards) {
    if (cards.size() < 2) return;
    for (std::size_t i = cards.size() - 1; i > 0; --i) {
        std::size_t j = randombytes_uniform(static_cast<uint32_t>(i + 1));
        std::swap(cards[i], cards[j]);
    }
}

bool SessionRunner::answersMatch(const std::string& given, const std::string& expected) {
    if (given.size() != expected.size()) return false;
    return std::equal(given.begin(), given.end(), expected.begin(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
}
