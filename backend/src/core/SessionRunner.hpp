#pragma once
#include <string>
#include <vector>
#include "LearningSystem.hpp"
#include "StudySession.hpp"

// UI side of a study session. The runner asks it for the typed answer
// and the self-assessed rating of every card.
class ReviewPrompter {
public:
    virtual ~ReviewPrompter() = default;

    virtual void sessionStarted(const StudySession& session, std::size_t cardCount) { (void)session; (void)cardCount; }

    // What the user typed for the card's front
    virtual std::string askAnswer(const Deck& deck, const Card& card) = 0;

    // Rating in [0,5]; exactMatch is the case-insensitive answer check
    virtual int askRating(const Deck& deck, const Card& card, bool exactMatch) = 0;

    virtual bool judgeCorrect(int rating, bool exactMatch) const {
        (void)exactMatch;
        return rating >= 3;
    }

    virtual void cardReviewed(const StudySession& session, std::size_t total) { (void)session; (void)total; }
};

class SessionRunner {
public:
    SessionRunner(LearningSystem& system, ReviewPrompter& prompter);

    // Due cards when there are any, otherwise the never-reviewed cards if
    // includeNewWhenNoneDue is set. Empty when there is nothing to study.
    std::vector<Card> selectCards(const std::string& deckId, bool includeNewWhenNoneDue) const;

    // Reviews every card once in shuffled order and returns the finished session.
    StudySession run(const std::string& deckId, std::vector<Card> cards);

    static void shuffle(std::vector<Card>& cards);
    static bool answersMatch(const std::string& given, const std::string& expected);

private:
    LearningSystem& system;
    ReviewPrompter& prompter;
};
