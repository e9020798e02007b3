#pragma once
#include <ctime>
#include <optional>
#include "Deck.hpp"

// One study pass over a deck. Holds a read-only snapshot of the deck;
// never persisted.
class StudySession {
public:
    StudySession(const Deck& deck, std::time_t startTime);

    const Deck deck;
    const std::time_t start_time;
    std::optional<std::time_t> end_time;
    int cards_reviewed = 0;
    int correct_responses = 0;

    void recordResult(bool isCorrect);
    void finish(std::time_t endTime);
    bool isFinished() const { return end_time.has_value(); }

    // Seconds between start and end; empty until finish() is called
    std::optional<double> duration() const;

    // 0 when nothing was reviewed
    double accuracyPercentage() const;
};
