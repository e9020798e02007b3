#include "StudySession.hpp"
#include <ctime>
#include <spdlog/spdlog.h>

StudySession::StudySession(const Deck& d, std::time_t startTime)
    : deck(d), start_time(startTime)
{
    spdlog::info("Study session started for deck '{}' ({} cards)", deck.name, deck.cards.size());
}

void StudySession::recordResult(bool isCorrect) {
    cards_reviewed++;
    if (isCorrect) correct_responses++;
}

void StudySession::finish(std::time_t endTime) {
    end_time = endTime;
    spdlog::info("Study session for '{}' finished: reviewed={} correct={} accuracy={:.1f}%",
        deck.name, cards_reviewed, correct_responses, accuracyPercentage());
}

std::optional<double> StudySession::duration() const {
    if (!end_time) return std::nullopt;
    return std::difftime(*end_time, start_time);
}

double StudySession::accuracyPercentage() const {
    if (cards_reviewed <= 0) return 0.0;
    return static_cast<double>(correct_responses) / static_cast<double>(cards_reviewed) * 100.0;
}
