#include "Scheduler.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <spdlog/spdlog.h>

Scheduler::Scheduler()
    : base_ease(2.5),
    ease_min(1.3),
    ease_step(0.1),
    first_fail_interval_days(1),
    first_pass_interval_days(2),
    lapse_reset_interval_days(1),
    weak_recall_factor(0.5),
    strong_recall_factor(1.3)
{
    spdlog::debug("Scheduler (SM-2 heuristic) initialized.");
}

std::time_t Scheduler::computeNextReview(const Card& card, int rating, std::time_t now) const {
    if (!isValidRating(rating)) {
        spdlog::warn("Rejected rating {} for card {}", rating, card.id);
        throw ValidationError("rating must be between 0 and 5, got " + std::to_string(rating));
    }

    double ease = easeFactor(card.difficulty, rating);
    int interval = computeInterval(card, rating, ease, now);

    spdlog::debug("Schedule card {} | difficulty={} reviews={} rating={} ease={:.2f} -> {}d",
        card.id, card.difficulty, card.review_count, rating, ease, interval);

    return now + static_cast<std::time_t>(interval) * SECONDS_PER_DAY;
}

double Scheduler::easeFactor(int difficulty, int rating) const {
    // Lower difficulty and higher rating both increase ease
    double difficultyAdjustment = static_cast<double>(3 - difficulty) * ease_step;
    double performanceAdjustment = static_cast<double>(rating - 3) * ease_step;
    return std::max(ease_min, base_ease + difficultyAdjustment + performanceAdjustment);
}

/*
  Interval in whole days, never less than one.
  A card with reviews but no last_reviewed timestamp only arises from
  hand-edited data; it counts as one elapsed day.
*/
int Scheduler::computeInterval(const Card& card, int rating, double ease, std::time_t now) const {
    if (card.review_count == 0) {
        return rating <= 2 ? first_fail_interval_days : first_pass_interval_days;
    }

    if (rating <= 1) {
        return lapse_reset_interval_days;
    }

    int elapsed = card.last_reviewed ? wholeDaysBetween(*card.last_reviewed, now) : 1;
    int base = static_cast<int>(std::floor(static_cast<double>(elapsed) * ease));

    int interval = base;
    if (rating <= 2) {
        interval = static_cast<int>(std::floor(base * weak_recall_factor));
    }
    else if (rating >= 4) {
        interval = static_cast<int>(std::floor(base * strong_recall_factor));
    }

    return std::max(1, interval);
}

int Scheduler::driftDifficulty(int difficulty, int rating) {
    if (rating <= 1) return std::min(Card::MAX_DIFFICULTY, difficulty + 1);
    if (rating >= 4) return std::max(Card::MIN_DIFFICULTY, difficulty - 1);
    return difficulty;
}

int Scheduler::wholeDaysBetween(std::time_t from, std::time_t to) {
    if (to <= from) return 0;
    return static_cast<int>((to - from) / SECONDS_PER_DAY);
}
