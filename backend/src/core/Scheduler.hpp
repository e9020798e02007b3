#pragma once
#include <ctime>
#include "Card.hpp"

/*
  SM-2 derived scheduler.
   - ease factor from the card's difficulty and the review rating, floored at 1.3
   - first review: 1 day after a poor recall, 2 days otherwise
   - forgotten cards (rating <= 1) come back the next day
   - later reviews grow the elapsed interval by the ease factor, halved on a
     weak recall and stretched by 1.3 on a strong one

  All functions are pure: the clock value is passed in and the card is never
  modified.
*/
class Scheduler {
public:
    static constexpr int MIN_RATING = 0;
    static constexpr int MAX_RATING = 5;
    static constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

    Scheduler();

    // Throws ValidationError when rating is outside [0,5].
    std::time_t computeNextReview(const Card& card, int rating, std::time_t now) const;

    double easeFactor(int difficulty, int rating) const;
    int computeInterval(const Card& card, int rating, double ease, std::time_t now) const;

    // Difficulty after a review with the given rating, kept within [1,5].
    static int driftDifficulty(int difficulty, int rating);

    static bool isValidRating(int rating) {
        return rating >= MIN_RATING && rating <= MAX_RATING;
    }

private:
    // Tuneables
    double base_ease;
    double ease_min;
    double ease_step;             // per difficulty / rating step away from 3
    int first_fail_interval_days;
    int first_pass_interval_days;
    int lapse_reset_interval_days;
    double weak_recall_factor;
    double strong_recall_factor;

    static int wholeDaysBetween(std::time_t from, std::time_t to);
};
