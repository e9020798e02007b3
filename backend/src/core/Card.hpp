#pragma once
#include <string>
#include <ctime>
#include <optional>

class Card {
public:
    static constexpr int MIN_DIFFICULTY = 1;
    static constexpr int MAX_DIFFICULTY = 5;
    static constexpr int DEFAULT_DIFFICULTY = 3;
    static constexpr int MASTERED_STREAK = 3;

    Card() = default;
    Card(const std::string& front, const std::string& back,
        int difficulty = DEFAULT_DIFFICULTY,
        std::optional<std::string> notes = std::nullopt,
        std::time_t created = std::time(nullptr));

    // Basic fields
    std::string id;          // UUID v4, auto-generated
    std::string front;       // target language
    std::string back;        // native language
    std::optional<std::string> notes;

    // Review state
    int difficulty = DEFAULT_DIFFICULTY;   // 1 = easiest, 5 = hardest
    std::time_t next_review = 0;           // Seconds since epoch
    int review_count = 0;
    int consecutive_correct = 0;
    std::optional<std::time_t> last_reviewed;

    bool isDue(std::time_t now) const { return next_review <= now; }
    bool isNew() const { return review_count == 0; }
    bool isMastered() const { return consecutive_correct >= MASTERED_STREAK; }

    // Checks difficulty range and counter invariants
    bool hasValidState() const;

    static bool isValidDifficulty(int difficulty) {
        return difficulty >= MIN_DIFFICULTY && difficulty <= MAX_DIFFICULTY;
    }

    // Utility
    static std::string generateID();

    bool operator==(const Card& other) const;
    bool operator!=(const Card& other) const { return !(*this == other); }
};
