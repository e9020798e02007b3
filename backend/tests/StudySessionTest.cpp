#include "TestHelpers.hpp"
#include "core/StudySession.hpp"

TEST(StudySessionTest, AccuracyIsZeroWhenNothingReviewed) {
    Deck d("Spanish Basics", "Spanish", "English", T0);
    StudySession s(d, T0);

    EXPECT_EQ(s.cards_reviewed, 0);
    EXPECT_DOUBLE_EQ(s.accuracyPercentage(), 0.0);
}

TEST(StudySessionTest, AccuracyFromCounters) {
    Deck d("Spanish Basics", "Spanish", "English", T0);
    StudySession s(d, T0);

    s.recordResult(true);
    s.recordResult(false);
    s.recordResult(true);
    s.recordResult(true);

    EXPECT_EQ(s.cards_reviewed, 4);
    EXPECT_EQ(s.correct_responses, 3);
    EXPECT_DOUBLE_EQ(s.accuracyPercentage(), 75.0);
}

TEST(StudySessionTest, DurationRequiresEndTime) {
    Deck d("Spanish Basics", "Spanish", "English", T0);
    StudySession s(d, T0);

    EXPECT_FALSE(s.duration().has_value());
    EXPECT_FALSE(s.isFinished());

    s.finish(T0 + 125);
    ASSERT_TRUE(s.duration().has_value());
    EXPECT_DOUBLE_EQ(*s.duration(), 125.0);
    EXPECT_TRUE(s.isFinished());
}

TEST(StudySessionTest, KeepsItsOwnDeckSnapshot) {
    Deck d("Spanish Basics", "Spanish", "English", T0);
    d.cards.emplace_back("perro", "dog", 3, std::nullopt, T0);
    StudySession s(d, T0);

    d.cards.clear();
    d.name = "Renamed";

    EXPECT_EQ(s.deck.name, "Spanish Basics");
    EXPECT_EQ(s.deck.cards.size(), 1u);
}
