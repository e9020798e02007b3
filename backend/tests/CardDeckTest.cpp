#include "TestHelpers.hpp"
#include "core/Card.hpp"
#include "core/Deck.hpp"
#include "core/Errors.hpp"

#include <regex>
#include <set>

TEST(CardTest, NewCardIsDueAtCreationAndUnreviewed) {
    Card c("perro", "dog", 3, std::nullopt, T0);

    EXPECT_EQ(c.next_review, T0);
    EXPECT_TRUE(c.isDue(T0));
    EXPECT_FALSE(c.isDue(T0 - 1));
    EXPECT_EQ(c.review_count, 0);
    EXPECT_EQ(c.consecutive_correct, 0);
    EXPECT_FALSE(c.last_reviewed.has_value());
    EXPECT_FALSE(c.notes.has_value());
    EXPECT_TRUE(c.isNew());
    EXPECT_TRUE(c.hasValidState());
}

TEST(CardTest, GeneratesVersion4Uuids) {
    const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        std::string id = Card::generateID();
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 200u);
}

TEST(CardTest, StateInvariants) {
    Card c("gato", "cat");
    c.review_count = 2;
    c.consecutive_correct = 2;
    EXPECT_TRUE(c.hasValidState());

    c.consecutive_correct = 3;
    EXPECT_FALSE(c.hasValidState());

    c.consecutive_correct = 0;
    c.difficulty = 6;
    EXPECT_FALSE(c.hasValidState());
    c.difficulty = 0;
    EXPECT_FALSE(c.hasValidState());
}

TEST(CardTest, MasteredAfterThreeConsecutiveCorrect) {
    Card c("casa", "house");
    c.review_count = 5;
    c.consecutive_correct = 2;
    EXPECT_FALSE(c.isMastered());
    c.consecutive_correct = 3;
    EXPECT_TRUE(c.isMastered());
}

TEST(DeckTest, DueCardCountCountsOnlyPastOrNow) {
    Deck d("Spanish Basics", "Spanish", "English", T0);
    d.cards.emplace_back("uno", "one", 3, std::nullopt, T0);
    d.cards.emplace_back("dos", "two", 3, std::nullopt, T0);
    d.cards.emplace_back("tres", "three", 3, std::nullopt, T0);

    d.cards[0].next_review = T0 - DAY;
    d.cards[1].next_review = T0 + DAY;
    d.cards[2].next_review = T0 + 3 * DAY;

    EXPECT_EQ(d.dueCardCount(T0), 1u);
    ASSERT_EQ(d.dueCards(T0).size(), 1u);
    EXPECT_EQ(d.dueCards(T0)[0].front, "uno");
}

TEST(DeckTest, FindCardByIdOrThrow) {
    Deck d("French", "French", "English", T0);
    d.cards.emplace_back("chien", "dog");
    d.cards.emplace_back("chat", "cat");

    const std::string id = d.cards[1].id;
    EXPECT_EQ(d.findCard(id).front, "chat");
    EXPECT_TRUE(d.hasCard(id));

    EXPECT_THROW(d.findCard("no-such-card"), NotFoundError);
    EXPECT_FALSE(d.hasCard("no-such-card"));
}

TEST(DeckTest, NewCardsAreTheNeverReviewedOnes) {
    Deck d("German", "German", "English", T0);
    d.cards.emplace_back("Hund", "dog");
    d.cards.emplace_back("Katze", "cat");
    d.cards[0].review_count = 1;

    auto fresh = d.newCards();
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0].front, "Katze");
}

TEST(DeckTest, StatsForEmptyDeckAreZero) {
    Deck d("Empty", "Italian", "English", T0);
    DeckStats s = d.stats(T0);

    EXPECT_EQ(s.total_cards, 0u);
    EXPECT_EQ(s.mastered_cards, 0u);
    EXPECT_DOUBLE_EQ(s.mastery_percentage, 0.0);
    for (double p : s.difficulty_percentages) EXPECT_DOUBLE_EQ(p, 0.0);
    EXPECT_FALSE(s.last_studied.has_value());
}

TEST(DeckTest, StatsDistributionAndMastery) {
    Deck d("Japanese", "Japanese", "English", T0);
    d.cards.emplace_back("inu", "dog", 1, std::nullopt, T0);
    d.cards.emplace_back("neko", "cat", 1, std::nullopt, T0);
    d.cards.emplace_back("tori", "bird", 3, std::nullopt, T0);
    d.cards.emplace_back("sakana", "fish", 5, std::nullopt, T0);
    d.cards[0].review_count = 4;
    d.cards[0].consecutive_correct = 3;
    d.cards[3].next_review = T0 + DAY;
    d.last_studied = T0 - 60;

    DeckStats s = d.stats(T0);
    EXPECT_EQ(s.total_cards, 4u);
    EXPECT_EQ(s.difficulty_counts[0], 2u);
    EXPECT_EQ(s.difficulty_counts[1], 0u);
    EXPECT_EQ(s.difficulty_counts[2], 1u);
    EXPECT_EQ(s.difficulty_counts[4], 1u);
    EXPECT_DOUBLE_EQ(s.difficulty_percentages[0], 50.0);
    EXPECT_DOUBLE_EQ(s.difficulty_percentages[2], 25.0);
    EXPECT_EQ(s.mastered_cards, 1u);
    EXPECT_DOUBLE_EQ(s.mastery_percentage, 25.0);
    EXPECT_EQ(s.due_cards, 3u);
    EXPECT_EQ(s.last_studied, std::optional<std::time_t>(T0 - 60));
}
