#include "Card.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>
#include <array>
#include <cstdio>
#include <utility>

Card::Card(const std::string& f, const std::string& b, int diff,
    std::optional<std::string> n, std::time_t created)
    : front(f), back(b), notes(std::move(n)), difficulty(diff)
{
    id = generateID();
    next_review = created; // new cards are due immediately
    spdlog::debug("Created Card: ID={}, front='{}', difficulty={}", id, front, difficulty);
}

bool Card::hasValidState() const {
    if (!isValidDifficulty(difficulty)) return false;
    if (review_count < 0 || consecutive_correct < 0) return false;
    return consecutive_correct <= review_count;
}

bool Card::operator==(const Card& other) const {
    return id == other.id
        && front == other.front
        && back == other.back
        && notes == other.notes
        && difficulty == other.difficulty
        && next_review == other.next_review
        && review_count == other.review_count
        && consecutive_correct == other.consecutive_correct
        && last_reviewed == other.last_reviewed;
}

// Random (version 4) UUID, lower-case canonical form
std::string Card::generateID() {
    std::array<unsigned char, 16> bytes{};
    randombytes_buf(bytes.data(), bytes.size());

    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char out[37];
    std::snprintf(out, sizeof(out),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3],
        bytes[4], bytes[5],
        bytes[6], bytes[7],
        bytes[8], bytes[9],
        bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(out);
}
