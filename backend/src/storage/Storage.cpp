#include "Storage.hpp"
#include "../core/Errors.hpp"
#include "../utils/TimeUtils.hpp"
#include <cstdint>
#include <filesystem>
#include <limits>
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;
namespace fs = std::filesystem;

static const char TMP_SUFFIX[] = ".tmp";

Storage::Storage(const std::string& dataFile)
    : dataFilePath(dataFile)
{
    spdlog::info("Storage initialized with data file '{}'", dataFilePath);
}

/*
  JSON -> model helpers. Every mismatch is reported as CorruptDataError
  naming the offending key.
*/
static const json& requireKey(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw CorruptDataError(std::string("missing field '") + key + "'");
    }
    return *it;
}

static std::string readString(const json& obj, const char* key) {
    const json& v = requireKey(obj, key);
    if (!v.is_string()) {
        throw CorruptDataError(std::string("expected string for field '") + key + "'");
    }
    return v.get<std::string>();
}

static int readInt(const json& obj, const char* key) {
    const json& v = requireKey(obj, key);
    if (!v.is_number_integer()) {
        throw CorruptDataError(std::string("expected integer for field '") + key + "'");
    }
    // unsigned values above INT64_MAX would wrap in get<int64_t>
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw CorruptDataError(std::string("integer out of range for field '") + key + "'");
    }
    const std::int64_t wide = v.get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw CorruptDataError(std::string("integer out of range for field '") + key + "'");
    }
    return static_cast<int>(wide);
}

static std::time_t readTime(const json& obj, const char* key) {
    auto t = TimeUtils::fromIso8601(readString(obj, key));
    if (!t) {
        throw CorruptDataError(std::string("invalid timestamp in field '") + key + "'");
    }
    return *t;
}

static std::optional<std::string> readOptionalString(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    return readString(obj, key);
}

static std::optional<std::time_t> readOptionalTime(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    return readTime(obj, key);
}

static Card cardFromJson(const json& j) {
    if (!j.is_object()) throw CorruptDataError("card entry is not an object");

    Card c;
    c.id = readString(j, "id");
    c.front = readString(j, "front");
    c.back = readString(j, "back");
    c.difficulty = readInt(j, "difficulty");
    c.next_review = readTime(j, "nextReviewDate");
    c.review_count = readInt(j, "reviewCount");
    c.consecutive_correct = readInt(j, "consecutiveCorrect");
    c.last_reviewed = readOptionalTime(j, "lastReviewed");
    c.notes = readOptionalString(j, "notes");

    if (c.id.empty()) throw CorruptDataError("card with empty id");
    if (!c.hasValidState()) {
        throw CorruptDataError("card '" + c.id + "' violates difficulty/counter invariants");
    }
    return c;
}

static Deck deckFromJson(const json& j) {
    if (!j.is_object()) throw CorruptDataError("deck entry is not an object");

    Deck d;
    d.id = readString(j, "id");
    d.name = readString(j, "name");
    d.target_language = readString(j, "targetLanguage");
    d.native_language = readString(j, "nativeLanguage");
    d.created_at = readTime(j, "createdAt");
    d.last_studied = readOptionalTime(j, "lastStudied");

    const json& cards = requireKey(j, "cards");
    if (!cards.is_array()) throw CorruptDataError("expected array for field 'cards'");
    d.cards.reserve(cards.size());
    for (const auto& c : cards) {
        d.cards.push_back(cardFromJson(c));
    }

    if (d.id.empty()) throw CorruptDataError("deck with empty id");
    return d;
}

static json cardToJson(const Card& c) {
    json j = {
        {"id", c.id},
        {"front", c.front},
        {"back", c.back},
        {"difficulty", c.difficulty},
        {"nextReviewDate", TimeUtils::toIso8601(c.next_review)},
        {"reviewCount", c.review_count},
        {"consecutiveCorrect", c.consecutive_correct}
    };
    if (c.last_reviewed) j["lastReviewed"] = TimeUtils::toIso8601(*c.last_reviewed);
    if (c.notes) j["notes"] = *c.notes;
    return j;
}

static json deckToJson(const Deck& d) {
    json cards = json::array();
    for (const auto& c : d.cards) cards.push_back(cardToJson(c));

    json j = {
        {"id", d.id},
        {"name", d.name},
        {"targetLanguage", d.target_language},
        {"nativeLanguage", d.native_language},
        {"cards", std::move(cards)},
        {"createdAt", TimeUtils::toIso8601(d.created_at)}
    };
    if (d.last_studied) j["lastStudied"] = TimeUtils::toIso8601(*d.last_studied);
    return j;
}

std::string Storage::serialize(const std::vector<Deck>& decks) {
    json doc = json::array();
    for (const auto& d : decks) doc.push_back(deckToJson(d));
    return doc.dump(2);
}

std::vector<Deck> Storage::parse(const std::string& document) {
    json doc;
    try {
        doc = json::parse(document);
    }
    catch (const json::parse_error& e) {
        throw CorruptDataError(std::string("document is not valid JSON: ") + e.what());
    }

    if (!doc.is_array()) throw CorruptDataError("document root is not an array");

    std::vector<Deck> decks;
    decks.reserve(doc.size());
    for (const auto& d : doc) {
        decks.push_back(deckFromJson(d));
    }
    return decks;
}

std::optional<std::vector<Deck>> Storage::load() const {
    spdlog::info("Loading decks from '{}'", dataFilePath);

    std::error_code ec;
    if (!fs::exists(dataFilePath, ec)) {
        spdlog::info("Data file '{}' not found; starting with no decks", dataFilePath);
        return std::nullopt;
    }

    std::ifstream in(dataFilePath, std::ios::binary);
    if (!in) {
        spdlog::error("Failed to open '{}' for reading", dataFilePath);
        throw CorruptDataError("cannot open '" + dataFilePath + "' for reading");
    }

    std::ostringstream oss;
    oss << in.rdbuf();

    std::vector<Deck> decks;
    try {
        decks = parse(oss.str());
    }
    catch (const CorruptDataError& e) {
        spdlog::error("Data file '{}' is corrupt: {}", dataFilePath, e.what());
        throw;
    }

    spdlog::info("Loaded {} decks", decks.size());
    return decks;
}

void Storage::save(const std::vector<Deck>& decks) const {
    spdlog::debug("Saving {} decks to '{}'", decks.size(), dataFilePath);

    std::string document;
    try {
        document = serialize(decks);
    }
    catch (const json::exception& e) {
        spdlog::error("Failed to encode decks for '{}': {}", dataFilePath, e.what());
        throw PersistenceWriteError(std::string("cannot encode decks: ") + e.what());
    }

    const fs::path target(dataFilePath);
    const fs::path tmp(dataFilePath + TMP_SUFFIX);
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create directory '{}': {}", target.parent_path().string(), ec.message());
            throw PersistenceWriteError("cannot create directory for '" + dataFilePath + "': " + ec.message());
        }
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing", tmp.string());
            throw PersistenceWriteError("cannot open '" + tmp.string() + "' for writing");
        }
        out << document;
        out.flush();
        if (!out) {
            spdlog::error("Write to '{}' failed", tmp.string());
            out.close();
            fs::remove(tmp, ec);
            throw PersistenceWriteError("write to '" + tmp.string() + "' failed");
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        spdlog::error("Failed to replace '{}': {}", dataFilePath, ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw PersistenceWriteError("cannot replace '" + dataFilePath + "': " + ec.message());
    }

    spdlog::info("Saved {} decks to '{}'", decks.size(), dataFilePath);
}
