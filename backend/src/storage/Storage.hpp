#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../core/Deck.hpp"

// Storage reads and writes the whole deck collection as one JSON document.
//
//   [ { "id", "name", "targetLanguage", "nativeLanguage", "createdAt",
//       "lastStudied"?, "cards": [ { "id", "front", "back", "difficulty",
//       "nextReviewDate", "reviewCount", "consecutiveCorrect",
//       "lastReviewed"?, "notes"? } ] } ]
//
// Timestamps are ISO-8601 UTC strings; optional keys are omitted when absent.
// save() writes "<file>.tmp" and renames it over the document, so readers see
// either the old or the new collection.
class Storage {
public:
    explicit Storage(const std::string& dataFile);

    // Empty when no document exists yet; throws CorruptDataError when the
    // document cannot be read into decks.
    std::optional<std::vector<Deck>> load() const;

    // Throws PersistenceWriteError.
    void save(const std::vector<Deck>& decks) const;

    const std::string& path() const { return dataFilePath; }

    // Exposed for tests
    static std::string serialize(const std::vector<Deck>& decks);
    static std::vector<Deck> parse(const std::string& document);

private:
    std::string dataFilePath;
};
