#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <algorithm>
#include <cstdio>
#include <cctype>
#include <optional>

#include "../utils/logging.hpp"
#include "../utils/TimeUtils.hpp"
#include "../config/Config.hpp"
#include "../core/Errors.hpp"
#include "../core/LearningSystem.hpp"
#include "../core/SessionRunner.hpp"
#include "../storage/Storage.hpp"

struct Args {
    AppConfig overrides;
    std::optional<std::string> config_path;
};

static void printUsage() {
    std::cout << "Usage: lexideck [options]\n"
              << "      --data <path>        Deck file (default $XDG_DATA_HOME/lexideck/decks.json)\n"
              << "      --config <path>      Config file (default $XDG_CONFIG_HOME/lexideck/lexideck.conf)\n"
              << "      --log-level <level>  trace|debug|info|warn|error|critical|off (default warn)\n"
              << "      --log-file <path>    Write log records to a file instead of stderr\n"
              << "  -h, --help               Show this help\n";
}

static std::optional<Args> parseArgs(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      (s == "--data" && i + 1 < argc) a.overrides.data_path = argv[++i];
        else if (s == "--config" && i + 1 < argc) a.config_path = argv[++i];
        else if (s == "--log-level" && i + 1 < argc) a.overrides.log_level = argv[++i];
        else if (s == "--log-file" && i + 1 < argc) a.overrides.log_file = argv[++i];
        else if (s == "--help" || s == "-h") {
            printUsage();
            return std::nullopt;
        }
        else {
            std::cerr << "Unknown option: " << s << "\n";
            printUsage();
            return std::nullopt;
        }
    }
    return a;
}

static std::string readLine() {
    std::string line;
    if (!std::getline(std::cin, line)) return "";
    return line;
}

static std::optional<int> parseInt(const std::string& s) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

static bool askYesNo(const std::string& question) {
    std::cout << question << " (y/n): ";
    std::string in = readLine();
    std::transform(in.begin(), in.end(), in.begin(), [](unsigned char c) { return std::tolower(c); });
    return in == "y" || in == "yes";
}

static std::string formatPercent(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", v);
    return buf;
}

// Console side of a study session
class ConsolePrompter : public ReviewPrompter {
public:
    void sessionStarted(const StudySession& session, std::size_t cardCount) override {
        std::cout << "\nStudy session started for '" << session.deck.name << "'\n"
            << "Cards to review: " << cardCount << "\n"
            << "Press Enter to begin...";
        readLine();
    }

    std::string askAnswer(const Deck& deck, const Card& card) override {
        std::cout << "\n------------------------------------------------\n"
            << deck.native_language << ": " << card.back << "\n"
            << "\nWrite the word in " << deck.target_language << ": ";
        return readLine();
    }

    int askRating(const Deck& deck, const Card& card, bool exactMatch) override {
        (void)deck;
        std::cout << "\nCorrect answer: " << card.front << "\n"
            << (exactMatch ? "Correct!" : "Not quite right.") << "\n";

        if (card.notes && !card.notes->empty())
            std::cout << "Notes: " << *card.notes << "\n";

        std::cout << "\nHow well did you do? (0-5)\n"
            " 0: Completely wrong\n"
            " 1: Mostly wrong\n"
            " 2: Partially correct\n"
            " 3: Mostly correct with mistakes\n"
            " 4: Almost perfect\n"
            " 5: Perfect\n"
            "Your rating: ";

        auto rating = parseInt(readLine());
        if (rating && Scheduler::isValidRating(*rating)) return *rating;
        return 3; // default middle value
    }

    void cardReviewed(const StudySession& session, std::size_t total) override {
        std::cout << "\nProgress: " << session.cards_reviewed << "/" << total << " cards reviewed\n";
    }
};

static void listDecks(const LearningSystem& sys) {
    std::cout << "\n===== YOUR DECKS =====\n";

    const auto& decks = sys.getDecks();
    if (decks.empty()) {
        std::cout << "You don't have any decks yet. Create one to get started!\n";
        return;
    }

    const std::time_t now = sys.now();
    for (size_t i = 0; i < decks.size(); i++) {
        const Deck& d = decks[i];
        std::cout << i + 1 << ". " << d.name << " (" << d.target_language << " / " << d.native_language << ")\n"
            << "   Total cards: " << d.cards.size() << ", Due for review: " << d.dueCardCount(now) << "\n";

        if (d.last_studied)
            std::cout << "   Last studied: " << TimeUtils::formatLocal(*d.last_studied) << "\n";
        else
            std::cout << "   Not studied yet\n";
        std::cout << "\n";
    }
}

// Returns the deck id picked by the user, empty on invalid input
static std::optional<std::string> chooseDeck(const LearningSystem& sys, const std::string& prompt) {
    listDecks(sys);
    std::cout << prompt << " (enter number): ";

    auto sel = parseInt(readLine());
    try {
        return sys.deckAt(sel.value_or(0)).id;
    }
    catch (const ValidationError&) {
        std::cout << "Invalid deck selection.\n";
        return std::nullopt;
    }
}

static void createDeck(LearningSystem& sys) {
    std::cout << "\n===== CREATE NEW DECK =====\n";

    std::cout << "Enter deck name: ";
    std::string name = readLine();
    if (name.empty()) { std::cout << "Deck name cannot be empty.\n"; return; }

    std::cout << "Enter target language: ";
    std::string target = readLine();
    if (target.empty()) { std::cout << "Target language cannot be empty.\n"; return; }

    std::cout << "Enter your native language: ";
    std::string native = readLine();
    if (native.empty()) { std::cout << "Native language cannot be empty.\n"; return; }

    const Deck& d = sys.createDeck(name, target, native);
    std::cout << "\nDeck '" << d.name << "' has been created!\n";
}

static void addCards(LearningSystem& sys) {
    if (sys.getDecks().empty()) { std::cout << "\nYou need to create a deck first!\n"; return; }

    std::cout << "\n===== ADD CARDS TO DECK =====\n";
    auto deckId = chooseDeck(sys, "Select deck");
    if (!deckId) return;

    const Deck& deck = sys.getDeck(*deckId);
    const std::string deckName = deck.name;
    const std::string target = deck.target_language;
    const std::string native = deck.native_language;
    std::cout << "\nAdding cards to '" << deckName << "'\n";

    bool adding = true;
    while (adding) {
        std::cout << "\nEnter word or phrase in " << target << ": ";
        std::string front = readLine();
        if (!std::cin) return;
        if (front.empty()) { std::cout << "Word/phrase cannot be empty.\n"; continue; }

        std::cout << "Enter translation in " << native << ": ";
        std::string back = readLine();
        if (back.empty()) { std::cout << "Translation cannot be empty.\n"; continue; }

        std::cout << "Enter difficulty level (1-5, where 1 is easiest, default is 3): ";
        auto diff = parseInt(readLine());
        int difficulty = (diff && Card::isValidDifficulty(*diff)) ? *diff : Card::DEFAULT_DIFFICULTY;

        std::cout << "Enter any notes (optional): ";
        std::string notes = readLine();

        sys.addCard(*deckId, front, back, difficulty,
            notes.empty() ? std::nullopt : std::optional<std::string>(notes));
        std::cout << "Card has been added!\n";

        adding = askYesNo("\nAdd another card?");
    }
}

static void studyDeck(LearningSystem& sys) {
    if (sys.getDecks().empty()) { std::cout << "\nYou need to create a deck first!\n"; return; }

    std::cout << "\n===== STUDY DECK =====\n";
    auto deckId = chooseDeck(sys, "Select deck to study");
    if (!deckId) return;

    ConsolePrompter prompter;
    SessionRunner runner(sys, prompter);

    auto cards = runner.selectCards(*deckId, false);
    if (cards.empty()) {
        std::cout << "\nNo cards are due for review in this deck!\n";
        if (!askYesNo("Would you like to study new cards?")) return;

        cards = runner.selectCards(*deckId, true);
        if (cards.empty()) {
            std::cout << "\nNo new cards available. Add some cards first!\n";
            return;
        }
    }
    else {
        std::cout << "\nYou have " << cards.size() << " cards due for review!\n";
    }

    StudySession session = runner.run(*deckId, std::move(cards));

    std::cout << "\n===== SESSION SUMMARY =====\n"
        << "Cards reviewed: " << session.cards_reviewed << "\n"
        << "Correct responses: " << session.correct_responses << "\n"
        << "Accuracy: " << formatPercent(session.accuracyPercentage()) << "%\n";

    if (auto duration = session.duration()) {
        int secs = static_cast<int>(*duration);
        std::cout << "Time spent: " << secs / 60 << "m " << secs % 60 << "s\n";
    }

    if (sys.lastSaveError())
        std::cout << "Warning: progress could not be saved (" << *sys.lastSaveError() << ")\n";

    std::cout << "\nGreat job! Keep it up!\n";
}

static void showStatistics(const LearningSystem& sys) {
    const auto& decks = sys.getDecks();
    if (decks.empty()) { std::cout << "\nYou don't have any decks yet!\n"; return; }

    std::cout << "\n===== YOUR LEARNING STATISTICS =====\n";

    const std::time_t now = sys.now();
    for (size_t i = 0; i < decks.size(); i++) {
        const Deck& d = decks[i];
        DeckStats s = d.stats(now);

        std::cout << "\n" << i + 1 << ". " << d.name << " (" << d.target_language << ")\n"
            << "   Total cards: " << s.total_cards << "\n"
            << "   Difficulty distribution:\n";
        for (size_t lvl = 0; lvl < s.difficulty_counts.size(); ++lvl) {
            std::cout << "     Level " << lvl + 1 << ": " << s.difficulty_counts[lvl]
                << " cards (" << formatPercent(s.difficulty_percentages[lvl]) << "%)\n";
        }

        std::cout << "   Mastery progress: " << s.mastered_cards << "/" << s.total_cards
            << " cards (" << formatPercent(s.mastery_percentage) << "%)\n"
            << "   Cards due for review: " << s.due_cards << "\n";

        if (s.last_studied)
            std::cout << "   Last studied: " << TimeUtils::formatLocal(*s.last_studied, false) << "\n";
    }
}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    auto args = parseArgs(argc, argv);
    if (!args) return 0;

    // stderr until the configured logger is known, so config warnings stay out of the menu
    Log::init("warn");
    AppConfig cfg = load_config_file(args->config_path.value_or(default_config_path()));
    cfg = merge_config(cfg, args->overrides);

    if (!Log::init(cfg.log_level.value_or("warn"), cfg.log_file))
        std::cerr << "Warning: cannot open log file '" << *cfg.log_file << "', logging to stderr\n";

    std::string dataPath;
    try {
        dataPath = resolve_data_path(cfg);
    }
    catch (const ConfigError& e) {
        spdlog::critical("{}", e.what());
        std::cerr << "Cannot start: " << e.what() << "\n";
        return 1;
    }

    LearningSystem sys{Storage(dataPath)};
    if (!sys.loadDecks())
        std::cout << "Warning: saved data in '" << dataPath << "' could not be read; starting with no decks.\n";

    std::cout << "================================================\n"
                 "           LANGUAGE LEARNING TOOL\n"
                 "================================================\n";

    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "1. Create a new deck\n"
            "2. View all decks\n"
            "3. Add cards to a deck\n"
            "4. Study a deck\n"
            "5. View statistics\n"
            "6. Exit\n> ";

        std::string choice = readLine();
        if (!std::cin) break;

        try {
            if (choice == "1") createDeck(sys);
            else if (choice == "2") listDecks(sys);
            else if (choice == "3") addCards(sys);
            else if (choice == "4") studyDeck(sys);
            else if (choice == "5") showStatistics(sys);
            else if (choice == "6") {
                std::cout << "Goodbye! Good luck with your learning!\n";
                break;
            }
            else std::cout << "Invalid choice. Please try again.\n";
        }
        catch (const LexideckError& e) {
            std::cout << "Error: " << e.what() << "\n";
        }

        if (sys.lastSaveError())
            std::cout << "Warning: changes are not saved yet (" << *sys.lastSaveError() << ")\n";
    }

    return 0;
}
