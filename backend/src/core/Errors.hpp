#pragma once
#include <stdexcept>
#include <string>

// Error kinds raised by the deck/card operations. None of them is fatal:
// callers log or report them and continue with the in-memory state.
class LexideckError : public std::runtime_error {
public:
    explicit LexideckError(const std::string& what) : std::runtime_error(what) {}
};

// Empty required field, or difficulty / rating / position out of range.
class ValidationError : public LexideckError {
public:
    explicit ValidationError(const std::string& what) : LexideckError(what) {}
};

// Unknown deck or card id.
class NotFoundError : public LexideckError {
public:
    explicit NotFoundError(const std::string& what) : LexideckError(what) {}
};

// Persisted document exists but does not match the deck schema.
class CorruptDataError : public LexideckError {
public:
    explicit CorruptDataError(const std::string& what) : LexideckError(what) {}
};

class PersistenceWriteError : public LexideckError {
public:
    explicit PersistenceWriteError(const std::string& what) : LexideckError(what) {}
};

// No writable storage location could be resolved at startup.
class ConfigError : public LexideckError {
public:
    explicit ConfigError(const std::string& what) : LexideckError(what) {}
};
