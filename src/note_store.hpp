#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <mutex>
#include <random>
#include <stdexcept>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace ptrnotes {

struct Note {
    uint64_t id = 0;
    std::string text;
    uint64_t created_at = 0; // epoch seconds
};

// Caller-recoverable input error (empty text, negative count, ...).
class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// {"id", "text", "created_at"} with created_at as ISO 8601.
nlohmann::json note_to_json(const Note& note);

// In-memory, insertion-ordered note registry. All methods are thread-safe
// and each holds the store mutex for its whole duration.
// Notes live only as long as the store; nothing is persisted.
class NoteStore {
public:
    static constexpr uint32_t kDefaultMaxTextLength = 4096;

    explicit NoteStore(uint32_t max_text_length = kDefaultMaxTextLength);

    // Deterministic selection for tests.
    NoteStore(uint32_t max_text_length, uint32_t seed);

    // Append a note. Throws InvalidArgument if text is empty or longer than
    // max_text_length() bytes.
    Note add(const std::string& text);

    // Snapshot of all notes in insertion order.
    std::vector<Note> list() const;

    // Remove min(count, size()) notes chosen uniformly at random without
    // replacement and return them. Throws InvalidArgument if count < 0.
    std::vector<Note> delete_random(int64_t count);

    // Look up a single note by id.
    std::optional<Note> get(uint64_t id) const;

    size_t size() const;

    uint32_t max_text_length() const { return max_text_length_; }

private:
    void rebuild_index();

    uint32_t max_text_length_;
    std::vector<Note> notes_;
    std::unordered_map<uint64_t, size_t> id_index_; // id -> notes_ index
    uint64_t next_id_ = 1;
    std::mt19937 rng_;
    mutable std::mutex mutex_;
};

} // namespace ptrnotes
