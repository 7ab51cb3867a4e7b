#include "note_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace ptrnotes {

nlohmann::json note_to_json(const Note& note) {
    return {
        {"id", note.id},
        {"text", note.text},
        {"created_at", format_timestamp(note.created_at)}
    };
}

NoteStore::NoteStore(uint32_t max_text_length)
    : max_text_length_(max_text_length)
    , rng_(std::random_device{}())
{}

NoteStore::NoteStore(uint32_t max_text_length, uint32_t seed)
    : max_text_length_(max_text_length)
    , rng_(seed)
{}

void NoteStore::rebuild_index() {
    id_index_.clear();
    id_index_.reserve(notes_.size());
    for (size_t i = 0; i < notes_.size(); ++i) {
        id_index_[notes_[i].id] = i;
    }
}

Note NoteStore::add(const std::string& text) {
    if (text.empty()) {
        throw InvalidArgument("Note text must not be empty");
    }
    if (text.size() > max_text_length_) {
        throw InvalidArgument("Note text exceeds maximum length of " +
                              std::to_string(max_text_length_) + " bytes");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Note note;
    note.id = next_id_++;
    note.text = text;
    note.created_at = epoch_seconds();

    auto inserted = id_index_.emplace(note.id, notes_.size());
    if (!inserted.second) {
        // Ids come from a monotonic counter; a collision means the index is corrupt.
        std::cerr << "[store] Duplicate note id " << note.id << ", aborting\n";
        std::abort();
    }
    notes_.push_back(note);
    return note;
}

std::vector<Note> NoteStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_;
}

std::vector<Note> NoteStore::delete_random(int64_t count) {
    if (count < 0) {
        throw InvalidArgument("count must be a non-negative integer");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Note> removed;
    if (static_cast<uint64_t>(count) >= notes_.size()) {
        removed.swap(notes_);
        id_index_.clear();
        return removed;
    }

    // Partial Fisher-Yates: the first `count` slots end up holding a uniform
    // sample of indices without replacement.
    std::vector<size_t> indices(notes_.size());
    for (size_t i = 0; i < indices.size(); ++i) indices[i] = i;
    auto n = static_cast<size_t>(count);
    for (size_t i = 0; i < n; ++i) {
        std::uniform_int_distribution<size_t> dist(i, indices.size() - 1);
        std::swap(indices[i], indices[dist(rng_)]);
    }

    std::vector<bool> doomed(notes_.size(), false);
    removed.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        doomed[indices[i]] = true;
        removed.push_back(notes_[indices[i]]);
    }

    std::vector<Note> kept;
    kept.reserve(notes_.size() - n);
    for (size_t i = 0; i < notes_.size(); ++i) {
        if (!doomed[i]) kept.push_back(std::move(notes_[i]));
    }
    notes_.swap(kept);
    rebuild_index();
    return removed;
}

std::optional<Note> NoteStore::get(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = id_index_.find(id);
    if (it == id_index_.end()) return std::nullopt;
    return notes_[it->second];
}

size_t NoteStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_.size();
}

} // namespace ptrnotes
