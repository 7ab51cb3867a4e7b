#include "delete_random_notes.hpp"
#include "tool_util.hpp"
#include "../note_store.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>

namespace ptrnotes {

ToolResult DeleteRandomNotesTool::execute(const nlohmann::json& args) {
    if (auto err = check_note_tool_args(store_, args)) return *err;
    if (auto err = require_non_negative_integer(args, "count")) return *err;

    // Counts beyond int64 range clamp like any count >= size.
    const auto& v = args["count"];
    int64_t count = INT64_MAX;
    if (!v.is_number_unsigned() || v.get<uint64_t>() <= static_cast<uint64_t>(INT64_MAX)) {
        count = v.get<int64_t>();
    }

    std::vector<Note> deleted;
    try {
        deleted = store_->delete_random(count);
    } catch (const InvalidArgument& e) {
        return ToolResult{false, e.what(), nullptr};
    }

    nlohmann::json items = nlohmann::json::array();
    for (const auto& note : deleted) {
        items.push_back(note_to_json(note));
    }
    nlohmann::json data = {{"deleted", std::move(items)}};

    if (deleted.empty()) {
        return ToolResult{true, "No notes deleted.", std::move(data)};
    }

    std::string output = "Deleted " + std::to_string(deleted.size()) +
                         (deleted.size() == 1 ? " note:\n" : " notes:\n");
    for (const auto& note : deleted) {
        output += "- [" + std::to_string(note.id) + "] " + note.text + "\n";
    }
    return ToolResult{true, output, std::move(data)};
}

std::string DeleteRandomNotesTool::description() const {
    return "Delete the given number of notes chosen at random. "
           "Deletes all notes if fewer than count exist";
}

std::string DeleteRandomNotesTool::parameters_json() const {
    return R"({"type":"object","properties":{"count":{"type":"integer","minimum":0,"description":"How many notes to delete"}},"required":["count"]})";
}

} // namespace ptrnotes
