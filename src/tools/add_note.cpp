#include "add_note.hpp"
#include "tool_util.hpp"
#include "../note_store.hpp"
#include <nlohmann/json.hpp>

namespace ptrnotes {

ToolResult AddNoteTool::execute(const nlohmann::json& args) {
    if (auto err = check_note_tool_args(store_, args)) return *err;
    if (auto err = require_string(args, "text")) return *err;

    std::string text = args["text"].get<std::string>();

    Note note;
    try {
        note = store_->add(text);
    } catch (const InvalidArgument& e) {
        return ToolResult{false, e.what(), nullptr};
    }

    nlohmann::json data = {{"id", note.id}, {"text", note.text}};
    return ToolResult{true, "Added note " + std::to_string(note.id) + ": " + note.text,
                      std::move(data)};
}

std::string AddNoteTool::description() const {
    return "Add a new note with the given text";
}

std::string AddNoteTool::parameters_json() const {
    return R"json({"type":"object","properties":{"text":{"type":"string","description":"The note content (must not be empty)"}},"required":["text"]})json";
}

} // namespace ptrnotes
