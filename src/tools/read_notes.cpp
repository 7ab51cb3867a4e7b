#include "read_notes.hpp"
#include "../note_store.hpp"
#include <nlohmann/json.hpp>

namespace ptrnotes {

// Takes no parameters; whatever arguments arrive are ignored.
ToolResult ReadNotesTool::execute(const nlohmann::json& /*args*/) {
    if (!store_) return ToolResult{false, "Note store is not available", nullptr};

    auto notes = store_->list();

    nlohmann::json items = nlohmann::json::array();
    for (const auto& note : notes) {
        items.push_back(note_to_json(note));
    }
    nlohmann::json data = {{"notes", std::move(items)}};

    if (notes.empty()) {
        return ToolResult{true, "No notes yet.", std::move(data)};
    }

    std::string output = std::to_string(notes.size()) +
                         (notes.size() == 1 ? " note:\n" : " notes:\n");
    for (const auto& note : notes) {
        output += "- [" + std::to_string(note.id) + "] " + note.text + "\n";
    }
    return ToolResult{true, output, std::move(data)};
}

std::string ReadNotesTool::description() const {
    return "List all notes in the order they were added";
}

std::string ReadNotesTool::parameters_json() const {
    return R"({"type":"object","properties":{}})";
}

} // namespace ptrnotes
