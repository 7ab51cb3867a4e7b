#include "tool.hpp"
#include "tools/add_note.hpp"
#include "tools/read_notes.hpp"
#include "tools/delete_random_notes.hpp"

namespace ptrnotes {

std::vector<std::unique_ptr<Tool>> create_note_tools(NoteStore& store) {
    std::vector<std::unique_ptr<NoteTool>> note_tools;
    note_tools.push_back(std::make_unique<AddNoteTool>());
    note_tools.push_back(std::make_unique<ReadNotesTool>());
    note_tools.push_back(std::make_unique<DeleteRandomNotesTool>());

    std::vector<std::unique_ptr<Tool>> tools;
    for (auto& t : note_tools) {
        t->set_store(&store);
        tools.push_back(std::move(t));
    }
    return tools;
}

} // namespace ptrnotes
