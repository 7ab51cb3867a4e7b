#pragma once
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace ptrnotes {

class NoteStore; // forward declaration

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output;
    nlohmann::json data; // structured result, null on failure
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const nlohmann::json& args) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Base class for tools operating on the note store.
// The store must outlive the tool.
class NoteTool : public Tool {
public:
    void set_store(NoteStore* store) { store_ = store; }

protected:
    NoteStore* store_ = nullptr;
};

// Create the note tools, all bound to `store`.
std::vector<std::unique_ptr<Tool>> create_note_tools(NoteStore& store);

} // namespace ptrnotes
