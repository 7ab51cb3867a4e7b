#pragma once
#include "../tool.hpp"

namespace ptrnotes {

class AddNoteTool : public NoteTool {
public:
    ToolResult execute(const nlohmann::json& args) override;
    std::string tool_name() const override { return "add_note"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace ptrnotes
