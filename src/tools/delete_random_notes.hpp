#pragma once
#include "../tool.hpp"

namespace ptrnotes {

class DeleteRandomNotesTool : public NoteTool {
public:
    ToolResult execute(const nlohmann::json& args) override;
    std::string tool_name() const override { return "delete_random_notes"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace ptrnotes
