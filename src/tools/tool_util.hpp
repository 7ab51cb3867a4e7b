#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace ptrnotes {

// Note tool preamble: check the store is wired and arguments are an object.
inline std::optional<ToolResult> check_note_tool_args(
    const NoteStore* store, const nlohmann::json& args) {
    if (!store) return ToolResult{false, "Note store is not available", nullptr};
    if (!args.is_null() && !args.is_object()) {
        return ToolResult{false, "Arguments must be a JSON object", nullptr};
    }
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.is_object() || !args.contains(field)) {
        return ToolResult{false, std::string("Missing required parameter: ") + field, nullptr};
    }
    if (!args[field].is_string()) {
        return ToolResult{false, std::string("Parameter '") + field + "' must be a string", nullptr};
    }
    return std::nullopt;
}

// Check that a required field is a non-negative integer. Floats with a
// fractional part, strings and booleans are rejected.
inline std::optional<ToolResult> require_non_negative_integer(const nlohmann::json& args,
                                                              const char* field) {
    if (!args.is_object() || !args.contains(field)) {
        return ToolResult{false, std::string("Missing required parameter: ") + field, nullptr};
    }
    const auto& v = args[field];
    if (!v.is_number_integer()) {
        return ToolResult{false, std::string("Parameter '") + field + "' must be an integer", nullptr};
    }
    if (v.is_number_unsigned()) return std::nullopt;
    if (v.get<int64_t>() < 0) {
        return ToolResult{false, std::string("Parameter '") + field + "' must be non-negative", nullptr};
    }
    return std::nullopt;
}

} // namespace ptrnotes
