#pragma once

#include <string>
#include <unordered_map>

namespace pyrunner::agent::tools {

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

// Parameters arrive as strings; non-string JSON values (arrays, numbers) are
// passed as their JSON text.
class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual std::string Execute(const std::unordered_map<std::string, std::string>& params) = 0;
};

}  // namespace pyrunner::agent::tools
