#include "voicelive_bridge/tools/registry.hpp"

#include <stdexcept>

namespace voicelive_bridge {
namespace tools {

void ToolRegistry::add(ToolDefinition definition, ToolHandler handler) {
    if (definition.name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("tool handler missing: " + definition.name);
    }
    const auto name = definition.name;
    const auto inserted =
        entries_.emplace(name, Entry{std::move(definition), std::move(handler)}).second;
    if (!inserted) {
        throw std::invalid_argument("tool already registered: " + name);
    }
}

const ToolRegistry::Entry* ToolRegistry::find(const std::string& name) const {
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<ToolDefinition> ToolRegistry::definitions() const {
    std::vector<ToolDefinition> result;
    result.reserve(entries_.size());
    for (const auto& item : entries_) {
        result.push_back(item.second.definition);
    }
    return result;
}

}
}
