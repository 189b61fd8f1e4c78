#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voicelive_bridge/tools/tool_call.hpp"

namespace voicelive_bridge {

namespace backend {
class ClientDirectory;
class Notifier;
}

namespace tools {

// Collaborators a handler may use. Shared by every call of the process.
struct ToolContext {
    std::shared_ptr<backend::ClientDirectory> directory;
    std::shared_ptr<backend::Notifier> notifier;
    std::string sender_email;
};

using ToolHandler =
    std::function<nlohmann::json(const nlohmann::json& arguments, const ToolContext& context)>;

class ToolRegistry {
public:
    struct Entry {
        ToolDefinition definition;
        ToolHandler handler;
    };

    // Throws std::invalid_argument on an empty or duplicate name.
    void add(ToolDefinition definition, ToolHandler handler);
    const Entry* find(const std::string& name) const;
    std::vector<ToolDefinition> definitions() const;
    size_t size() const { return entries_.size(); }

private:
    std::map<std::string, Entry> entries_;
};

}
}
