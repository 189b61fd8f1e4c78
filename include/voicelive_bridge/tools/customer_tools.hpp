#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "voicelive_bridge/tools/registry.hpp"

namespace voicelive_bridge {
namespace tools {

inline constexpr const char* kLookupClient = "lookup_client";
inline constexpr const char* kCreateSupportCase = "create_support_case";
inline constexpr const char* kSendConversationSummary = "send_conversation_summary";

struct SummaryEmailFields {
    std::string case_id;
    std::string client_id;
    std::string recipient_name;
    std::string recipient_email;
    std::string conversation_summary;
};

std::string html_escape(const std::string& text);
// Every field is HTML escaped; newlines of the summary become <br>.
std::string render_summary_email(const SummaryEmailFields& fields);

nlohmann::json lookup_client(const nlohmann::json& arguments, const ToolContext& context);
nlohmann::json create_support_case(const nlohmann::json& arguments,
                                   const ToolContext& context);
nlohmann::json send_conversation_summary(const nlohmann::json& arguments,
                                         const ToolContext& context);

void register_customer_tools(ToolRegistry& registry);
std::shared_ptr<const ToolRegistry> make_customer_tool_registry();

}
}
