#include "voicelive_bridge/tools/customer_tools.hpp"

#include "voicelive_bridge/backend/directory.hpp"
#include "voicelive_bridge/backend/notifier.hpp"
#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/utils/ids.hpp"

namespace voicelive_bridge {
namespace tools {

namespace {

std::string require_string(const nlohmann::json& arguments, const char* key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_string()) {
        throw ToolError(ToolErrorCode::InvalidArguments,
                        std::string(key) + " must be a string");
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        throw ToolError(ToolErrorCode::InvalidArguments, std::string(key) + " is empty");
    }
    return value;
}

backend::ClientDirectory& directory_of(const ToolContext& context) {
    if (!context.directory) {
        throw ToolError(ToolErrorCode::HandlerFailed, "client directory is not configured");
    }
    return *context.directory;
}

nlohmann::json string_schema(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

}

std::string html_escape(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (const char ch : text) {
        switch (ch) {
            case '&':
                result += "&amp;";
                break;
            case '<':
                result += "&lt;";
                break;
            case '>':
                result += "&gt;";
                break;
            case '"':
                result += "&quot;";
                break;
            case '\'':
                result += "&#39;";
                break;
            default:
                result += ch;
        }
    }
    return result;
}

std::string render_summary_email(const SummaryEmailFields& fields) {
    const auto name = html_escape(fields.recipient_name);
    std::string summary;
    for (const char ch : html_escape(fields.conversation_summary)) {
        if (ch == '\n') {
            summary += "<br>";
        } else {
            summary += ch;
        }
    }

    std::string html;
    html += "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n";
    html += "    <meta charset=\"UTF-8\">\n";
    html += "    <title>Conversation Summary " + html_escape(fields.case_id) + "</title>\n";
    html += "</head>\n";
    html += "<body style=\"font-family: Arial, sans-serif; color: #333; line-height: 1.6;\">\n";
    html += "    <p>Dear <strong>" + name + "</strong>,</p>\n";
    html += "    <p>Thank you for contacting us. Here is a summary of our conversation "
            "today for your reference.</p>\n";
    html += "    <h3 style=\"color: #005f75;\">Client Details:</h3>\n    <ul>\n";
    html += "        <li><strong>Client ID:</strong> " + html_escape(fields.client_id) +
            "</li>\n";
    html += "        <li><strong>Name:</strong> " + name + "</li>\n";
    html += "        <li><strong>Email:</strong> " + html_escape(fields.recipient_email) +
            "</li>\n";
    html += "    </ul>\n";
    html += "    <h3 style=\"color: #005f75;\">Conversation Summary:</h3>\n";
    html += "    <div style=\"background-color: #f9f9f9; padding: 15px; "
            "border-left: 4px solid #005f75;\">\n";
    html += "        " + summary + "\n    </div>\n";
    html += "    <p>If you have any additional questions, please contact us.</p>\n";
    html += "    <p>Best regards,<br><strong>The Support Team</strong></p>\n";
    html += "</body>\n</html>";
    return html;
}

nlohmann::json lookup_client(const nlohmann::json& arguments, const ToolContext& context) {
    const auto client_id = require_string(arguments, "client_id");
    const auto record = directory_of(context).lookup_client(client_id);
    if (!record) {
        throw ToolError(ToolErrorCode::HandlerFailed,
                        "Client with ID " + client_id + " not found");
    }

    auto products = nlohmann::json::array();
    for (const auto& product : record->products) {
        products.push_back({{"name", product.name}, {"type", product.type}});
    }
    auto open_cases = nlohmann::json::array();
    for (const auto& support_case : record->open_cases) {
        if (support_case.status != "open" && support_case.status != "in_progress") {
            continue;
        }
        open_cases.push_back({{"id", support_case.id},
                              {"description", support_case.description},
                              {"status", support_case.status},
                              {"created_date", support_case.created_date}});
    }
    info("Client looked up",
         {kv("client_id", client_id),
          kv("products", products.size()),
          kv("open_cases", open_cases.size())});
    return {{"client_id", client_id},
            {"client_name", record->name},
            {"products", std::move(products)},
            {"open_cases", std::move(open_cases)}};
}

nlohmann::json create_support_case(const nlohmann::json& arguments,
                                   const ToolContext& context) {
    const auto client_id = require_string(arguments, "client_id");
    const auto description = require_string(arguments, "description");
    auto& directory = directory_of(context);

    const auto record = directory.lookup_client(client_id);
    if (!record) {
        throw ToolError(ToolErrorCode::HandlerFailed,
                        "Client with ID " + client_id + " not found");
    }
    const auto case_id = directory.create_support_case(client_id, description);
    info("Support case created", {kv("client_id", client_id), kv("case_id", case_id)});
    return {{"case_id", case_id},
            {"client_name", record->name},
            {"description", description},
            {"status", "open"},
            {"message",
             "Support case #" + case_id + " created successfully for " + record->name}};
}

nlohmann::json send_conversation_summary(const nlohmann::json& arguments,
                                         const ToolContext& context) {
    const auto client_id = require_string(arguments, "client_id");
    const auto summary = require_string(arguments, "conversation_summary");
    if (!context.notifier) {
        throw ToolError(ToolErrorCode::HandlerFailed, "notifier is not configured");
    }

    const auto record = directory_of(context).lookup_client(client_id);
    if (!record || record->email.empty()) {
        throw ToolError(ToolErrorCode::HandlerFailed,
                        "Client with ID " + client_id + " not found or no email registered");
    }

    SummaryEmailFields fields;
    fields.case_id = utils::make_uuid().substr(0, 13);
    fields.client_id = client_id;
    fields.recipient_name = record->name;
    fields.recipient_email = record->email;
    fields.conversation_summary = summary;

    backend::EmailMessage message;
    message.sender = context.sender_email;
    message.recipient = record->email;
    message.subject = "Conversation Summary " + fields.case_id;
    message.html = render_summary_email(fields);

    const auto operation_id = context.notifier->send_summary_email(message);
    return {{"message",
             "Summary sent successfully to " + record->name + " (" + record->email + ")"},
            {"operation_id", operation_id.empty() ? std::string("pending") : operation_id},
            {"case_id", fields.case_id}};
}

void register_customer_tools(ToolRegistry& registry) {
    registry.add(
        {kLookupClient,
         "Returns the client name, contracted products and open support cases given "
         "their client ID.",
         {{"type", "object"},
          {"properties", {{"client_id", string_schema("Client ID.")}}},
          {"required", nlohmann::json::array({"client_id"})}}},
        &lookup_client);

    registry.add(
        {kCreateSupportCase,
         "Creates a new support case for a client.",
         {{"type", "object"},
          {"properties",
           {{"client_id", string_schema("Client ID.")},
            {"description",
             string_schema("Detailed description of the client's problem or request.")}}},
          {"required", nlohmann::json::array({"client_id", "description"})}}},
        &create_support_case);

    registry.add(
        {kSendConversationSummary,
         "Sends a conversation summary via email to the client. Only use with existing "
         "clients before ending the call.",
         {{"type", "object"},
          {"properties",
           {{"client_id", string_schema("Client ID.")},
            {"conversation_summary",
             string_schema("Detailed summary of the conversation, including reported "
                           "problem, proposed solution and agreed next steps.")}}},
          {"required", nlohmann::json::array({"client_id", "conversation_summary"})}}},
        &send_conversation_summary);
}

std::shared_ptr<const ToolRegistry> make_customer_tool_registry() {
    auto registry = std::make_shared<ToolRegistry>();
    register_customer_tools(*registry);
    return registry;
}

}
}
