#include "voicelive_bridge/backend/directory.hpp"

#include "voicelive_bridge/backend/client.hpp"
#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/utils/http.hpp"

namespace voicelive_bridge {
namespace backend {

namespace {

std::string string_field(const nlohmann::json& value, const char* key) {
    const auto it = value.find(key);
    if (it == value.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

}

ClientRecord client_record_from_json(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw BackendError("client record must be a JSON object");
    }
    ClientRecord record;
    record.client_id = string_field(value, "client_id");
    record.name = string_field(value, "name");
    record.email = string_field(value, "email");
    if (const auto products = value.find("products");
        products != value.end() && products->is_array()) {
        for (const auto& item : *products) {
            record.products.push_back({string_field(item, "name"), string_field(item, "type")});
        }
    }
    if (const auto cases = value.find("open_cases");
        cases != value.end() && cases->is_array()) {
        for (const auto& item : *cases) {
            record.open_cases.push_back({string_field(item, "id"),
                                         string_field(item, "description"),
                                         string_field(item, "status"),
                                         string_field(item, "created_date")});
        }
    }
    return record;
}

BackendClientDirectory::BackendClientDirectory(std::shared_ptr<BackendClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw BackendError("BackendClientDirectory requires a client");
    }
}

std::optional<ClientRecord> BackendClientDirectory::lookup_client(
    const std::string& client_id) {
    nlohmann::json body;
    try {
        body = client_->get_json("/clients/" + utils::url_encode(client_id));
    } catch (const BackendNotFoundError&) {
        debug("Client not found", {kv("client_id", client_id)});
        return std::nullopt;
    }
    auto record = client_record_from_json(body);
    if (record.client_id.empty()) {
        record.client_id = client_id;
    }
    return record;
}

std::string BackendClientDirectory::create_support_case(const std::string& client_id,
                                                        const std::string& description) {
    const auto body = client_->post_json(
        "/clients/" + utils::url_encode(client_id) + "/support_cases",
        {{"description", description}});
    const auto case_id = body.find("case_id");
    if (case_id == body.end() || case_id->is_null()) {
        throw BackendError("support case response is missing case_id");
    }
    return case_id->is_string() ? case_id->get<std::string>() : case_id->dump();
}

}
}
