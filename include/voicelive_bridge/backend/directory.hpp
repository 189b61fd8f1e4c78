#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace voicelive_bridge {
namespace backend {

class BackendClient;

struct Product {
    std::string name;
    std::string type;
};

struct SupportCase {
    std::string id;
    std::string description;
    std::string status;
    std::string created_date;
};

struct ClientRecord {
    std::string client_id;
    std::string name;
    std::string email;
    std::vector<Product> products;
    std::vector<SupportCase> open_cases;
};

ClientRecord client_record_from_json(const nlohmann::json& value);

// Persistence collaborator consumed by the tool handlers.
class ClientDirectory {
public:
    virtual ~ClientDirectory() = default;

    virtual std::optional<ClientRecord> lookup_client(const std::string& client_id) = 0;
    // Returns the id of the new case. Throws BackendNotFoundError for an unknown client.
    virtual std::string create_support_case(const std::string& client_id,
                                            const std::string& description) = 0;
};

class BackendClientDirectory : public ClientDirectory {
public:
    explicit BackendClientDirectory(std::shared_ptr<BackendClient> client);

    std::optional<ClientRecord> lookup_client(const std::string& client_id) override;
    std::string create_support_case(const std::string& client_id,
                                    const std::string& description) override;

private:
    std::shared_ptr<BackendClient> client_;
};

}
}
