#include "voicelive_bridge/backend/notifier.hpp"

#include "voicelive_bridge/backend/client.hpp"
#include "voicelive_bridge/logging.hpp"

namespace voicelive_bridge {
namespace backend {

BackendNotifier::BackendNotifier(std::shared_ptr<BackendClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw BackendError("BackendNotifier requires a client");
    }
}

std::string BackendNotifier::send_summary_email(const EmailMessage& message) {
    const auto body = client_->post_json("/notifications/email",
                                         {{"sender", message.sender},
                                          {"to", message.recipient},
                                          {"subject", message.subject},
                                          {"html", message.html}});
    std::string operation_id;
    if (const auto it = body.find("operation_id"); it != body.end() && it->is_string()) {
        operation_id = it->get<std::string>();
    } else if (const auto id = body.find("id"); id != body.end() && id->is_string()) {
        operation_id = id->get<std::string>();
    }
    info("Summary email queued",
         {kv("to", message.recipient), kv("operation_id", operation_id)});
    return operation_id;
}

}
}
