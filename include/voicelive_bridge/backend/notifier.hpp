#pragma once

#include <memory>
#include <string>

namespace voicelive_bridge {
namespace backend {

class BackendClient;

struct EmailMessage {
    std::string sender;
    std::string recipient;
    std::string subject;
    std::string html;
};

// Notification collaborator. Returns the delivery operation id.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual std::string send_summary_email(const EmailMessage& message) = 0;
};

class BackendNotifier : public Notifier {
public:
    explicit BackendNotifier(std::shared_ptr<BackendClient> client);

    std::string send_summary_email(const EmailMessage& message) override;

private:
    std::shared_ptr<BackendClient> client_;
};

}
}
