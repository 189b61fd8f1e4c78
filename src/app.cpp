#include "voicelive_bridge/app.hpp"

#include <chrono>
#include <csignal>
#include <thread>

#include "voicelive_bridge/bridge/lifecycle.hpp"
#include "voicelive_bridge/bridge/voice_bridge.hpp"
#include "voicelive_bridge/errors.hpp"
#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/realtime/ai_session.hpp"
#include "voicelive_bridge/realtime/connection.hpp"
#include "voicelive_bridge/tools/customer_tools.hpp"
#include "voicelive_bridge/tools/dispatcher.hpp"
#include "voicelive_bridge/utils/async.hpp"
#include "voicelive_bridge/utils/http.hpp"
#include "voicelive_bridge/utils/ids.hpp"

namespace voicelive_bridge {

namespace {

std::atomic<bool> g_signal_received{false};

void on_signal(int) {
    g_signal_received.store(true);
}

audio::AudioFormat audio_format(const Config& config) {
    audio::AudioFormat format;
    format.sample_rate = config.audio_sample_rate;
    return format;
}

}

void install_signal_handlers() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

BridgeApp::BridgeApp(Config config)
    : config_(std::move(config)),
      backend_client_(std::make_shared<backend::BackendClient>(
          config_.backend_url,
          config_.authorization_token,
          backend::make_request_options(config_.backend_request_timeout,
                                        config_.backend_connect_timeout,
                                        config_.backend_sock_read_timeout))),
      registry_(std::make_shared<bridge::CallRegistry>()),
      pending_calls_(std::chrono::milliseconds(config_.pending_call_ttl_ms)) {
    notification_client_ = backend_client_;
    if (!config_.notification_url.empty() && config_.notification_url != config_.backend_url) {
        notification_client_ = std::make_shared<backend::BackendClient>(
            config_.notification_url,
            config_.authorization_token,
            backend::make_request_options(config_.backend_request_timeout,
                                          config_.backend_connect_timeout,
                                          config_.backend_sock_read_timeout));
    }
    tool_context_.directory = std::make_shared<backend::BackendClientDirectory>(backend_client_);
    tool_context_.notifier = std::make_shared<backend::BackendNotifier>(notification_client_);
    tool_context_.sender_email = config_.sender_email;
    tool_registry_ = tools::make_customer_tool_registry();
    session_configuration_ =
        realtime::make_session_configuration(config_, tool_registry_->definitions());
    connection_settings_ = realtime::ConnectionSettings::from_config(config_);
}

BridgeApp::~BridgeApp() {
    stop();
}

void BridgeApp::init() {
    WebhookHandlers handlers;
    handlers.on_incoming_call = [this](const nlohmann::json& body) {
        return handle_incoming_call(body);
    };
    handlers.on_callback = [this](const std::string& correlation_id, const nlohmann::json& body) {
        return handle_callback(correlation_id, body);
    };
    handlers.on_call_event = [this](const std::string& call_id, const nlohmann::json& body) {
        return handle_call_event(call_id, body);
    };
    webhook_server_ = std::make_unique<WebhookServer>(config_.webhook_port,
                                                      config_.authorization_token,
                                                      std::move(handlers));
    media_server_ = std::make_unique<transport::MediaServer>(
        config_.media_port,
        [this](const transport::MediaConnection& connection) {
            return handle_media_connection(connection);
        });

    media_server_->start();
    webhook_server_->start();
    info("Bridge ready",
         {kv("webhook_port", webhook_server_->port()),
          kv("media_port", media_server_->port()),
          kv("tools", tool_registry_->size()),
          kv("model", connection_settings_.model)});
}

void BridgeApp::run() {
    while (!quitting_ && !g_signal_received) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        pending_calls_.evict_expired();
    }
    stop();
}

void BridgeApp::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    quitting_ = true;
    info("Bridge stopping", {kv("active_calls", registry_->size())});
    if (webhook_server_) {
        webhook_server_->stop();
    }
    const auto grace = std::chrono::milliseconds(config_.close_grace_ms);
    for (const auto& call : registry_->snapshot()) {
        call->stop();
    }
    for (const auto& call : registry_->snapshot()) {
        if (!call->wait_terminated(grace * 2)) {
            warn("Call did not terminate in time", {kv("call_id", call->call_id())});
        }
    }
    if (media_server_) {
        media_server_->stop();
    }
}

std::string BridgeApp::media_url(const std::string& call_id,
                                 const std::string& correlation_id) const {
    auto base = config_.public_media_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    auto url = base + "/acs/ws?call_id=" + utils::url_encode(call_id);
    if (!correlation_id.empty()) {
        url += "&correlation_id=" + utils::url_encode(correlation_id);
    }
    return url;
}

WebhookResponse BridgeApp::handle_incoming_call(const nlohmann::json& body) {
    if (const auto code = bridge::subscription_validation_code(body)) {
        info("Event subscription validated");
        return {200, {{"validationResponse", *code}}};
    }
    const auto event = bridge::parse_incoming_call(body);
    const auto call_id = utils::make_uuid();
    pending_calls_.evict_expired();
    pending_calls_.add(call_id, event.correlation_id, event.caller_info);
    info("Incoming call",
         {kv("call_id", call_id),
          kv("correlation_id", event.correlation_id),
          kv("caller", event.caller_info)});
    return {200, {{"call_id", call_id}, {"media_url", media_url(call_id, event.correlation_id)}}};
}

WebhookResponse BridgeApp::handle_callback(const std::string& correlation_id,
                                           const nlohmann::json& body) {
    if (const auto code = bridge::subscription_validation_code(body)) {
        return {200, {{"validationResponse", *code}}};
    }
    size_t routed = 0;
    for (const auto& event : bridge::parse_callback_events(body, correlation_id)) {
        std::shared_ptr<bridge::VoiceBridge> call;
        if (!event.call_id.empty()) {
            call = registry_->find(event.call_id);
        }
        if (!call && !event.correlation_id.empty()) {
            call = registry_->find_by_correlation(event.correlation_id);
        }
        if (!call) {
            if (event.type == bridge::LifecycleEvent::Type::CallDisconnected) {
                pending_calls_.remove_by_correlation(event.correlation_id);
            }
            debug("Callback event without a live call",
                  {kv("correlation_id", event.correlation_id),
                   kv("type", bridge::to_string(event.type))});
            continue;
        }
        call->handle_lifecycle_event(event);
        ++routed;
    }
    return {200, {{"routed", routed}}};
}

WebhookResponse BridgeApp::handle_call_event(const std::string& call_id,
                                             const nlohmann::json& body) {
    const auto event = bridge::parse_call_event(call_id, body);
    auto call = registry_->find(call_id);
    if (!call) {
        return {404, {{"message", "unknown call"}}};
    }
    call->handle_lifecycle_event(event);
    return {202, {{"status", "accepted"}}};
}

std::shared_ptr<transport::TransportSession> BridgeApp::handle_media_connection(
    const transport::MediaConnection& connection) {
    if (quitting_) {
        return nullptr;
    }
    pending_calls_.evict_expired();
    bridge::CallInfo call_info;
    call_info.call_id = connection.call_id.empty() ? utils::make_uuid() : connection.call_id;
    call_info.correlation_id = connection.correlation_id;
    if (auto pending = pending_calls_.take(call_info.call_id)) {
        if (call_info.correlation_id.empty()) {
            call_info.correlation_id = pending->correlation_id;
        }
        call_info.caller_info = pending->caller_info;
    }
    if (registry_->contains(call_info.call_id)) {
        warn("Media socket for a live call rejected", {kv("call_id", call_info.call_id)});
        return nullptr;
    }

    const auto format = audio_format(config_);
    transport::TransportSessionOptions transport_options;
    transport_options.send_buffer_frames = static_cast<size_t>(config_.transport_send_buffer_frames);
    transport_options.event_buffer_size = static_cast<size_t>(config_.event_buffer_size);
    transport_options.format = format;
    transport_options.metadata_timeout =
        std::chrono::milliseconds(config_.audio_metadata_timeout_ms);
    auto transport = std::make_shared<transport::TransportSession>(
        call_info.call_id, connection.kind, connection.socket, transport_options);

    realtime::AiSessionOptions ai_options;
    ai_options.send_buffer_frames = static_cast<size_t>(config_.ai_send_buffer_frames);
    ai_options.event_buffer_size = static_cast<size_t>(config_.event_buffer_size);
    ai_options.connect_timeout = std::chrono::milliseconds(config_.ai_connect_timeout_ms);
    ai_options.format = format;
    auto ai = std::make_unique<realtime::AiSession>(
        call_info.call_id, connection_settings_, std::make_unique<realtime::WsAiConnection>(),
        ai_options);

    tools::DispatcherOptions dispatcher_options;
    dispatcher_options.max_inflight = config_.tool_max_inflight;
    dispatcher_options.timeout = std::chrono::milliseconds(config_.tool_timeout_ms);
    auto dispatcher = std::make_unique<tools::ToolDispatcher>(
        call_info.call_id, tool_registry_, tool_context_, dispatcher_options);

    bridge::BridgeOptions bridge_options;
    bridge_options.close_grace = std::chrono::milliseconds(config_.close_grace_ms);
    bridge_options.control_buffer_size = static_cast<size_t>(config_.event_buffer_size);

    auto call = std::make_shared<bridge::VoiceBridge>(
        call_info, transport, std::move(ai), session_configuration_, std::move(dispatcher),
        registry_, bridge_options);

    // start() blocks on the realtime handshake; keep the media loop free.
    utils::run_async([call]() {
        try {
            call->start();
        } catch (const DuplicateCallError& ex) {
            warn("Call not started", {kv("call_id", call->call_id()), kv("error", ex.what())});
        }
    });
    return transport;
}

}
