#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "voicelive_bridge/bridge/call_registry.hpp"
#include "voicelive_bridge/bridge/lifecycle.hpp"
#include "voicelive_bridge/realtime/ai_session.hpp"
#include "voicelive_bridge/tools/dispatcher.hpp"
#include "voicelive_bridge/transport/transport_session.hpp"
#include "voicelive_bridge/utils/bounded_queue.hpp"

namespace voicelive_bridge {
namespace bridge {

enum class CallState {
    Initiated,
    ConnectingAi,
    Active,
    Draining,
    Terminated
};

enum class TerminationReason {
    SetupFailed,
    CallerHangup,
    TransportLost,
    SessionError,
    RemoteDisconnect,
    Shutdown
};

std::string to_string(CallState state);
std::string to_string(TerminationReason reason);

struct CallInfo {
    std::string call_id;
    std::string correlation_id;
    std::string caller_info;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
};

struct BridgeOptions {
    std::chrono::milliseconds close_grace{1500};
    size_t control_buffer_size = 1024;
};

// Owns one call: a transport session, its AI session and the tool dispatcher.
// Runs a caller relay, an AI relay and a router that applies barge-in, tool
// routing and lifecycle decisions.
class VoiceBridge : public std::enable_shared_from_this<VoiceBridge> {
public:
    VoiceBridge(CallInfo info,
                std::shared_ptr<transport::TransportSession> transport,
                std::unique_ptr<realtime::AiSession> ai,
                realtime::SessionConfiguration configuration,
                std::unique_ptr<tools::ToolDispatcher> dispatcher,
                std::shared_ptr<CallRegistry> registry,
                BridgeOptions options);
    ~VoiceBridge();

    VoiceBridge(const VoiceBridge&) = delete;
    VoiceBridge& operator=(const VoiceBridge&) = delete;

    // Blocks while the AI session connects. Setup failures end the call with
    // SetupFailed instead of throwing; a duplicate call id throws DuplicateCallError.
    void start();
    void handle_lifecycle_event(const LifecycleEvent& event);
    void stop();
    bool wait_terminated(std::chrono::milliseconds timeout) const;

    CallState state() const;
    std::vector<CallState> state_history() const;
    std::optional<TerminationReason> termination_reason() const;
    const CallInfo& info() const { return info_; }
    const std::string& call_id() const { return info_.call_id; }
    uint64_t interruptions() const { return interruptions_.load(); }

private:
    struct ControlEvent {
        enum class Kind {
            Transport,
            Ai,
            Lifecycle,
            Shutdown
        };

        Kind kind = Kind::Shutdown;
        transport::TransportEvent transport;
        realtime::AiEvent ai;
        LifecycleEvent lifecycle;
    };

    void set_state(CallState state);
    void fail_setup(const std::string& reason);
    void caller_relay();
    void ai_relay();
    void router();
    void forward_ai_audio(const audio::AudioFrame& frame);
    // Returns the reason the call must end, if the event ends it.
    std::optional<TerminationReason> handle_transport_event(const transport::TransportEvent& event);
    std::optional<TerminationReason> handle_ai_event(const realtime::AiEvent& event);
    std::optional<TerminationReason> handle_lifecycle(const LifecycleEvent& event);
    void interrupt(const std::string& source);
    void on_tool_result(const tools::ToolCallResult& result);
    void drain(TerminationReason reason);
    void push_control(ControlEvent event);

    CallInfo info_;
    std::shared_ptr<CallRegistry> registry_;
    std::shared_ptr<transport::TransportSession> transport_;
    std::unique_ptr<realtime::AiSession> ai_;
    realtime::SessionConfiguration configuration_;
    std::unique_ptr<tools::ToolDispatcher> dispatcher_;
    BridgeOptions options_;

    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    CallState state_ = CallState::Initiated;
    std::vector<CallState> history_{CallState::Initiated};
    std::optional<TerminationReason> reason_;

    // Serializes AI playout against barge-in so no truncated audio reaches the caller.
    std::mutex playout_mutex_;
    std::string playout_item_id_;
    int forwarded_ms_ = 0;
    int last_frame_ms_ = 0;

    utils::BoundedQueue<ControlEvent> control_;
    std::atomic<uint64_t> interruptions_{0};
    std::thread caller_relay_;
    std::thread ai_relay_;
    std::thread router_;
};

}
}
