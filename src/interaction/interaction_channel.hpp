#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/station_errors.hpp"
#include "protocol/console_contract.hpp"
#include "protocol/interaction_contract.hpp"

namespace station::interaction {

struct ChannelOptions {
    // Applied to requests issued without an explicit timeout.
    std::optional<std::chrono::milliseconds> default_timeout;
};

// Two decoupled flows between the engine and an operator console: an
// outbound FIFO (logs, prompts, progress) and inbound responses correlated
// by request id. `request` is the engine's only blocking call.
class InteractionChannel {
public:
    explicit InteractionChannel(ChannelOptions options = {});

    InteractionChannel(const InteractionChannel&) = delete;
    InteractionChannel& operator=(const InteractionChannel&) = delete;

    // Engine side.
    // Never blocks. Returns false once the channel is closed and the line was
    // not queued.
    bool send_log(protocol::LogStream stream, const std::string& text);
    bool publish(protocol::ConsoleMessage message);

    core::errors::Result<protocol::InteractionResponse> request(
        protocol::InteractionRequest request,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Console side.
    std::optional<protocol::ConsoleMessage> next_outbound(std::chrono::milliseconds wait);
    core::errors::Result<std::string> deliver_response(const std::string& request_id,
                                                       nlohmann::json selection);

    // Wakes every pending request with `interaction_cancelled`. Idempotent.
    void close(const std::string& reason = "channel closed");
    bool is_closed() const;
    std::size_t pending_count() const;
    std::size_t outbound_size() const;

private:
    struct PendingRequest {
        std::optional<nlohmann::json> selection;
    };

    core::errors::Result<bool> validate_request(
        const protocol::InteractionRequest& request) const;
    void push_outbound_locked(protocol::ConsoleMessage message);

    ChannelOptions options_;
    mutable std::mutex mutex_;
    std::condition_variable outbound_cv_;
    std::condition_variable response_cv_;
    std::deque<protocol::ConsoleMessage> outbound_;
    std::unordered_map<std::string, PendingRequest> pending_;
    std::uint64_t next_request_id_ = 1;
    bool closed_ = false;
    std::string close_reason_;
};

}  // namespace station::interaction
