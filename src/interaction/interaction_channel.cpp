#include "interaction/interaction_channel.hpp"

#include <unordered_set>
#include <utility>
#include "core/logging/logger.hpp"
#include "interaction/options.hpp"

namespace station::interaction {

using core::errors::ErrorCategory;
using core::errors::StationError;
using protocol::InteractionRequest;
using protocol::InteractionResponse;

InteractionChannel::InteractionChannel(ChannelOptions options)
    : options_(std::move(options)) {}

void InteractionChannel::push_outbound_locked(protocol::ConsoleMessage message) {
    outbound_.push_back(std::move(message));
    outbound_cv_.notify_all();
}

bool InteractionChannel::send_log(const protocol::LogStream stream,
                                  const std::string& text) {
    return publish(protocol::LogMessage{stream, text});
}

bool InteractionChannel::publish(protocol::ConsoleMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    push_outbound_locked(std::move(message));
    return true;
}

core::errors::Result<bool> InteractionChannel::validate_request(
    const InteractionRequest& request) const {
    if (!protocol::takes_options(request.kind)) {
        return true;
    }
    if (request.options.empty()) {
        return StationError{ErrorCategory::Step,
                            "Interaction request has no options: " +
                                protocol::to_string(request.kind),
                            "invalid_request"};
    }
    std::unordered_set<std::string> names;
    for (std::size_t i = 0; i < request.options.size(); ++i) {
        const auto& option = request.options[i];
        if (!names.insert(option.name).second) {
            return StationError{ErrorCategory::Step,
                                "Duplicate option name: " + option.name,
                                "invalid_request"};
        }
        // Responses name the chosen value, so values must be unique too.
        for (std::size_t j = 0; j < i; ++j) {
            if (request.options[j].value == option.value) {
                return StationError{ErrorCategory::Step,
                                    "Options " + request.options[j].name + " and " +
                                        option.name + " share value " +
                                        option.value.dump(),
                                    "invalid_request"};
            }
        }
    }
    return true;
}

core::errors::Result<InteractionResponse> InteractionChannel::request(
    InteractionRequest request, std::optional<std::chrono::milliseconds> timeout) {
    auto valid = validate_request(request);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    if (!timeout.has_value()) {
        timeout = options_.default_timeout;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return StationError{ErrorCategory::Infrastructure,
                            "Interaction channel is closed: " + close_reason_,
                            "channel_closed"};
    }

    request.id = "req-" + std::to_string(next_request_id_++);
    const std::string id = request.id;
    pending_.emplace(id, PendingRequest{});
    push_outbound_locked(protocol::InteractionRequestMessage{request});
    STATION_LOG_DEBUG("InteractionChannel: issued " + protocol::to_string(request.kind) +
                      " request " + id);

    auto answered = [this, &id]() {
        return closed_ || pending_.at(id).selection.has_value();
    };

    bool woke = true;
    if (timeout.has_value()) {
        woke = response_cv_.wait_for(lock, timeout.value(), answered);
    } else {
        response_cv_.wait(lock, answered);
    }

    std::optional<nlohmann::json> selection = std::move(pending_.at(id).selection);
    pending_.erase(id);

    if (!selection.has_value()) {
        if (!woke) {
            if (!closed_) {
                push_outbound_locked(
                    protocol::InteractionWithdrawnMessage{id, "timeout"});
            }
            return StationError{ErrorCategory::Infrastructure,
                                "No response to request " + id + " within " +
                                    std::to_string(timeout->count()) + " ms",
                                "interaction_timeout"};
        }
        return StationError{ErrorCategory::Infrastructure,
                            "Request " + id + " cancelled: " + close_reason_,
                            "interaction_cancelled"};
    }

    lock.unlock();
    return resolve_response(request, selection.value());
}

std::optional<protocol::ConsoleMessage> InteractionChannel::next_outbound(
    const std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    outbound_cv_.wait_for(lock, wait, [this]() { return !outbound_.empty() || closed_; });
    if (outbound_.empty()) {
        return std::nullopt;
    }
    protocol::ConsoleMessage message = std::move(outbound_.front());
    outbound_.pop_front();
    return message;
}

core::errors::Result<std::string> InteractionChannel::deliver_response(
    const std::string& request_id, nlohmann::json selection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return StationError{ErrorCategory::Infrastructure,
                            "Interaction channel is closed: " + close_reason_,
                            "channel_closed"};
    }
    auto found = pending_.find(request_id);
    if (found == pending_.end() || found->second.selection.has_value()) {
        return StationError{ErrorCategory::Input,
                            "No pending request with id: " + request_id,
                            "unknown_request"};
    }
    found->second.selection = std::move(selection);
    response_cv_.notify_all();
    return request_id;
}

void InteractionChannel::close(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    close_reason_ = reason;
    if (!pending_.empty()) {
        STATION_LOG_WARN("InteractionChannel: closing with " +
                         std::to_string(pending_.size()) +
                         " pending request(s): " + reason);
    }
    response_cv_.notify_all();
    outbound_cv_.notify_all();
}

bool InteractionChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t InteractionChannel::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t InteractionChannel::outbound_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbound_.size();
}

}  // namespace station::interaction
