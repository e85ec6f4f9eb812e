#include "bridge/request_correlator.hpp"

#include <algorithm>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace hostlink::bridge {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

RequestCorrelator::RequestCorrelator(MessageRouter& router, protocol::RequestTable table)
    : router_(router), table_(std::move(table)) {
    for (const auto& route : table_.routes()) {
        const auto reply = route.reply;
        router_.on(reply, [this, reply](const protocol::Envelope& envelope) {
            on_reply(reply, envelope);
        });
    }
    disconnect_listener_id_ = router_.supervisor().add_disconnect_listener(
        [this](const BridgeError& reason) { reject_all(reason); });
}

RequestCorrelator::~RequestCorrelator() {
    router_.supervisor().remove_disconnect_listener(disconnect_listener_id_);
    for (const auto& route : table_.routes()) {
        router_.off(protocol::to_string(route.reply));
    }
    reject_all(BridgeError{ErrorCategory::Internal, "Correlator destroyed.", "shutdown"});
}

core::errors::Result<json> RequestCorrelator::request(
    const protocol::MessageKind kind, json payload,
    const std::optional<std::chrono::milliseconds> timeout) {
    const auto route = table_.find(kind);
    if (!route.has_value()) {
        return BridgeError{ErrorCategory::Input,
                           "'" + protocol::to_string(kind) + "' does not expect a reply.",
                           "unsupported_command"};
    }
    if (!router_.supervisor().is_usable()) {
        return BridgeError{ErrorCategory::Transport, "Peer is not connected.",
                           "peer_not_connected",
                           "Make sure the host application is running with the bridge enabled."};
    }

    auto entry = std::make_shared<PendingRequest>();
    entry->kind = kind;
    entry->created_at = Clock::now();
    auto future = entry->promise.get_future();
    {
        // Waiters must queue in the order their commands reach the wire.
        std::lock_guard<std::mutex> issue(issue_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& queue = pending_[route->reply];
            if (route->policy == protocol::ConcurrencyPolicy::SingleFlight && !queue.empty()) {
                return BridgeError{ErrorCategory::Input,
                                   "A '" + protocol::to_string(kind) +
                                       "' request is already pending.",
                                   "request_in_flight"};
            }
            queue.push_back(entry);
        }

        const auto sent = router_.send(kind, std::move(payload));
        if (core::errors::is_error(sent)) {
            remove(route->reply, entry);
            return core::errors::get_error(sent);
        }
    }

    const auto wait = timeout.value_or(route->timeout);
    if (future.wait_for(wait) == std::future_status::timeout && remove(route->reply, entry)) {
        LOG_WARN("'" + protocol::to_string(kind) + "' timed out after " +
                 std::to_string(wait.count()) + "ms");
        return BridgeError{ErrorCategory::Timeout,
                           "No '" + protocol::to_string(route->reply) + "' reply within " +
                               std::to_string(wait.count()) + "ms.",
                           "reply_timeout"};
    }
    // Either resolved in time, or claimed by a resolver right at the deadline.
    return future.get();
}

std::future<core::errors::Result<json>> RequestCorrelator::request_async(
    const protocol::MessageKind kind, json payload,
    const std::optional<std::chrono::milliseconds> timeout) {
    return std::async(std::launch::async, [this, kind, payload = std::move(payload), timeout]() {
        return request(kind, payload, timeout);
    });
}

void RequestCorrelator::on_reply(const protocol::MessageKind reply,
                                 const protocol::Envelope& envelope) {
    PendingPtr entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = pending_.find(reply);
        if (it != pending_.end() && !it->second.empty()) {
            entry = it->second.front();
            it->second.pop_front();
        }
    }
    if (!entry) {
        dropped_replies_.fetch_add(1);
        LOG_WARN("Dropping '" + envelope.kind + "' reply: no request is waiting for it");
        return;
    }

    const auto& payload = envelope.payload;
    if (payload.is_object()) {
        const auto error = payload.find("error");
        if (error != payload.end() && !error->is_null()) {
            const std::string message =
                error->is_string() ? error->get<std::string>() : error->dump();
            entry->promise.set_value(
                BridgeError{ErrorCategory::Handler, message, "handler_failed"});
            return;
        }
    }
    entry->promise.set_value(core::errors::Result<json>(std::in_place_index<0>, payload));
}

bool RequestCorrelator::remove(const protocol::MessageKind reply, const PendingPtr& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pending_.find(reply);
    if (it == pending_.end()) {
        return false;
    }
    auto& queue = it->second;
    const auto position = std::find(queue.begin(), queue.end(), entry);
    if (position == queue.end()) {
        return false;
    }
    queue.erase(position);
    return true;
}

void RequestCorrelator::reject_all(const BridgeError& reason) {
    std::vector<PendingPtr> rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : pending_) {
            rejected.insert(rejected.end(), entry.second.begin(), entry.second.end());
            entry.second.clear();
        }
    }
    for (const auto& entry : rejected) {
        entry->promise.set_value(BridgeError{ErrorCategory::Transport,
                                             "Connection lost before '" +
                                                 protocol::to_string(entry->kind) +
                                                 "' completed: " + reason.message,
                                             "connection_lost"});
    }
}

std::size_t RequestCorrelator::pending_count(const protocol::MessageKind kind) const {
    const auto route = table_.find(kind);
    const auto reply = route.has_value() ? route->reply : kind;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pending_.find(reply);
    return it == pending_.end() ? 0 : it->second.size();
}

std::size_t RequestCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& entry : pending_) {
        total += entry.second.size();
    }
    return total;
}

}  // namespace hostlink::bridge
