#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include "bridge/message_router.hpp"
#include "protocol/request_table.hpp"

namespace hostlink::bridge {

// Pairs each outbound command with the reply that answers it.
//
// IMPORTANT: envelopes carry no request identifier. Replies are matched by
// kind and order only: the oldest pending waiter for a reply kind receives
// the next reply of that kind. This is correct only while the peer answers
// commands of one kind in the order it received them, which holds because
// the host runs every command on its single privileged execution context
// (see host::PrivilegedDispatch). A peer that processes commands of the same
// kind in parallel would hand replies to the wrong waiters.
//
// Every waiter is resolved exactly once: by its reply, by its timeout (after
// which a late reply finds no waiter and is dropped), or by a disconnect,
// which rejects all waiters with connection_lost.
class RequestCorrelator {
public:
    explicit RequestCorrelator(MessageRouter& router,
                               protocol::RequestTable table = protocol::RequestTable());
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    // Sends the command and blocks until its reply, a timeout or a
    // disconnect. Safe to call from many threads at once. Without an explicit
    // timeout the kind's default from the request table applies.
    core::errors::Result<nlohmann::json> request(
        protocol::MessageKind kind, nlohmann::json payload,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::future<core::errors::Result<nlohmann::json>> request_async(
        protocol::MessageKind kind, nlohmann::json payload,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    void reject_all(const core::errors::BridgeError& reason);

    // kind may be a request kind or its reply kind.
    std::size_t pending_count(protocol::MessageKind kind) const;
    std::size_t pending_count() const;
    std::size_t dropped_replies() const { return dropped_replies_.load(); }

    const protocol::RequestTable& table() const { return table_; }

private:
    struct PendingRequest {
        protocol::MessageKind kind;
        Clock::time_point created_at;
        std::promise<core::errors::Result<nlohmann::json>> promise;
    };
    using PendingPtr = std::shared_ptr<PendingRequest>;

    void on_reply(protocol::MessageKind reply, const protocol::Envelope& envelope);
    bool remove(protocol::MessageKind reply, const PendingPtr& entry);

    MessageRouter& router_;
    protocol::RequestTable table_;

    // Held across enqueue and send; never taken by the reply path.
    std::mutex issue_mutex_;
    mutable std::mutex mutex_;
    std::map<protocol::MessageKind, std::deque<PendingPtr>> pending_;

    std::size_t disconnect_listener_id_ = 0;
    std::atomic<std::size_t> dropped_replies_{0};
};

}  // namespace hostlink::bridge
