#pragma once

#include <chrono>
#include <optional>
#include <vector>
#include "protocol/envelope.hpp"

namespace hostlink::protocol {

    // What happens to a second request while one of the same kind is pending.
    enum class ConcurrencyPolicy {
        Fifo,          // queue; the next reply resolves the oldest waiter
        SingleFlight   // reject immediately with request_in_flight
    };

    struct RequestRoute {
        MessageKind request;
        MessageKind reply;
        std::chrono::milliseconds timeout;
        ConcurrencyPolicy policy;
    };

    // The command kinds that expect a reply. Fire-and-forget kinds (ping,
    // log, hello) are deliberately absent.
    class RequestTable {
    public:
        RequestTable(std::chrono::milliseconds default_timeout = std::chrono::milliseconds(30000),
                     std::chrono::milliseconds long_timeout = std::chrono::milliseconds(60000))
            : routes_{
                  {MessageKind::ExecuteCommand, MessageKind::CommandResult, long_timeout,
                   ConcurrencyPolicy::Fifo},
                  {MessageKind::GetState, MessageKind::State, long_timeout,
                   ConcurrencyPolicy::Fifo},
                  {MessageKind::GetObjectDetails, MessageKind::ObjectDetails, default_timeout,
                   ConcurrencyPolicy::Fifo},
                  {MessageKind::TakeScreenshot, MessageKind::Screenshot, default_timeout,
                   ConcurrencyPolicy::SingleFlight},
                  {MessageKind::ManipulateScene, MessageKind::SceneManipulationResult,
                   default_timeout, ConcurrencyPolicy::Fifo},
                  {MessageKind::ManageAssets, MessageKind::AssetManagementResult,
                   default_timeout, ConcurrencyPolicy::Fifo},
              } {}

        std::optional<RequestRoute> find(MessageKind request) const {
            for (const auto& route : routes_) {
                if (route.request == request) {
                    return route;
                }
            }
            return std::nullopt;
        }

        std::optional<RequestRoute> find_by_reply(MessageKind reply) const {
            for (const auto& route : routes_) {
                if (route.reply == reply) {
                    return route;
                }
            }
            return std::nullopt;
        }

        const std::vector<RequestRoute>& routes() const { return routes_; }

    private:
        std::vector<RequestRoute> routes_;
    };

} // namespace hostlink::protocol
