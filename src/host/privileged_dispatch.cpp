#include "host/privileged_dispatch.hpp"

#include <exception>
#include <memory>
#include <utility>
#include "core/logging/logger.hpp"

namespace hostlink::host {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

BridgeError closed_error() {
    return BridgeError{ErrorCategory::Internal, "Privileged dispatch is closed.",
                       "dispatch_closed"};
}

void complete(const Completion& completion, const WorkResult& result) {
    if (!completion) {
        return;
    }
    try {
        completion(result);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Completion failed: ") + e.what());
    }
}

}  // namespace

PrivilegedDispatch::~PrivilegedDispatch() {
    close();
}

std::future<WorkResult> PrivilegedDispatch::submit(Work work) {
    auto promise = std::make_shared<std::promise<WorkResult>>();
    auto future = promise->get_future();
    submit(std::move(work),
           [promise](const WorkResult& result) { promise->set_value(result); });
    return future;
}

void PrivilegedDispatch::submit(Work work, Completion completion) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            queue_.push_back(Unit{std::move(work), std::move(completion)});
            return;
        }
    }
    complete(completion, closed_error());
}

std::size_t PrivilegedDispatch::run_pending() {
    std::deque<Unit> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (draining_ || closed_) {
            return 0;
        }
        draining_ = true;
        batch.swap(queue_);
    }

    for (auto& unit : batch) {
        WorkResult result = BridgeError{ErrorCategory::Internal, "Work produced no result.",
                                        "handler_failed"};
        try {
            if (unit.work) {
                result = unit.work();
            }
        } catch (const std::exception& e) {
            result = BridgeError{ErrorCategory::Handler, e.what(), "handler_failed"};
        }
        complete(unit.completion, result);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    draining_ = false;
    return batch.size();
}

std::size_t PrivilegedDispatch::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void PrivilegedDispatch::close() {
    std::deque<Unit> rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        rejected.swap(queue_);
    }
    for (const auto& unit : rejected) {
        complete(unit.completion, closed_error());
    }
}

}  // namespace hostlink::host
