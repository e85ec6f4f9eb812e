#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace hostlink::host {

using WorkResult = core::errors::Result<nlohmann::json>;
using Work = std::function<WorkResult()>;
using Completion = std::function<void(const WorkResult& result)>;

// Hands work from any thread to the host's single privileged context.
//
// Units run exactly once, one at a time, in submission order, on whichever
// thread calls run_pending() (the host's scheduling loop). A unit submitted
// while a drain is in progress waits for the next drain, so work never
// re-enters the privileged context.
class PrivilegedDispatch {
public:
    PrivilegedDispatch() = default;
    ~PrivilegedDispatch();

    PrivilegedDispatch(const PrivilegedDispatch&) = delete;
    PrivilegedDispatch& operator=(const PrivilegedDispatch&) = delete;

    std::future<WorkResult> submit(Work work);

    // The completion runs on the privileged context right after the work.
    void submit(Work work, Completion completion);

    // Returns the number of units executed.
    std::size_t run_pending();

    std::size_t pending() const;

    // Rejects queued and future submissions with dispatch_closed.
    void close();

private:
    struct Unit {
        Work work;
        Completion completion;
    };

    mutable std::mutex mutex_;
    std::deque<Unit> queue_;
    bool draining_ = false;
    bool closed_ = false;
};

}  // namespace hostlink::host
