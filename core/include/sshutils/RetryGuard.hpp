// Retry boundary for every network-touching call: classifies a failure as
// excluded, fatal or transient, repairs the session on transient faults and
// re-invokes the whole operation.
#pragma once
#include "Error.hpp"
#include "Log.hpp"
#include "Session.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <vector>

namespace sshutils {

struct RetryPolicy {
    // Kinds that propagate at once, even when transient.
    std::vector<ErrorKind> excluded;
    // Fixed wait between failed repair attempts.
    std::chrono::seconds backoff{60};
    // Bounded authentication attempts inside Session::connect.
    int authAttempts = 3;
    // Total backoff allowed before giving up; 0 retries forever.
    std::chrono::seconds retryBudget{0};

    // Domain and argument errors excluded, 60 s backoff, 3 auth attempts.
    static RetryPolicy standard();

    bool excludes(ErrorKind kind) const;
    // Copy of this policy with extra excluded kinds.
    RetryPolicy excluding(std::initializer_list<ErrorKind> kinds) const;
};

struct RetryStats {
    std::size_t invocations = 0;
    std::size_t faults = 0;          // transient failures that entered repair
    std::size_t repairAttempts = 0;
    std::size_t repairs = 0;         // successful repairs
    std::size_t backoffs = 0;
    std::size_t propagated = 0;      // failures handed back to the caller
};

class RetryGuard {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    // Default sleeper blocks the calling thread.
    explicit RetryGuard(Sleeper sleeper = {});

    // Runs op (bool(Error&)) until it succeeds or fails with a non-repairable kind.
    template <class Op>
    bool run(Session& session, const RetryPolicy& policy, const char* what, Op&& op, Error& err) {
        auto lk = session.lock();
        std::chrono::seconds slept{0};
        for (std::size_t attempt = 1;; ++attempt) {
            ++stats_.invocations;
            err.clear();
            if (op(err)) {
                if (attempt > 1)
                    LOGI("retry.done op=%s host=%s attempts=%zu", what, session.host().c_str(), attempt);
                return true;
            }
            if (!shouldRepair(session, policy, what, attempt, err)) return false;
            if (!repair(session, policy, what, slept, err)) return false;
        }
    }

    const RetryStats& stats() const { return stats_; }
    void resetStats() { stats_ = RetryStats{}; }

private:
    Sleeper sleeper_;
    RetryStats stats_;

    bool shouldRepair(Session& session, const RetryPolicy& policy, const char* what,
                      std::size_t attempt, const Error& err);
    // Reconnects until it works; sleeps policy.backoff between failed attempts.
    bool repair(Session& session, const RetryPolicy& policy, const char* what,
                std::chrono::seconds& slept, Error& err);
};

} // namespace sshutils
