#include "sshutils/RetryGuard.hpp"
#include <algorithm>
#include <thread>

namespace sshutils {

RetryPolicy RetryPolicy::standard() {
    RetryPolicy p;
    p.excluded = {ErrorKind::NotFound,      ErrorKind::AlreadyExists,    ErrorKind::IsADirectory,
                  ErrorKind::NotADirectory, ErrorKind::NotEmpty,         ErrorKind::PermissionDenied,
                  ErrorKind::InvalidArgument};
    return p;
}

bool RetryPolicy::excludes(ErrorKind kind) const {
    return std::find(excluded.begin(), excluded.end(), kind) != excluded.end();
}

RetryPolicy RetryPolicy::excluding(std::initializer_list<ErrorKind> kinds) const {
    RetryPolicy p = *this;
    for (ErrorKind k : kinds) {
        if (!p.excludes(k)) p.excluded.push_back(k);
    }
    return p;
}

RetryGuard::RetryGuard(Sleeper sleeper) : sleeper_(std::move(sleeper)) {
    if (!sleeper_) sleeper_ = [](std::chrono::seconds s) { std::this_thread::sleep_for(s); };
}

bool RetryGuard::shouldRepair(Session& session, const RetryPolicy& policy, const char* what,
                              std::size_t attempt, const Error& err) {
    const char* kind = errorKindName(err.kind);
    if (policy.excludes(err.kind)) {
        ++stats_.propagated;
        LOGD("retry.propagate op=%s host=%s kind=%s reason=excluded msg=\"%s\"", what,
             session.host().c_str(), kind, err.message.c_str());
        return false;
    }
    if (!isTransient(err.kind)) {
        ++stats_.propagated;
        LOGD("retry.propagate op=%s host=%s kind=%s reason=fatal msg=\"%s\"", what,
             session.host().c_str(), kind, err.message.c_str());
        return false;
    }
    ++stats_.faults;
    LOGW("retry.fault op=%s host=%s kind=%s attempt=%zu msg=\"%s\"", what, session.host().c_str(), kind,
         attempt, err.message.c_str());
    return true;
}

bool RetryGuard::repair(Session& session, const RetryPolicy& policy, const char* what,
                        std::chrono::seconds& slept, Error& err) {
    session.setAuthAttempts(policy.authAttempts);
    for (std::size_t round = 1;; ++round) {
        ++stats_.repairAttempts;
        Error rerr;
        if (session.reconnect(rerr)) {
            ++stats_.repairs;
            LOGI("retry.repair op=%s host=%s round=%zu outcome=ok", what, session.host().c_str(), round);
            return true;
        }
        LOGW("retry.repair op=%s host=%s round=%zu outcome=failed kind=%s msg=\"%s\"", what,
             session.host().c_str(), round, errorKindName(rerr.kind), rerr.message.c_str());
        if (rerr.kind == ErrorKind::InvalidArgument) {
            ++stats_.propagated;
            err = rerr;
            return false;
        }
        if (policy.retryBudget.count() > 0 && slept + policy.backoff > policy.retryBudget) {
            ++stats_.propagated;
            LOGE("retry.giveup op=%s host=%s budget=%llds", what, session.host().c_str(),
                 static_cast<long long>(policy.retryBudget.count()));
            err.message += " (retry budget of " + std::to_string(policy.retryBudget.count()) +
                           "s exhausted; last repair: " + rerr.message + ")";
            return false;
        }
        ++stats_.backoffs;
        LOGI("retry.backoff op=%s host=%s seconds=%lld", what, session.host().c_str(),
             static_cast<long long>(policy.backoff.count()));
        sleeper_(policy.backoff);
        slept += policy.backoff;
    }
}

} // namespace sshutils
