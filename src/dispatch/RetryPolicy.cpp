#include "dispatch/RetryPolicy.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "core/Config.h"
#include "logging/Logger.h"

RetryPolicy RetryPolicy::fromConfig() {
    RetryPolicy policy;
    policy.maxRetries = Config::Retry::MAX_RETRIES();
    policy.baseDelayMs = Config::Retry::BASE_DELAY_MS();
    policy.maxDelayMs = Config::Retry::MAX_DELAY_MS();
    return policy;
}

uint32_t RetryPolicy::backoffCeilingMs(const uint32_t retry) const {
    uint64_t delay = baseDelayMs;
    for (uint32_t i = 0; i < retry && delay < maxDelayMs; ++i) {
        delay *= 2;
    }
    return static_cast<uint32_t>(std::min<uint64_t>(delay, maxDelayMs));
}

RetryStateMachine::RetryStateMachine(const RetryPolicy &policy, const uint32_t retriesUsed, const uint32_t seed)
    : policy_{policy}, retriesUsed_{retriesUsed}, rng_{seed} {
}

void RetryStateMachine::transition(const RetryState next) {
    Logger::stateChange(Logger::Source::Worker, "Retry", toString(state_), toString(next));
    state_ = next;
}

void RetryStateMachine::start() {
    if (state_ != RetryState::READY && state_ != RetryState::BACKOFF) {
        throw std::logic_error(std::string("cannot start from ") + toString(state_));
    }
    transition(RetryState::RUNNING);
}

void RetryStateMachine::succeed() {
    if (state_ != RetryState::RUNNING) {
        throw std::logic_error(std::string("cannot succeed from ") + toString(state_));
    }
    transition(RetryState::SUCCEEDED);
}

RetryDecision RetryStateMachine::fail(const FailureKind kind) {
    if (state_ != RetryState::RUNNING) {
        throw std::logic_error(std::string("cannot fail from ") + toString(state_));
    }

    if (kind == FailureKind::TERMINAL || retriesUsed_ >= policy_.maxRetries) {
        transition(RetryState::FAILED);
        const bool compensate = !compensated_;
        compensated_ = true;
        return {RetryState::FAILED, 0, compensate};
    }

    std::uniform_int_distribution<uint32_t> jitter(0, policy_.backoffCeilingMs(retriesUsed_));
    const uint32_t delay = jitter(rng_);
    ++retriesUsed_;
    transition(RetryState::BACKOFF);
    return {RetryState::BACKOFF, delay, false};
}
