#include "dispatch/MembershipClient.h"

#include <functional>

#include "core/Config.h"
#include "core/Errors.h"
#include "logging/Logger.h"
#include "utils/TimeHelper.h"

SimulatedMembershipClient::SimulatedMembershipClient(const uint32_t transientPct, const uint32_t terminalPct,
                                                     const uint32_t latencyMs, const uint32_t seed)
    : transientPct_{transientPct}, terminalPct_{terminalPct}, latencyMs_{latencyMs}, rng_{seed} {
}

SimulatedMembershipClient SimulatedMembershipClient::fromConfig(const uint32_t seed) {
    return {Config::Membership::TRANSIENT_FAILURE_PCT(), Config::Membership::TERMINAL_FAILURE_PCT(),
            Config::Membership::LATENCY_MS(), seed};
}

bool SimulatedMembershipClient::rollTransient() {
    if (transientPct_ == 0) return false;
    std::lock_guard<std::mutex> lock(rngMutex_);
    return std::uniform_int_distribution<uint32_t>(0, 99)(rng_) < transientPct_;
}

std::vector<InviteOutcome> SimulatedMembershipClient::invite(const uint32_t teamId,
                                                             const std::vector<std::string> &identities) {
    if (latencyMs_ > 0) TimeHelper::sleepMs(latencyMs_);
    if (rollTransient()) {
        Logger::warn(Logger::Source::Worker, tag_, "team %u: service unavailable", teamId);
        throw membership_error(503, "membership service unavailable");
    }

    std::vector<InviteOutcome> outcomes;
    outcomes.reserve(identities.size());
    for (const auto &identity: identities) {
        if (std::hash<std::string>{}(identity) % 100 < terminalPct_) {
            outcomes.push_back({identity, false, 400, "identity rejected"});
        } else {
            outcomes.push_back({identity, true, 200, ""});
        }
    }
    return outcomes;
}

bool SimulatedMembershipClient::remove(const uint32_t teamId, const std::string &identity) {
    if (latencyMs_ > 0) TimeHelper::sleepMs(latencyMs_);
    if (rollTransient()) {
        throw membership_error(503, "membership service unavailable");
    }
    Logger::debug(Logger::Source::Client, tag_, "removed %s from team %u", identity.c_str(), teamId);
    return true;
}
