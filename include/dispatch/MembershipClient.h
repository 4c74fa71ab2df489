#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Per-identity answer of a batch invite call.
 */
struct InviteOutcome {
    std::string identity;
    bool ok;
    int32_t status; // HTTP-like; 0 = no response
    std::string message;

    [[nodiscard]] bool isTransient() const noexcept { return status == 0 || status == 429 || status >= 500; }
};

/**
 * @brief External membership service.
 *
 * A call that fails as a whole throws membership_error; a call that reaches
 * the service returns one outcome per identity.
 */
class MembershipClient {
public:
    virtual ~MembershipClient() = default;

    /** @throws membership_error If the whole call failed */
    virtual std::vector<InviteOutcome> invite(uint32_t teamId, const std::vector<std::string> &identities) = 0;

    /**
     * @return false if the identity was not a member
     * @throws membership_error If the call failed
     */
    virtual bool remove(uint32_t teamId, const std::string &identity) = 0;
};

/**
 * @brief Stand-in for the external service, driven by SEATPOOL_SIM_*.
 *
 * Whole calls fail transiently (503) with transientPct probability. An
 * identity is permanently rejected (400) when its hash falls under
 * terminalPct, so the same identity is rejected on every attempt.
 */
class SimulatedMembershipClient : public MembershipClient {
public:
    SimulatedMembershipClient(uint32_t transientPct, uint32_t terminalPct, uint32_t latencyMs, uint32_t seed);

    static SimulatedMembershipClient fromConfig(uint32_t seed);

    std::vector<InviteOutcome> invite(uint32_t teamId, const std::vector<std::string> &identities) override;

    bool remove(uint32_t teamId, const std::string &identity) override;

private:
    static constexpr auto tag_{"Membership"};

    bool rollTransient();

    uint32_t transientPct_;
    uint32_t terminalPct_;
    uint32_t latencyMs_;
    std::mutex rngMutex_;
    std::mt19937 rng_;
};
