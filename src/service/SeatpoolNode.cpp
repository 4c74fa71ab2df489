#include "service/SeatpoolNode.h"

#include <unistd.h>

#include "core/Config.h"

namespace {
    std::unique_ptr<MembershipClient> orSimulated(std::unique_ptr<MembershipClient> client) {
        if (client) return client;
        const auto seed = static_cast<uint32_t>(time(nullptr)) ^ static_cast<uint32_t>(getpid());
        return std::make_unique<SimulatedMembershipClient>(Config::Membership::TRANSIENT_FAILURE_PCT(),
                                                           Config::Membership::TERMINAL_FAILURE_PCT(),
                                                           Config::Membership::LATENCY_MS(), seed);
    }

    WaitingQueueReconciler::Settings reconcileSettings() {
        WaitingQueueReconciler::Settings settings;
        settings.staleReservedSec = Config::Reconcile::STALE_RESERVED_SEC();
        return settings;
    }
}

SeatpoolNode::SeatpoolNode(const IpcKeys &keys, const Logger::Source source,
                           std::unique_ptr<MembershipClient> client)
    : shm_{SharedMemory<SharedSeatState>::attach(keys.shm)},
      sem_{keys.sem},
      taskMq_{keys.taskQueue, "TaskQueue"},
      coordinator_{keys.coord, sem_},
      client_{orSimulated(std::move(client))},
      store_{shm_.get()->store, sem_},
      ledger_{store_},
      queue_{taskMq_, sem_, shm_.get()->operational},
      bucket_{coordinator_, store_},
      compensator_{store_, bucket_},
      retrier_{store_, queue_, compensator_, RetryPolicy::fromConfig(),
               static_cast<uint32_t>(time(nullptr)) ^ static_cast<uint32_t>(getpid())},
      reservation_{store_, ledger_, source},
      semaphore_{coordinator_, "redeem:inflight", Config::Throttle::MAX_CONCURRENT_REDEEMS(),
                 Config::Throttle::ACQUIRE_TIMEOUT_MS()},
      rateLimiter_{coordinator_, "ratelimit:enqueue", Config::Throttle::RATE_LIMIT_PER_MIN(), 60'000},
      reconciler_{store_, ledger_, coordinator_, queue_, bucket_, compensator_,
                  "pid:" + std::to_string(getpid()), reconcileSettings()},
      service_{store_, ledger_, reservation_, queue_, bucket_, semaphore_, rateLimiter_, *client_} {
}
