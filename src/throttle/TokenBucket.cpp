#include "throttle/TokenBucket.h"

#include <vector>

#include "core/Errors.h"
#include "logging/Logger.h"

namespace {
    constexpr auto SRC = Logger::Source::Client;
}

TokenBucket::TokenBucket(Coordinator &coordinator, SeatStore &store, const uint32_t ttlMs)
    : coordinator_{coordinator}, store_{store}, ttlMs_{ttlMs} {
}

TokenBucket::Outcome TokenBucket::tryConsume(const std::string &code) {
    const auto row = store_.code(code);
    if (!row) {
        throw invalid_code("unknown code " + code);
    }
    if (row->isUnlimited()) {
        // No bucket: durable usage is only informational for unlimited codes.
        store_.adjustCodeUsage(code, 1);
        return Outcome::UNLIMITED;
    }

    const std::string key = keyFor(code);
    try {
        std::optional<int64_t> left = coordinator_.counterTakeIfPositive(key);
        if (!left) {
            ensure(*row);
            left = coordinator_.counterTakeIfPositive(key);
        }
        if (!left || *left < 0) {
            Logger::info(SRC, tag_, "code %s exhausted", code.c_str());
            return Outcome::EXHAUSTED;
        }
        Logger::debug(SRC, tag_, "code %s consumed, %lld left", code.c_str(), static_cast<long long>(*left));
        return Outcome::CONSUMED;
    } catch (const coordination_unavailable &e) {
        Logger::error(SRC, tag_, "refusing %s, bucket unreachable: %s", code.c_str(), e.what());
        return Outcome::UNAVAILABLE;
    }
}

bool TokenBucket::refund(const std::string &code) {
    try {
        const auto after = coordinator_.counterAdd(keyFor(code), 1);
        if (after) {
            Logger::debug(SRC, tag_, "refunded %s, %lld left", code.c_str(), static_cast<long long>(*after));
            return true;
        }
        return false;
    } catch (const coordination_unavailable &e) {
        Logger::warn(SRC, tag_, "refund of %s not applied to bucket: %s", code.c_str(), e.what());
        return false;
    }
}

std::optional<int64_t> TokenBucket::remaining(const std::string &code) {
    try {
        return coordinator_.counterGet(keyFor(code));
    } catch (const coordination_unavailable &e) {
        Logger::warn(SRC, tag_, "remaining of %s unavailable: %s", code.c_str(), e.what());
        return std::nullopt;
    }
}

bool TokenBucket::ensure(const CodeRow &row) {
    if (row.isUnlimited()) return false;
    if (coordinator_.counterInit(keyFor(row.code), durableRemaining(row), ttlMs_)) {
        Logger::info(SRC, tag_, "initialized %s from store: %lld left", row.code,
                     static_cast<long long>(durableRemaining(row)));
    }
    return true;
}

void TokenBucket::rebuild(const CodeRow &row) {
    if (row.isUnlimited()) {
        coordinator_.counterRemove(keyFor(row.code));
        return;
    }
    coordinator_.counterSet(keyFor(row.code), durableRemaining(row), ttlMs_);
}

uint32_t TokenBucket::syncToStore() {
    const auto codes = store_.read([](const SeatTables &tables) {
        return std::vector<CodeRow>(tables.codes, tables.codes + tables.codeCount);
    });

    uint32_t synced = 0;
    for (const auto &row: codes) {
        if (row.isUnlimited()) continue;
        const auto left = coordinator_.counterGet(keyFor(row.code));
        if (!left) continue;
        const int64_t used = static_cast<int64_t>(row.maxUses) - (*left > 0 ? *left : 0);
        const uint32_t clamped = used > 0 ? static_cast<uint32_t>(used) : 0;
        if (clamped != row.usedCount) {
            store_.setCodeUsage(row.code, clamped);
            Logger::debug(SRC, tag_, "synced %s used=%u", row.code, clamped);
        }
        ++synced;
    }
    return synced;
}
