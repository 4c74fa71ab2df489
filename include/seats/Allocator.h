#pragma once

#include <algorithm>
#include <iterator>
#include <cstdint>
#include <map>
#include <vector>

#include "seats/CapacityLedger.h"

/**
 * @brief Outcome of partitioning a batch across teams.
 * @tparam T Task type
 *
 * Task-conserving: every input task appears exactly once, either under one
 * team or in unallocated, and relative order is preserved in both.
 */
template<typename T>
struct AllocationResult {
    std::map<uint32_t, std::vector<T>> allocated; // team id -> tasks, ascending team id
    std::vector<T> unallocated;
    uint32_t totalAvailable{0};

    [[nodiscard]] size_t allocatedCount() const {
        size_t count = 0;
        for (const auto &entry: allocated) count += entry.second.size();
        return count;
    }
};

enum class AllocationStrategy : uint8_t {
    SEQUENTIAL_FILL, ///< one task at a time, lowest team id first
    GREEDY_SLICE ///< contiguous slice per team, fewer larger external calls
};

/**
 * @brief Deterministic partitioning of pending tasks over teams with free seats.
 *
 * Given the same task order and capacity snapshot, the result is identical.
 * Teams are always visited in ascending id order; teams without free seats
 * are ignored.
 */
namespace Allocator {
    namespace detail {
        inline std::vector<TeamCapacity> fillOrder(const std::vector<TeamCapacity> &teams) {
            std::vector<TeamCapacity> ordered;
            std::copy_if(teams.begin(), teams.end(), std::back_inserter(ordered),
                         [](const TeamCapacity &team) { return team.available > 0; });
            std::sort(ordered.begin(), ordered.end(),
                      [](const TeamCapacity &a, const TeamCapacity &b) { return a.teamId < b.teamId; });
            return ordered;
        }
    }

    /**
     * @brief Sequential fill: pop tasks from the front of the queue into each team in turn.
     * @param tasks Pending tasks in queue order
     * @param teams Capacity snapshot
     */
    template<typename T>
    AllocationResult<T> sequentialFill(const std::vector<T> &tasks, const std::vector<TeamCapacity> &teams) {
        AllocationResult<T> result;
        const auto ordered = detail::fillOrder(teams);
        for (const auto &team: ordered) result.totalAvailable += team.available;

        size_t next = 0;
        for (const auto &team: ordered) {
            if (next >= tasks.size()) break;
            uint32_t remaining = team.available;
            auto &bucket = result.allocated[team.teamId];
            while (next < tasks.size() && remaining > 0) {
                bucket.push_back(tasks[next++]);
                --remaining;
            }
        }
        result.unallocated.assign(tasks.begin() + static_cast<std::ptrdiff_t>(next), tasks.end());
        return result;
    }

    /**
     * @brief Greedy slice: hand each team min(remaining, available) tasks in one slice.
     */
    template<typename T>
    AllocationResult<T> greedySlice(const std::vector<T> &tasks, const std::vector<TeamCapacity> &teams) {
        AllocationResult<T> result;
        const auto ordered = detail::fillOrder(teams);
        for (const auto &team: ordered) result.totalAvailable += team.available;

        auto begin = tasks.begin();
        for (const auto &team: ordered) {
            if (begin == tasks.end()) break;
            const auto take = std::min<std::ptrdiff_t>(std::distance(begin, tasks.end()), team.available);
            result.allocated[team.teamId].assign(begin, begin + take);
            begin += take;
        }
        result.unallocated.assign(begin, tasks.end());
        return result;
    }

    template<typename T>
    AllocationResult<T> allocate(const AllocationStrategy strategy, const std::vector<T> &tasks,
                                 const std::vector<TeamCapacity> &teams) {
        return strategy == AllocationStrategy::GREEDY_SLICE ? greedySlice(tasks, teams) : sequentialFill(tasks, teams);
    }
}
