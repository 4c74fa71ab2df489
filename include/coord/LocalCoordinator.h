#pragma once

#include <memory>
#include <mutex>

#include "coord/TableCoordinator.h"

/**
 * @brief Single-node coordinator: the table lives in this process.
 *
 * Suitable when one process runs the request path and the workers as threads,
 * and for unit tests of the throttle primitives.
 */
class LocalCoordinator : public TableCoordinator {
public:
    LocalCoordinator() : table_{std::make_unique<SharedCoordinatorState>()} {
    }

protected:
    void withTable(const TableFn &fn) override;

private:
    std::mutex mutex_;
    std::unique_ptr<SharedCoordinatorState> table_;
};
