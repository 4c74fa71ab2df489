#include "coord/LocalCoordinator.h"

#include "utils/TimeHelper.h"

void LocalCoordinator::withTable(const TableFn &fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    fn(*table_, TimeHelper::nowMs());
}
