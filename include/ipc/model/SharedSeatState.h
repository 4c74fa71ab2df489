#pragma once

#include "SeatTables.h"
#include "SharedOperationalState.h"

/**
 * @brief The one segment every seatpool process attaches.
 *
 * store holds the durable tables (teams, members, invites, waiting rows,
 * codes, compensations) and is guarded by SHM_STORE; operational holds the
 * worker slots, the delayed-task table and counters, guarded by
 * SHM_OPERATIONAL. A reservation additionally holds the row semaphore of
 * each team it touches, taken in ascending team id before either table lock.
 */
struct SharedSeatState {
    SharedOperationalState operational;
    SeatTables store;
};
