#pragma once

#include <optional>
#include <vector>

#include "models.h"

namespace parkcore {

class Store;
class UnitOfWork;

struct AllocationConstraints {
    std::optional<VehicleType> vehicleType;       // nullopt or Any: no restriction
    std::optional<ZoneType> preferredZoneType;
    bool requireAccessible = false;
    bool requireEvCharger = false;
};

// A slot is allocatable when it is AVAILABLE, not occupied, not under
// maintenance, fits the vehicle type and meets every optional constraint.
bool isAllocatable(const Slot& slot, const Zone& zone, const AllocationConstraints& c);

/*
 Picks the lowest (level, sortOrder, slotNumber) candidate and reserves it.
 Rows locked by a concurrent, uncommitted allocation are skipped instead of
 waited on; the claimed row is re-checked under its lock.
*/
class SlotAllocator {
public:
    explicit SlotAllocator(const Store& store) : store_(store) {}

    // Reserves inside `uow`; nullopt means no slot is available.
    std::optional<Slot> allocate(UnitOfWork& uow, const Id& lotId,
                                 const AllocationConstraints& c) const;

    // Ranked candidates from committed state, no locks taken.
    std::vector<Slot> candidates(const Id& lotId, const AllocationConstraints& c) const;

private:
    const Store& store_;
};

} // namespace parkcore
