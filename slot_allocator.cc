#include "slot_allocator.h"
#include "log.h"
#include "store.h"

#include <algorithm>
#include <tuple>

using namespace std;

namespace parkcore {

static bool vehicleFits(const Slot& s, const optional<VehicleType>& wanted) {
    if (!wanted || *wanted == VehicleType::Any) return true;
    return s.vehicleType == VehicleType::Any || s.vehicleType == *wanted;
}

bool isAllocatable(const Slot& slot, const Zone& zone, const AllocationConstraints& c) {
    if (slot.status != SlotStatus::Available) return false;
    if (slot.isOccupied || slot.isUnderMaintenance) return false;
    if (!vehicleFits(slot, c.vehicleType)) return false;
    if (c.requireAccessible && !slot.isAccessible) return false;
    if (c.requireEvCharger && !slot.hasEvCharger) return false;
    if (c.preferredZoneType && zone.zoneType != *c.preferredZoneType) return false;
    return true;
}

vector<Slot> SlotAllocator::candidates(const Id& lotId, const AllocationConstraints& c) const {
    struct Ranked { Zone zone; Slot slot; };
    vector<Ranked> ranked;
    for (const Zone& z : store_.zonesOfLot(lotId))
        for (Slot& s : store_.slotsOfZone(z.id))
            if (isAllocatable(s, z, c)) ranked.push_back({z, std::move(s)});

    sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        return tie(a.zone.level, a.zone.sortOrder, a.slot.slotNumber, a.slot.id) <
               tie(b.zone.level, b.zone.sortOrder, b.slot.slotNumber, b.slot.id);
    });

    vector<Slot> res;
    res.reserve(ranked.size());
    for (auto& r : ranked) res.push_back(std::move(r.slot));
    return res;
}

optional<Slot> SlotAllocator::allocate(UnitOfWork& uow, const Id& lotId,
                                       const AllocationConstraints& c) const {
    for (const Slot& cand : candidates(lotId, c)) {
        if (uow.holdsSlot(cand.id)) continue;   // already claimed by this unit
        if (!uow.tryLockSlot(cand.id)) {
            log::debug(uow.label() + ": slot " + cand.slotNumber + " held by another allocation, skipping");
            continue;
        }
        // The committed row may have changed between the candidate read and the lock.
        optional<Slot> current = uow.slot(cand.id);
        optional<Zone> zone = current ? store_.zone(current->zoneId) : nullopt;
        if (!current || !zone || !isAllocatable(*current, *zone, c)) {
            uow.unlockSlot(cand.id);
            continue;
        }
        current->status = SlotStatus::Reserved;
        current->isOccupied = false;
        uow.putSlot(*current);
        return current;
    }
    return nullopt;
}

} // namespace parkcore
