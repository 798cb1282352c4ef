#include "snapshot.h"

#include <ctime>

using json = nlohmann::json;
using namespace std;

namespace parkcore {

string isoUtc(TimePoint t) {
    time_t tt = chrono::system_clock::to_time_t(t);
    tm parts{};
    gmtime_r(&tt, &parts);
    char buf[32];
    size_t n = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &parts);
    return string(buf, n);
}

template <typename T>
static json orNull(const optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

static json orNull(const optional<TimePoint>& v) {
    return v ? json(isoUtc(*v)) : json(nullptr);
}

void to_json(json& j, const ParkingLot& l) {
    j = json{{"id", l.id}, {"name", l.name}, {"status", toString(l.status)}};
}

void to_json(json& j, const Zone& z) {
    j = json{{"id", z.id}, {"lotId", z.lotId}, {"name", z.name}, {"code", z.code},
             {"level", z.level}, {"sortOrder", z.sortOrder}, {"zoneType", toString(z.zoneType)}};
}

void to_json(json& j, const Slot& s) {
    j = json{{"id", s.id}, {"zoneId", s.zoneId}, {"slotNumber", s.slotNumber},
             {"vehicleType", toString(s.vehicleType)}, {"isAccessible", s.isAccessible},
             {"hasEvCharger", s.hasEvCharger}, {"status", toString(s.status)},
             {"isOccupied", s.isOccupied}, {"isUnderMaintenance", s.isUnderMaintenance}};
}

void to_json(json& j, const Token& t) {
    j = json{{"id", t.id}, {"lotId", t.lotId}, {"tokenNumber", t.tokenNumber},
             {"tokenType", toString(t.tokenType)}, {"entryTime", isoUtc(t.entryTime)},
             {"exitTime", orNull(t.exitTime)}, {"allocatedSlotId", orNull(t.allocatedSlotId)},
             {"licensePlate", orNull(t.licensePlate)},
             {"vehicleType", t.vehicleType ? json(toString(*t.vehicleType)) : json(nullptr)},
             {"expectedDuration", orNull(t.expectedDurationMinutes)},
             {"status", toString(t.status)}};
}

void to_json(json& j, const PricingRule& r) {
    json slabs = json::array();
    for (const Slab& s : r.slabs) slabs.push_back({{"upToHours", s.upToHours}, {"rate", s.rate}});
    j = json{{"id", r.id}, {"lotId", r.lotId}, {"name", r.name},
             {"pricingModel", toString(r.model)}, {"baseRate", r.baseRate},
             {"hourlyRate", orNull(r.hourlyRate)}, {"dailyMaxRate", orNull(r.dailyMaxRate)},
             {"slabs", slabs}, {"priority", r.priority}, {"isActive", r.isActive},
             {"validFrom", orNull(r.validFrom)}, {"validUntil", orNull(r.validUntil)}};
}

void to_json(json& j, const Transaction& t) {
    j = json{{"id", t.id}, {"lotId", t.lotId}, {"tokenId", t.tokenId},
             {"entryTime", isoUtc(t.entryTime)}, {"exitTime", isoUtc(t.exitTime)},
             {"duration", t.durationMinutes}, {"grossAmount", t.grossAmount},
             {"tax", t.tax}, {"netAmount", t.netAmount},
             {"paymentStatus", toString(t.paymentStatus)},
             {"paymentMethod", t.paymentMethod ? json(toString(*t.paymentMethod)) : json(nullptr)},
             {"paymentRef", orNull(t.paymentRef)}, {"paidAt", orNull(t.paidAt)},
             {"receiptNumber", t.receiptNumber}};
}

void to_json(json& j, const SlotOccupancy& o) {
    j = json{{"id", o.id}, {"slotId", o.slotId}, {"tokenId", o.tokenId},
             {"startTime", isoUtc(o.startTime)}, {"endTime", orNull(o.endTime)}};
}

json snapshot(const Store& store) {
    StoreDump d = store.dump();
    return json{{"lots", d.lots}, {"zones", d.zones}, {"slots", d.slots},
                {"pricingRules", d.pricingRules}, {"tokens", d.tokens},
                {"transactions", d.transactions}, {"slotOccupancies", d.occupancies}};
}

} // namespace parkcore
