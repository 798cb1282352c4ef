#include "test_support.h"
#include "identifiers.h"

#include <ctime>

namespace parkcore {
namespace testutil {

TimePoint at(std::chrono::minutes offset) {
    std::tm parts{};
    parts.tm_year = 2025 - 1900;
    parts.tm_mon = 2;
    parts.tm_mday = 10;
    parts.tm_hour = 9;
    return std::chrono::system_clock::from_time_t(timegm(&parts)) + offset;
}

EngineConfig fastConfig() {
    EngineConfig c;
    c.lockTimeout = std::chrono::milliseconds(500);
    c.retry.maxAttempts = 2;
    c.retry.initialBackoff = std::chrono::milliseconds(1);
    c.logLevel = log::Level::Error;
    log::setLevel(c.logLevel);
    return c;
}

FacilityBuilder::FacilityBuilder(const std::string& lotName) {
    ParkingLot lot;
    lot.id = newId();
    lot.name = lotName;
    cfg_.lots.push_back(lot);
    cfg_.engine = fastConfig();
}

Id FacilityBuilder::zone(const std::string& code, int level, int sortOrder, ZoneType type) {
    Zone z;
    z.id = newId();
    z.lotId = lotId();
    z.name = code;
    z.code = code;
    z.level = level;
    z.sortOrder = sortOrder;
    z.zoneType = type;
    cfg_.zones.push_back(z);
    return z.id;
}

Slot& FacilityBuilder::slot(const Id& zoneId, const std::string& number, VehicleType vt) {
    Slot s;
    s.id = newId();
    s.zoneId = zoneId;
    s.slotNumber = number;
    s.vehicleType = vt;
    cfg_.slots.push_back(s);
    return cfg_.slots.back();
}

PricingRule& FacilityBuilder::rule(PricingModel model, Money base, int priority) {
    PricingRule r;
    r.id = newId();
    r.lotId = lotId();
    r.name = toString(model);
    r.model = model;
    r.baseRate = base;
    r.priority = priority;
    cfg_.pricingRules.push_back(r);
    return cfg_.pricingRules.back();
}

PricingRule& FacilityBuilder::hourly(Money base, Money hourlyRate, std::optional<Money> dailyMax,
                                     int priority) {
    PricingRule& r = rule(PricingModel::Hourly, base, priority);
    r.hourlyRate = hourlyRate;
    r.dailyMaxRate = dailyMax;
    return r;
}

LogCapture::LogCapture(log::Level level) : previous_(log::level()) {
    log::setSink(&buf_);
    log::setLevel(level);
}

LogCapture::~LogCapture() {
    log::setSink(nullptr);
    log::setLevel(previous_);
}

} // namespace testutil
} // namespace parkcore
