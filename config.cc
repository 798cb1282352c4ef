#include "config.h"
#include "errors.h"
#include "identifiers.h"
#include "store.h"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

using json = nlohmann::json;
using namespace std;

namespace parkcore {

// ---------- JSON helpers ----------
static const json& must(const json& j, const char* key) {
    if (!j.contains(key))
        throw ConfigError(string("Config missing key: ") + key);
    return j.at(key);
}

template <typename T>
static T get(const json& j, const char* key) {
    try {
        return must(j, key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(string("Config key '") + key + "' has the wrong type: " + e.what());
    }
}

template <typename T>
static T getOr(const json& j, const char* key, T fallback) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    return get<T>(j, key);
}

static Money money(const json& j, const char* key) {
    const json& v = must(j, key);
    if (!v.is_number_integer() || v.get<long long>() < 0)
        throw ConfigError(string("Config key '") + key + "' must be a non-negative integer");
    return v.get<Money>();
}

// Integer in [lo, hi]; nlohmann would otherwise wrap a negative into an unsigned.
static unsigned boundedUnsigned(const json& j, const char* key, unsigned fallback,
                                long long lo, long long hi) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    const json& v = j.at(key);
    if (!v.is_number_integer() || v.get<long long>() < lo || v.get<long long>() > hi)
        throw ConfigError(string("Config key '") + key + "' must be an integer in [" +
                          to_string(lo) + ", " + to_string(hi) + "]");
    return static_cast<unsigned>(v.get<long long>());
}

static optional<Money> optionalMoney(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return nullopt;
    return money(j, key);
}

// "2025-01-31T00:00:00Z", UTC only.
static TimePoint parseUtc(const string& s) {
    tm parts{};
    istringstream in(s);
    in >> get_time(&parts, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) throw ConfigError("Invalid timestamp: " + s);
    return chrono::system_clock::from_time_t(timegm(&parts));
}

static optional<TimePoint> optionalTime(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return nullopt;
    return parseUtc(get<string>(j, key));
}

static Id idOrNew(const json& j) {
    return j.contains("id") ? get<string>(j, "id") : newId();
}

// ---------- sections ----------
EngineConfig parseEngineConfig(const json& j) {
    EngineConfig c;
    if (j.is_null()) return c;
    if (!j.is_object()) throw ConfigError("Config 'engine' must be an object");

    c.fees.taxPercent = boundedUnsigned(j, "taxPercent", c.fees.taxPercent, 0, 100);
    if (j.contains("defaultHourlyRate")) c.fees.defaultHourlyRate = money(j, "defaultHourlyRate");
    c.lockTimeout = chrono::milliseconds(getOr<long long>(j, "lockTimeoutMs", c.lockTimeout.count()));
    c.retry.maxAttempts = boundedUnsigned(j, "maxAttempts", c.retry.maxAttempts, 1, 100);
    c.retry.initialBackoff = chrono::milliseconds(
        getOr<long long>(j, "backoffMs", c.retry.initialBackoff.count()));
    if (j.contains("logLevel")) c.logLevel = log::levelFromString(get<string>(j, "logLevel"));

    if (c.lockTimeout.count() <= 0) throw ConfigError("Config 'lockTimeoutMs' must be positive");
    return c;
}

static PricingRule parseRule(const json& jr, const Id& lotId) {
    PricingRule r;
    r.id = idOrNew(jr);
    r.lotId = lotId;
    r.name = getOr<string>(jr, "name", "");
    r.model = pricingModelFromString(get<string>(jr, "pricingModel"));
    r.baseRate = jr.contains("baseRate") ? money(jr, "baseRate") : 0;
    r.hourlyRate = optionalMoney(jr, "hourlyRate");
    r.dailyMaxRate = optionalMoney(jr, "dailyMaxRate");
    r.priority = getOr<int>(jr, "priority", 0);
    r.isActive = getOr<bool>(jr, "isActive", true);
    r.validFrom = optionalTime(jr, "validFrom");
    r.validUntil = optionalTime(jr, "validUntil");

    if (jr.contains("slabs")) {
        const auto& jslabs = jr.at("slabs");
        if (!jslabs.is_array()) throw ConfigError("Config 'slabs' must be an array for rule " + r.name);
        for (const auto& js : jslabs) {
            const json& hours = must(js, "upToHours");
            if (!hours.is_number_integer() || hours.get<long long>() <= 0)
                throw ConfigError("Slab 'upToHours' must be a positive whole number in rule " + r.name);
            Slab s;
            s.upToHours = hours.get<unsigned long long>();
            s.rate = money(js, "rate");
            r.slabs.push_back(s);
        }
    }
    if (r.model == PricingModel::Slab && r.slabs.empty())
        log::warn("Pricing rule '" + r.name + "' is SLAB with no slabs; baseRate applies");
    return r;
}

FacilityConfig parseConfig(const json& j) {
    FacilityConfig cfg;
    cfg.engine = parseEngineConfig(j.contains("engine") ? j.at("engine") : json());

    const auto& jlots = must(j, "lots");
    if (!jlots.is_array()) throw ConfigError("Config 'lots' must be an array");

    for (const auto& jl : jlots) {
        ParkingLot lot;
        lot.id = idOrNew(jl);
        lot.name = get<string>(jl, "name");
        lot.status = lotStatusFromString(getOr<string>(jl, "status", "ACTIVE"));

        const auto& jzones = must(jl, "zones");
        if (!jzones.is_array() || jzones.empty())
            throw ConfigError("Lot " + lot.name + " must have a non-empty 'zones' array");

        set<string> slotNumbers;
        for (const auto& jz : jzones) {
            Zone z;
            z.id = idOrNew(jz);
            z.lotId = lot.id;
            z.name = get<string>(jz, "name");
            z.code = getOr<string>(jz, "code", z.name);
            z.level = getOr<int>(jz, "level", 0);
            z.sortOrder = getOr<int>(jz, "sortOrder", 0);
            z.zoneType = zoneTypeFromString(getOr<string>(jz, "zoneType", "GENERAL"));

            const auto& jslots = must(jz, "slots");
            if (!jslots.is_array() || jslots.empty())
                throw ConfigError("Zone " + z.code + " has no slots in config");

            for (const auto& js : jslots) {
                Slot s;
                s.id = idOrNew(js);
                s.zoneId = z.id;
                s.slotNumber = get<string>(js, "slotNumber");
                s.vehicleType = vehicleTypeFromString(getOr<string>(js, "vehicleType", "ANY"));
                s.isAccessible = getOr<bool>(js, "isAccessible", false);
                s.hasEvCharger = getOr<bool>(js, "hasEvCharger", false);
                s.isUnderMaintenance = getOr<bool>(js, "isUnderMaintenance", false);
                s.status = s.isUnderMaintenance ? SlotStatus::Maintenance : SlotStatus::Available;
                if (!slotNumbers.insert(s.slotNumber).second)
                    throw ConfigError("Duplicate slot number in lot " + lot.name + ": " + s.slotNumber);
                cfg.slots.push_back(std::move(s));
            }
            cfg.zones.push_back(std::move(z));
        }

        if (jl.contains("pricingRules")) {
            const auto& jrules = jl.at("pricingRules");
            if (!jrules.is_array()) throw ConfigError("Config 'pricingRules' must be an array");
            for (const auto& jr : jrules) cfg.pricingRules.push_back(parseRule(jr, lot.id));
        }
        cfg.lots.push_back(std::move(lot));
    }
    if (cfg.lots.empty()) throw ConfigError("Config has zero lots");
    return cfg;
}

FacilityConfig loadConfigFromJson(const string& path) {
    ifstream f(path);
    if (!f) throw ConfigError("Could not open config file: " + path);

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Could not parse config file " + path + ": " + e.what());
    }
    return parseConfig(j);
}

void installFacility(Store& store, const FacilityConfig& cfg) {
    for (const auto& l : cfg.lots) store.addLot(l);
    for (const auto& z : cfg.zones) store.addZone(z);
    for (const auto& s : cfg.slots) store.addSlot(s);
    for (const auto& r : cfg.pricingRules) store.addPricingRule(r);
    log::info("Installed " + to_string(cfg.lots.size()) + " lot(s), " +
              to_string(cfg.zones.size()) + " zone(s), " + to_string(cfg.slots.size()) + " slot(s)");
}

} // namespace parkcore
