#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fee_engine.h"
#include "log.h"
#include "models.h"
#include "retry.h"

namespace parkcore {

class Store;

struct EngineConfig {
    FeePolicy fees;
    std::chrono::milliseconds lockTimeout{3000};
    RetryPolicy retry;
    log::Level logLevel = log::Level::Info;
};

struct FacilityConfig {
    EngineConfig engine;
    std::vector<ParkingLot> lots;
    std::vector<Zone> zones;
    std::vector<Slot> slots;
    std::vector<PricingRule> pricingRules;
};

EngineConfig parseEngineConfig(const nlohmann::json& j);
FacilityConfig parseConfig(const nlohmann::json& j);
FacilityConfig loadConfigFromJson(const std::string& path);

// Adds every lot, zone, slot and pricing rule to the store.
void installFacility(Store& store, const FacilityConfig& cfg);

} // namespace parkcore
