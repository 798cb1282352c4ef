#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "models.h"
#include "store.h"

namespace parkcore {

// ISO-8601 UTC, second precision ("2025-01-31T09:30:00Z").
std::string isoUtc(TimePoint t);

void to_json(nlohmann::json& j, const ParkingLot& l);
void to_json(nlohmann::json& j, const Zone& z);
void to_json(nlohmann::json& j, const Slot& s);
void to_json(nlohmann::json& j, const Token& t);
void to_json(nlohmann::json& j, const PricingRule& r);
void to_json(nlohmann::json& j, const Transaction& t);
void to_json(nlohmann::json& j, const SlotOccupancy& o);

// Audit export of every table.
nlohmann::json snapshot(const Store& store);

} // namespace parkcore
