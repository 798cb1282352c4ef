#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace parkcore {

// ---- Facility layout: ParkingLot -> Zone -> Slot ----
struct ParkingLot {
    Id id;
    std::string name;
    LotStatus status = LotStatus::Active;
};

struct Zone {
    Id id;
    Id lotId;
    std::string name;
    std::string code;
    int level = 0;       // 0 = ground, negative = basements
    int sortOrder = 0;
    ZoneType zoneType = ZoneType::General;
};

struct Slot {
    Id id;
    Id zoneId;
    std::string slotNumber;
    VehicleType vehicleType = VehicleType::Any;
    bool isAccessible = false;
    bool hasEvCharger = false;
    SlotStatus status = SlotStatus::Available;
    bool isOccupied = false;
    bool isUnderMaintenance = false;
};

// ---- Session ----
struct Token {
    Id id;
    Id lotId;
    std::string tokenNumber;
    TokenType tokenType = TokenType::QrCode;
    TimePoint entryTime;
    std::optional<TimePoint> exitTime;
    std::optional<Id> allocatedSlotId;
    std::optional<std::string> licensePlate;
    std::optional<VehicleType> vehicleType;
    std::optional<long long> expectedDurationMinutes;
    TokenStatus status = TokenStatus::Active;
};

// ---- Pricing ----
struct Slab {
    unsigned long long upToHours = 0;   // hours this tier covers, not a running total
    Money rate = 0;         // per billed hour
};

struct PricingRule {
    Id id;
    Id lotId;
    std::string name;
    PricingModel model = PricingModel::Hourly;
    Money baseRate = 0;
    std::optional<Money> hourlyRate;
    std::optional<Money> dailyMaxRate;
    std::vector<Slab> slabs;
    int priority = 0;
    bool isActive = true;
    std::optional<TimePoint> validFrom;
    std::optional<TimePoint> validUntil;
};

// ---- Billing record ----
struct Transaction {
    Id id;
    Id lotId;
    Id tokenId;
    TimePoint entryTime;
    TimePoint exitTime;
    long long durationMinutes = 0;
    Money grossAmount = 0;
    Money tax = 0;
    Money netAmount = 0;
    PaymentStatus paymentStatus = PaymentStatus::Pending;
    std::optional<PaymentMethod> paymentMethod;
    std::optional<std::string> paymentRef;
    std::optional<TimePoint> paidAt;
    std::string receiptNumber;
};

// Append-only; endTime is set once, when the session leaves ACTIVE.
struct SlotOccupancy {
    Id id;
    Id slotId;
    Id tokenId;
    TimePoint startTime;
    std::optional<TimePoint> endTime;
};

} // namespace parkcore
