#include "types.h"
#include "errors.h"

using namespace std;

namespace parkcore {

const char* toString(VehicleType v) {
    switch (v) {
        case VehicleType::Any:        return "ANY";
        case VehicleType::Car:        return "CAR";
        case VehicleType::Suv:        return "SUV";
        case VehicleType::Motorcycle: return "MOTORCYCLE";
        case VehicleType::Bus:        return "BUS";
        case VehicleType::Truck:      return "TRUCK";
        case VehicleType::Van:        return "VAN";
        case VehicleType::Bicycle:    return "BICYCLE";
    }
    return "ANY";
}

const char* toString(ZoneType z) {
    switch (z) {
        case ZoneType::General:    return "GENERAL";
        case ZoneType::Vip:        return "VIP";
        case ZoneType::EvCharging: return "EV_CHARGING";
        case ZoneType::Disabled:   return "DISABLED";
        case ZoneType::Staff:      return "STAFF";
        case ZoneType::Visitor:    return "VISITOR";
        case ZoneType::ShortTerm:  return "SHORT_TERM";
        case ZoneType::LongTerm:   return "LONG_TERM";
        case ZoneType::TwoWheeler: return "TWO_WHEELER";
        case ZoneType::Valet:      return "VALET";
        case ZoneType::Reserved:   return "RESERVED";
    }
    return "GENERAL";
}

const char* toString(LotStatus s) {
    switch (s) {
        case LotStatus::Active:      return "ACTIVE";
        case LotStatus::Maintenance: return "MAINTENANCE";
        case LotStatus::Closed:      return "CLOSED";
        case LotStatus::ComingSoon:  return "COMING_SOON";
    }
    return "ACTIVE";
}

const char* toString(SlotStatus s) {
    switch (s) {
        case SlotStatus::Available:   return "AVAILABLE";
        case SlotStatus::Reserved:    return "RESERVED";
        case SlotStatus::Occupied:    return "OCCUPIED";
        case SlotStatus::Maintenance: return "MAINTENANCE";
    }
    return "AVAILABLE";
}

const char* toString(TokenStatus s) {
    switch (s) {
        case TokenStatus::Active:    return "ACTIVE";
        case TokenStatus::Completed: return "COMPLETED";
        case TokenStatus::Cancelled: return "CANCELLED";
        case TokenStatus::Expired:   return "EXPIRED";
        case TokenStatus::Lost:      return "LOST";
    }
    return "ACTIVE";
}

const char* toString(TokenType t) {
    switch (t) {
        case TokenType::QrCode:  return "QR_CODE";
        case TokenType::Rfid:    return "RFID";
        case TokenType::Barcode: return "BARCODE";
        case TokenType::Anpr:    return "ANPR";
        case TokenType::Manual:  return "MANUAL";
    }
    return "QR_CODE";
}

const char* toString(PricingModel m) {
    switch (m) {
        case PricingModel::FlatRate: return "FLAT_RATE";
        case PricingModel::Hourly:   return "HOURLY";
        case PricingModel::Slab:     return "SLAB";
        case PricingModel::Free:     return "FREE";
    }
    return "HOURLY";
}

const char* toString(PaymentMethod m) {
    switch (m) {
        case PaymentMethod::Cash:     return "CASH";
        case PaymentMethod::Card:     return "CARD";
        case PaymentMethod::Upi:      return "UPI";
        case PaymentMethod::Wallet:   return "WALLET";
        case PaymentMethod::Postpaid: return "POSTPAID";
        case PaymentMethod::Free:     return "FREE";
    }
    return "CASH";
}

const char* toString(PaymentStatus s) {
    return s == PaymentStatus::Completed ? "COMPLETED" : "PENDING";
}

const char* toString(EngineStatus s) {
    switch (s) {
        case EngineStatus::Ok:                     return "OK";
        case EngineStatus::NoSlotAvailable:        return "NO_SLOT_AVAILABLE";
        case EngineStatus::TokenNotFound:          return "TOKEN_NOT_FOUND";
        case EngineStatus::InvalidStateTransition: return "INVALID_STATE_TRANSITION";
    }
    return "OK";
}

const char* describe(EngineStatus s) {
    switch (s) {
        case EngineStatus::Ok:                     return "ok";
        case EngineStatus::NoSlotAvailable:        return "no slots available";
        case EngineStatus::TokenNotFound:          return "token not found";
        case EngineStatus::InvalidStateTransition: return "session already closed";
    }
    return "ok";
}

// ---------- parsing ----------
template <typename E, size_t N>
static E parseEnum(const string& s, const E (&all)[N], const char* what) {
    for (E e : all)
        if (s == toString(e)) return e;
    throw ConfigError(string("Invalid ") + what + ": " + s);
}

VehicleType vehicleTypeFromString(const string& s) {
    static const VehicleType all[] = {
        VehicleType::Any, VehicleType::Car, VehicleType::Suv, VehicleType::Motorcycle,
        VehicleType::Bus, VehicleType::Truck, VehicleType::Van, VehicleType::Bicycle};
    return parseEnum(s, all, "VehicleType");
}

ZoneType zoneTypeFromString(const string& s) {
    static const ZoneType all[] = {
        ZoneType::General, ZoneType::Vip, ZoneType::EvCharging, ZoneType::Disabled,
        ZoneType::Staff, ZoneType::Visitor, ZoneType::ShortTerm, ZoneType::LongTerm,
        ZoneType::TwoWheeler, ZoneType::Valet, ZoneType::Reserved};
    return parseEnum(s, all, "ZoneType");
}

LotStatus lotStatusFromString(const string& s) {
    static const LotStatus all[] = {
        LotStatus::Active, LotStatus::Maintenance, LotStatus::Closed, LotStatus::ComingSoon};
    return parseEnum(s, all, "LotStatus");
}

PricingModel pricingModelFromString(const string& s) {
    static const PricingModel all[] = {
        PricingModel::FlatRate, PricingModel::Hourly, PricingModel::Slab, PricingModel::Free};
    return parseEnum(s, all, "PricingModel");
}

} // namespace parkcore
