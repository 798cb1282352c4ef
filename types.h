#pragma once

#include <chrono>
#include <string>

namespace parkcore {

// ===================== Common =====================
using Id        = std::string;
using Money     = unsigned long long;   // smallest currency unit (paisa)
using TimePoint = std::chrono::system_clock::time_point;

enum class VehicleType { Any, Car, Suv, Motorcycle, Bus, Truck, Van, Bicycle };
enum class ZoneType    { General, Vip, EvCharging, Disabled, Staff, Visitor,
                         ShortTerm, LongTerm, TwoWheeler, Valet, Reserved };
enum class LotStatus   { Active, Maintenance, Closed, ComingSoon };
enum class SlotStatus  { Available, Reserved, Occupied, Maintenance };
enum class TokenStatus { Active, Completed, Cancelled, Expired, Lost };
enum class TokenType   { QrCode, Rfid, Barcode, Anpr, Manual };
enum class PricingModel  { FlatRate, Hourly, Slab, Free };
enum class PaymentMethod { Cash, Card, Upi, Wallet, Postpaid, Free };
enum class PaymentStatus { Pending, Completed };

// Upper-case wire names ("CAR", "EV_CHARGING", ...). The parse functions
// throw ConfigError on an unknown name.
const char* toString(VehicleType v);
const char* toString(ZoneType z);
const char* toString(LotStatus s);
const char* toString(SlotStatus s);
const char* toString(TokenStatus s);
const char* toString(TokenType t);
const char* toString(PricingModel m);
const char* toString(PaymentMethod m);
const char* toString(PaymentStatus s);

VehicleType   vehicleTypeFromString(const std::string& s);
ZoneType      zoneTypeFromString(const std::string& s);
LotStatus     lotStatusFromString(const std::string& s);
PricingModel  pricingModelFromString(const std::string& s);

inline bool isTerminal(TokenStatus s) { return s != TokenStatus::Active; }

} // namespace parkcore
