#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "engine.h"
#include "snapshot.h"

using namespace std;
using namespace parkcore;

// ---------- Demo helpers ----------
static string inr(Money paisa) {
    ostringstream os;
    os << "INR " << paisa / 100 << '.' << setw(2) << setfill('0') << paisa % 100;
    return os.str();
}

static void printSession(const Session& s) {
    cout << "Token: " << s.token.tokenNumber << " | Slot: " << s.slot.slotNumber
         << " | Plate: " << s.token.licensePlate.value_or("-") << "\n";
}

static void printBill(const CompletionRecord& r) {
    const Transaction& t = r.transaction;
    cout << "------ BILL ------\n";
    cout << "Receipt: " << t.receiptNumber << " | Token: " << r.token.tokenNumber << "\n";
    cout << "In : " << isoUtc(t.entryTime) << "\n";
    cout << "Out: " << isoUtc(t.exitTime) << "\n";
    cout << "Parked: " << r.fee.parkedMinutes << " mins, Billed: " << r.fee.billedHours << " hour(s)\n";
    cout << "Gross: " << inr(t.grossAmount) << " | Tax: " << inr(t.tax)
         << " | Net: " << inr(t.netAmount) << "\n";
    cout << "Payment: " << toString(t.paymentStatus);
    if (t.paymentMethod) cout << " (" << toString(*t.paymentMethod) << ")";
    cout << "\n------------------\n";
}

static void printOccupancy(const ParkingEngine& eng, const ParkingLot& lot) {
    OccupancySummary o = eng.occupancy(lot.id);
    cout << lot.name << " -> Active: " << o.activeTokens
         << " | free/reserved/occupied/total: " << o.available << "/" << o.reserved << "/"
         << o.occupied << "/" << o.total << "\n";
}

int main(int argc, char** argv) {
    try {
        const string path = argc > 1 ? argv[1] : "parking_config.json";
        const long long minutes = argc > 2 ? atoll(argv[2]) : 90;

        // Bootstrap
        FacilityConfig facility = loadConfigFromJson(path);

        ManualClock clock;
        ParkingEngine eng(facility.engine, clock);
        eng.install(facility);
        const ParkingLot& lot = facility.lots.front();

        // Entry
        EntryRequest car;
        car.constraints.vehicleType = VehicleType::Car;
        car.licensePlate = "dl8caf1234";
        auto entered = eng.enter(lot.id, car);
        if (!entered) {
            cout << "Entry refused: " << describe(entered.status) << "\n";
            return 0;
        }
        printSession(*entered);
        printOccupancy(eng, lot);

        clock.advance(chrono::minutes(minutes));

        auto quote = eng.estimateFee(entered->token.id);
        if (quote) cout << "Estimated: " << inr(quote->net) << "\n";

        // Exit
        auto done = eng.complete(entered->token.id, PaymentMethod::Card);
        if (!done) {
            cout << "Exit refused: " << describe(done.status) << "\n";
            return 0;
        }
        printBill(*done);

        auto again = eng.complete(entered->token.id);
        cout << "Second exit attempt: " << describe(again.status) << "\n";
        printOccupancy(eng, lot);

        // Operator abort
        EntryRequest bike;
        bike.constraints.vehicleType = VehicleType::Motorcycle;
        auto b = eng.enter(lot.id, bike);
        if (b) {
            printSession(*b);
            auto cancelled = eng.cancel(b->token.id);
            cout << "Cancel: " << describe(cancelled.status) << "\n";
        }
        printOccupancy(eng, lot);

    } catch (const std::exception& e) {
        cerr << "[FATAL] " << e.what() << "\n";
        return 1;
    }
}
