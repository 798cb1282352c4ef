#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "slot_allocator.h"
#include "store.h"
#include "test_support.h"

using namespace std::chrono;
using namespace parkcore;
using parkcore::testutil::FacilityBuilder;

namespace {

class SlotAllocatorTest : public ::testing::Test {
protected:
    void SetUp() override { testutil::fastConfig(); }

    void install() { installFacility(store, fb.config()); }

    // One committed allocation.
    std::optional<Slot> allocateOne(const AllocationConstraints& c = {}) {
        SlotAllocator alloc(store);
        UnitOfWork uow(store, milliseconds(500), "test");
        auto s = alloc.allocate(uow, fb.lotId(), c);
        uow.commit();
        return s;
    }

    FacilityBuilder fb;
    Store store;
};

} // namespace

TEST_F(SlotAllocatorTest, PrefersLowestLevelThenSortOrderThenSlotNumber) {
    Id upper = fb.zone("UP", 1, 0);
    Id groundB = fb.zone("GB", 0, 1);
    Id groundA = fb.zone("GA", 0, 0);
    fb.slot(upper, "U-1");
    fb.slot(groundB, "B-2");
    fb.slot(groundB, "B-1");
    fb.slot(groundA, "A-2");
    fb.slot(groundA, "A-1");
    install();

    std::vector<std::string> order;
    while (auto s = allocateOne()) order.push_back(s->slotNumber);
    EXPECT_EQ(order, (std::vector<std::string>{"A-1", "A-2", "B-1", "B-2", "U-1"}));
}

TEST_F(SlotAllocatorTest, ReservedSlotIsNotOfferedAgain) {
    Id z = fb.zone("A", 0, 0);
    fb.slot(z, "A-1");
    install();

    auto first = allocateOne();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->status, SlotStatus::Reserved);
    EXPECT_EQ(store.slot(first->id)->status, SlotStatus::Reserved);
    EXPECT_FALSE(store.slot(first->id)->isOccupied);
    EXPECT_FALSE(allocateOne().has_value());
}

TEST_F(SlotAllocatorTest, VehicleTypeMatchesExactlyOrAny) {
    Id z = fb.zone("A", 0, 0);
    fb.slot(z, "A-1", VehicleType::Motorcycle);
    fb.slot(z, "A-2", VehicleType::Car);
    fb.slot(z, "A-3", VehicleType::Any);
    install();

    AllocationConstraints car;
    car.vehicleType = VehicleType::Car;
    EXPECT_EQ(allocateOne(car)->slotNumber, "A-2");
    EXPECT_EQ(allocateOne(car)->slotNumber, "A-3");
    EXPECT_FALSE(allocateOne(car).has_value());

    AllocationConstraints anything;
    anything.vehicleType = VehicleType::Any;
    EXPECT_EQ(allocateOne(anything)->slotNumber, "A-1");
}

TEST_F(SlotAllocatorTest, OptionalConstraintsMustAllHold) {
    Id general = fb.zone("G", 0, 0, ZoneType::General);
    Id ev = fb.zone("EV", 1, 0, ZoneType::EvCharging);
    fb.slot(general, "G-1");
    fb.slot(general, "G-2").isAccessible = true;
    fb.slot(ev, "EV-1").hasEvCharger = true;
    Slot& both = fb.slot(ev, "EV-2");
    both.hasEvCharger = true;
    both.isAccessible = true;
    install();

    AllocationConstraints accessible;
    accessible.requireAccessible = true;
    EXPECT_EQ(allocateOne(accessible)->slotNumber, "G-2");

    AllocationConstraints evAccessible;
    evAccessible.requireAccessible = true;
    evAccessible.requireEvCharger = true;
    EXPECT_EQ(allocateOne(evAccessible)->slotNumber, "EV-2");

    AllocationConstraints evZone;
    evZone.preferredZoneType = ZoneType::EvCharging;
    EXPECT_EQ(allocateOne(evZone)->slotNumber, "EV-1");
    EXPECT_FALSE(allocateOne(evZone).has_value());
}

TEST_F(SlotAllocatorTest, SkipsMaintenanceAndOccupiedSlots) {
    Id z = fb.zone("A", 0, 0);
    Slot& down = fb.slot(z, "A-1");
    down.isUnderMaintenance = true;
    down.status = SlotStatus::Maintenance;
    fb.slot(z, "A-2").isOccupied = true;
    fb.slot(z, "A-3").status = SlotStatus::Occupied;
    fb.slot(z, "A-4");
    install();

    EXPECT_EQ(allocateOne()->slotNumber, "A-4");
    EXPECT_FALSE(allocateOne().has_value());
}

TEST_F(SlotAllocatorTest, OtherLotsAreNeverOffered) {
    FacilityBuilder other("Other");
    Id oz = other.zone("O", -5, 0);
    other.slot(oz, "O-1");
    installFacility(store, other.config());

    Id z = fb.zone("A", 0, 0);
    fb.slot(z, "A-1");
    install();

    EXPECT_EQ(allocateOne()->slotNumber, "A-1");
    EXPECT_FALSE(allocateOne().has_value());
}

TEST_F(SlotAllocatorTest, RolledBackAllocationLeavesSlotAvailable) {
    Id z = fb.zone("A", 0, 0);
    fb.slot(z, "A-1");
    install();

    SlotAllocator alloc(store);
    {
        UnitOfWork uow(store, milliseconds(500), "abandoned");
        ASSERT_TRUE(alloc.allocate(uow, fb.lotId(), {}).has_value());
    }
    EXPECT_EQ(allocateOne()->slotNumber, "A-1");
}

TEST_F(SlotAllocatorTest, AllocationSkipsSlotLockedByInFlightUnit) {
    Id z = fb.zone("A", 0, 0);
    fb.slot(z, "A-1");
    fb.slot(z, "A-2");
    install();

    SlotAllocator alloc(store);
    UnitOfWork inFlight(store, milliseconds(2000), "in-flight");
    auto held = alloc.allocate(inFlight, fb.lotId(), {});
    ASSERT_EQ(held->slotNumber, "A-1");

    std::optional<Slot> second;
    std::thread([&] { second = allocateOne(); }).join();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->slotNumber, "A-2");
    inFlight.commit();
}

TEST_F(SlotAllocatorTest, ConcurrentRequestsNeverShareASlot) {
    const int slots = 10, requests = 24;
    Id z = fb.zone("A", 0, 0);
    for (int i = 0; i < slots; ++i) fb.slot(z, "A-" + std::to_string(100 + i));
    install();

    SlotAllocator alloc(store);
    std::atomic<bool> go{false};
    std::mutex mu;
    std::vector<Id> won;
    int refused = 0;

    std::vector<std::thread> threads;
    for (int i = 0; i < requests; ++i) {
        threads.emplace_back([&] {
            while (!go) std::this_thread::yield();
            UnitOfWork uow(store, milliseconds(2000), "race");
            auto s = alloc.allocate(uow, fb.lotId(), {});
            if (s) uow.commit();
            std::lock_guard<std::mutex> lk(mu);
            if (s) won.push_back(s->id); else ++refused;
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(won.size(), static_cast<size_t>(slots));
    EXPECT_EQ(refused, requests - slots);
    EXPECT_EQ(std::set<Id>(won.begin(), won.end()).size(), won.size());
}

TEST_F(SlotAllocatorTest, AsManyRequestsAsSlotsAllSucceed) {
    const int slots = 12;
    Id z = fb.zone("A", 0, 0);
    for (int i = 0; i < slots; ++i) fb.slot(z, "A-" + std::to_string(100 + i));
    install();

    SlotAllocator alloc(store);
    std::atomic<bool> go{false};
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < slots; ++i) {
        threads.emplace_back([&] {
            while (!go) std::this_thread::yield();
            UnitOfWork uow(store, milliseconds(2000), "race");
            if (alloc.allocate(uow, fb.lotId(), {})) {
                uow.commit();
                ++ok;
            }
        });
    }
    go = true;
    for (auto& t : threads) t.join();
    EXPECT_EQ(ok.load(), slots);
}
