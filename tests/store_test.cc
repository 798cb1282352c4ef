#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "errors.h"
#include "identifiers.h"
#include "store.h"
#include "test_support.h"

using namespace std::chrono;
using namespace parkcore;
using parkcore::testutil::FacilityBuilder;
using parkcore::testutil::at;

namespace {

class UnitOfWorkTest : public ::testing::Test {
protected:
    void SetUp() override {
        testutil::fastConfig();
        Id z = fb.zone("A", 0, 0);
        slotId = fb.slot(z, "A-1").id;
        installFacility(store, fb.config());
    }

    Token newToken() const {
        Token t;
        t.id = newId();
        t.lotId = fb.lotId();
        t.tokenNumber = makeTokenNumber(at());
        t.entryTime = at();
        t.allocatedSlotId = slotId;
        return t;
    }

    // Commits a token without touching the slot.
    Token committedToken() {
        Token t = newToken();
        UnitOfWork uow(store, milliseconds(500), "seed");
        uow.putToken(t);
        uow.commit();
        return t;
    }

    FacilityBuilder fb;
    Store store;
    Id slotId;
};

} // namespace

TEST_F(UnitOfWorkTest, CommitPublishesEveryStagedWriteTogether) {
    Token t = newToken();
    {
        UnitOfWork uow(store, milliseconds(500), "test");
        ASSERT_TRUE(uow.tryLockSlot(slotId));
        Slot s = *uow.slot(slotId);
        s.status = SlotStatus::Reserved;
        uow.putSlot(s);
        uow.putToken(t);
        uow.putOccupancy(SlotOccupancy{newId(), slotId, t.id, at(), std::nullopt});

        EXPECT_EQ(uow.slot(slotId)->status, SlotStatus::Reserved);
        EXPECT_TRUE(uow.token(t.id).has_value());
        EXPECT_EQ(store.slot(slotId)->status, SlotStatus::Available);
        EXPECT_FALSE(store.token(t.id).has_value());

        uow.commit();
    }
    EXPECT_EQ(store.slot(slotId)->status, SlotStatus::Reserved);
    ASSERT_TRUE(store.token(t.id).has_value());
    EXPECT_EQ(store.tokenByNumber(t.tokenNumber)->id, t.id);
    ASSERT_EQ(store.occupancyHistory(slotId).size(), 1u);
    EXPECT_FALSE(store.occupancyHistory(slotId)[0].endTime.has_value());
}

TEST_F(UnitOfWorkTest, UncommittedUnitIsRolledBack) {
    Token t = newToken();
    {
        UnitOfWork uow(store, milliseconds(500), "test");
        ASSERT_TRUE(uow.tryLockSlot(slotId));
        Slot s = *uow.slot(slotId);
        s.status = SlotStatus::Reserved;
        uow.putSlot(s);
        uow.putToken(t);
    }
    EXPECT_EQ(store.slot(slotId)->status, SlotStatus::Available);
    EXPECT_FALSE(store.token(t.id).has_value());

    // the row lock went with it
    bool locked = false;
    std::thread([&] {
        UnitOfWork other(store, milliseconds(500), "other");
        locked = other.tryLockSlot(slotId);
    }).join();
    EXPECT_TRUE(locked);
}

TEST_F(UnitOfWorkTest, TryLockSkipsARowHeldByAnotherUnit) {
    UnitOfWork holder(store, milliseconds(500), "holder");
    ASSERT_TRUE(holder.tryLockSlot(slotId));

    bool lockedWhileHeld = true;
    auto started = steady_clock::now();
    std::thread([&] {
        UnitOfWork other(store, milliseconds(500), "other");
        lockedWhileHeld = other.tryLockSlot(slotId);
    }).join();
    EXPECT_FALSE(lockedWhileHeld);
    EXPECT_LT(steady_clock::now() - started, milliseconds(250));   // did not wait

    holder.commit();
    bool lockedAfter = false;
    std::thread([&] {
        UnitOfWork other(store, milliseconds(500), "other");
        lockedAfter = other.tryLockSlot(slotId);
    }).join();
    EXPECT_TRUE(lockedAfter);
}

TEST_F(UnitOfWorkTest, TokenLockWaitTimesOutAsTransient) {
    Token t = committedToken();
    UnitOfWork holder(store, milliseconds(2000), "holder");
    holder.lockToken(t.id);

    std::atomic<bool> timedOut{false};
    std::thread([&] {
        UnitOfWork waiter(store, milliseconds(50), "waiter");
        try {
            waiter.lockToken(t.id);
        } catch (const TransientError&) {
            timedOut = true;
        }
    }).join();
    EXPECT_TRUE(timedOut);
}

TEST_F(UnitOfWorkTest, CommitPastDeadlineAppliesNothing) {
    UnitOfWork uow(store, milliseconds(20), "slow");
    ASSERT_TRUE(uow.tryLockSlot(slotId));
    Slot s = *uow.slot(slotId);
    s.status = SlotStatus::Reserved;
    uow.putSlot(s);
    std::this_thread::sleep_for(milliseconds(60));
    EXPECT_THROW(uow.commit(), TransientError);
    EXPECT_FALSE(uow.committed());
    EXPECT_EQ(store.slot(slotId)->status, SlotStatus::Available);
}

TEST_F(UnitOfWorkTest, WritesNeedTheRowLock) {
    Token t = committedToken();
    UnitOfWork uow(store, milliseconds(500), "test");
    Slot s = *store.slot(slotId);
    EXPECT_THROW(uow.putSlot(s), InvariantViolation);
    EXPECT_THROW(uow.putToken(t), InvariantViolation);
    EXPECT_THROW(uow.putOccupancy(SlotOccupancy{newId(), slotId, t.id, at(), std::nullopt}),
                 InvariantViolation);
}

TEST_F(UnitOfWorkTest, SecondTransactionForATokenIsRefused) {
    Token t = committedToken();
    auto bill = [&](const std::string& receipt) {
        Transaction txn;
        txn.id = newId();
        txn.tokenId = t.id;
        txn.receiptNumber = receipt;
        return txn;
    };
    {
        UnitOfWork uow(store, milliseconds(500), "first");
        uow.lockToken(t.id);
        uow.insertTransaction(bill("RCP1"));
        uow.commit();
    }
    UnitOfWork uow(store, milliseconds(500), "second");
    uow.lockToken(t.id);
    uow.insertTransaction(bill("RCP2"));
    EXPECT_THROW(uow.commit(), InvariantViolation);
    EXPECT_EQ(store.transactionsForToken(t.id).size(), 1u);
    EXPECT_FALSE(store.receiptExists("RCP2"));
}

TEST_F(UnitOfWorkTest, ReceiptCollisionIsRetryable) {
    Token a = committedToken();
    Token b = committedToken();
    {
        UnitOfWork uow(store, milliseconds(500), "first");
        uow.lockToken(a.id);
        Transaction txn;
        txn.id = newId();
        txn.tokenId = a.id;
        txn.receiptNumber = "RCP-SAME";
        uow.insertTransaction(txn);
        uow.commit();
    }
    UnitOfWork uow(store, milliseconds(500), "second");
    uow.lockToken(b.id);
    Transaction txn;
    txn.id = newId();
    txn.tokenId = b.id;
    txn.receiptNumber = "RCP-SAME";
    uow.insertTransaction(txn);
    EXPECT_TRUE(uow.receiptTaken("RCP-SAME"));
    EXPECT_THROW(uow.commit(), TransientError);
}
