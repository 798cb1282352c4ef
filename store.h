#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "models.h"

namespace parkcore {

// Everything the store holds, copied under one read lock.
struct StoreDump {
    std::vector<ParkingLot> lots;
    std::vector<Zone> zones;
    std::vector<Slot> slots;
    std::vector<PricingRule> pricingRules;
    std::vector<Token> tokens;
    std::vector<Transaction> transactions;
    std::vector<SlotOccupancy> occupancies;
};

/*
 In-memory persistent state. Committed tables sit behind one reader/writer
 lock; Slot and Token rows additionally carry a row lock that a UnitOfWork
 holds from first touch until commit or rollback. Rows are never erased, so
 row pointers stay valid for the lifetime of the store.
*/
class Store {
public:
    Store() = default;
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // ---------- facility setup ----------
    void addLot(const ParkingLot& lot);
    void addZone(const Zone& zone);          // lot must exist
    void addSlot(const Slot& slot);          // zone must exist
    void addPricingRule(const PricingRule& rule);

    // ---------- committed reads ----------
    std::optional<ParkingLot> lot(const Id& id) const;
    std::optional<Zone> zone(const Id& id) const;
    std::optional<Slot> slot(const Id& id) const;
    std::optional<Token> token(const Id& id) const;
    std::optional<Token> tokenByNumber(const std::string& number) const;
    std::optional<Transaction> transaction(const Id& id) const;

    std::vector<Zone> zonesOfLot(const Id& lotId) const;
    std::vector<Slot> slotsOfZone(const Id& zoneId) const;
    std::vector<PricingRule> pricingRulesOfLot(const Id& lotId) const;
    std::vector<Token> tokensOfLot(const Id& lotId) const;
    std::vector<Transaction> transactionsForToken(const Id& tokenId) const;
    std::vector<SlotOccupancy> occupancyHistory(const Id& slotId) const;

    bool tokenNumberExists(const std::string& number) const;
    bool receiptExists(const std::string& receipt) const;

    StoreDump dump() const;

private:
    friend class UnitOfWork;

    struct SlotRow  { Slot data;  std::timed_mutex lock; };
    struct TokenRow { Token data; std::timed_mutex lock; };

    std::timed_mutex* slotLock(const Id& id) const;
    std::timed_mutex* tokenLock(const Id& id) const;

    mutable std::shared_mutex mu_;
    std::unordered_map<Id, ParkingLot> lots_;
    std::map<Id, Zone> zones_;
    std::map<Id, std::unique_ptr<SlotRow>> slots_;
    std::unordered_map<Id, std::unique_ptr<TokenRow>> tokens_;
    std::unordered_map<std::string, Id> tokenNumbers_;
    std::unordered_map<Id, PricingRule> rules_;
    std::unordered_map<Id, Transaction> transactions_;
    std::unordered_map<std::string, Id> receipts_;
    std::unordered_map<Id, std::vector<Id>> txnsByToken_;
    std::unordered_map<Id, SlotOccupancy> occupancies_;
    std::unordered_map<Id, std::vector<Id>> occupanciesBySlot_;
};

/*
 One atomic unit against the store. Writes are staged and become visible
 together at commit(); an uncommitted unit discards them on destruction and
 releases its row locks. Lock order is token before slot.
*/
class UnitOfWork {
public:
    UnitOfWork(Store& store, std::chrono::milliseconds timeout, std::string label);
    ~UnitOfWork();
    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    // Skip-locked: returns false at once if another unit holds the row.
    bool tryLockSlot(const Id& slotId);
    // Wait until the deadline, then throw TransientError.
    void lockSlot(const Id& slotId);
    void lockToken(const Id& tokenId);
    // Drop a slot lock taken by tryLockSlot when nothing was staged for it.
    void unlockSlot(const Id& slotId);

    bool holdsSlot(const Id& slotId) const { return slotLocks_.count(slotId) != 0; }
    bool holdsToken(const Id& tokenId) const { return tokenLocks_.count(tokenId) != 0; }

    // Reads see this unit's staged rows first.
    std::optional<Slot> slot(const Id& id) const;
    std::optional<Token> token(const Id& id) const;
    std::optional<SlotOccupancy> openOccupancy(const Id& slotId, const Id& tokenId) const;
    std::vector<Transaction> transactionsForToken(const Id& tokenId) const;
    bool tokenNumberTaken(const std::string& number) const;
    bool receiptTaken(const std::string& receipt) const;

    void putSlot(const Slot& s);               // row lock required
    void putToken(const Token& t);             // row lock required unless new
    void insertTransaction(const Transaction& txn);
    void putOccupancy(const SlotOccupancy& occ);

    void commit();
    bool committed() const { return committed_; }
    const std::string& label() const { return label_; }

private:
    void checkDeadline(const char* where) const;

    Store& store_;
    std::chrono::steady_clock::time_point deadline_;
    std::string label_;
    std::map<Id, std::unique_lock<std::timed_mutex>> slotLocks_;
    std::map<Id, std::unique_lock<std::timed_mutex>> tokenLocks_;
    std::map<Id, Slot> slots_;
    std::map<Id, Token> tokens_;
    std::set<Id> newTokens_;
    std::map<Id, Transaction> txns_;
    std::map<Id, SlotOccupancy> occupancies_;
    bool committed_ = false;
};

} // namespace parkcore
