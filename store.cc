#include "store.h"
#include "errors.h"
#include "log.h"

#include <algorithm>

using namespace std;

namespace parkcore {

// ===================== Store =====================

void Store::addLot(const ParkingLot& lot) {
    unique_lock<shared_mutex> lk(mu_);
    if (lots_.count(lot.id)) throw ConfigError("Duplicate parking lot id: " + lot.id);
    lots_.emplace(lot.id, lot);
}

void Store::addZone(const Zone& zone) {
    unique_lock<shared_mutex> lk(mu_);
    if (!lots_.count(zone.lotId))
        throw ConfigError("Zone " + zone.code + " references unknown lot: " + zone.lotId);
    if (zones_.count(zone.id)) throw ConfigError("Duplicate zone id: " + zone.id);
    zones_.emplace(zone.id, zone);
}

void Store::addSlot(const Slot& slot) {
    unique_lock<shared_mutex> lk(mu_);
    auto z = zones_.find(slot.zoneId);
    if (z == zones_.end())
        throw ConfigError("Slot " + slot.slotNumber + " references unknown zone: " + slot.zoneId);
    if (slots_.count(slot.id)) throw ConfigError("Duplicate slot id: " + slot.id);
    for (const auto& kv : slots_) {
        const Slot& other = kv.second->data;
        if (other.slotNumber == slot.slotNumber &&
            zones_.at(other.zoneId).lotId == z->second.lotId)
            throw ConfigError("Duplicate slot number in lot: " + slot.slotNumber);
    }
    auto row = make_unique<SlotRow>();
    row->data = slot;
    slots_.emplace(slot.id, std::move(row));
}

void Store::addPricingRule(const PricingRule& rule) {
    unique_lock<shared_mutex> lk(mu_);
    if (!lots_.count(rule.lotId))
        throw ConfigError("Pricing rule " + rule.name + " references unknown lot: " + rule.lotId);
    rules_[rule.id] = rule;
}

optional<ParkingLot> Store::lot(const Id& id) const {
    shared_lock<shared_mutex> lk(mu_);
    auto it = lots_.find(id);
    if (it == lots_.end()) return nullopt;
    return it->second;
}

optional<Zone> Store::zone(const Id& id) const {
    shared_lock<shared_mutex> lk(mu_);
    auto it = zones_.find(id);
    if (it == zones_.end()) return nullopt;
    return it->second;
}

optional<Slot> Store::slot(const Id& id) const {
    shared_lock<shared_mutex> lk(mu_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return nullopt;
    return it->second->data;
}

optional<Token> Store::token(const Id& id) const {
    shared_lock<shared_mutex> lk(mu_);
    auto it = tokens_.find(id);
    if (it == tokens_.end()) return nullopt;
    return it->second->data;
}

optional<Token> Store::tokenByNumber(const string& number) const {
    shared_lock<shared_mutex> lk(mu_);
    auto it = tokenNumbers_.find(number);
    if (it == tokenNumbers_.end()) return nullopt;
    return tokens_.at(it->second)->data;
}

optional<Transaction> Store::transaction(const Id& id) const {
    shared_lock<shared_mutex> lk(mu_);
    auto it = transactions_.find(id);
    if (it == transactions_.end()) return nullopt;
    return it->second;
}

vector<Zone> Store::zonesOfLot(const Id& lotId) const {
    shared_lock<shared_mutex> lk(mu_);
    vector<Zone> res;
    for (const auto& kv : zones_)
        if (kv.second.lotId == lotId) res.push_back(kv.second);
    return res;
}

vector<Slot> Store::slotsOfZone(const Id& zoneId) const {
    shared_lock<shared_mutex> lk(mu_);
    vector<Slot> res;
    for (const auto& kv : slots_)
        if (kv.second->data.zoneId == zoneId) res.push_back(kv.second->data);
    return res;
}

vector<PricingRule> Store::pricingRulesOfLot(const Id& lotId) const {
    shared_lock<shared_mutex> lk(mu_);
    vector<PricingRule> res;
    for (const auto& kv : rules_)
        if (kv.second.lotId == lotId) res.push_back(kv.second);
    return res;
}

vector<Token> Store::tokensOfLot(const Id& lotId) const {
    shared_lock<shared_mutex> lk(mu_);
    vector<Token> res;
    for (const auto& kv : tokens_)
        if (kv.second->data.lotId == lotId) res.push_back(kv.second->data);
    sort(res.begin(), res.end(),
         [](const Token& a, const Token& b) { return a.entryTime > b.entryTime; });
    return res;
}

vector<Transaction> Store::transactionsForToken(const Id& tokenId) const {
    shared_lock<shared_mutex> lk(mu_);
    vector<Transaction> res;
    auto it = txnsByToken_.find(tokenId);
    if (it == txnsByToken_.end()) return res;
    for (const Id& id : it->second) res.push_back(transactions_.at(id));
    return res;
}

vector<SlotOccupancy> Store::occupancyHistory(const Id& slotId) const {
    shared_lock<shared_mutex> lk(mu_);
    vector<SlotOccupancy> res;
    auto it = occupanciesBySlot_.find(slotId);
    if (it == occupanciesBySlot_.end()) return res;
    for (const Id& id : it->second) res.push_back(occupancies_.at(id));
    return res;
}

bool Store::tokenNumberExists(const string& number) const {
    shared_lock<shared_mutex> lk(mu_);
    return tokenNumbers_.count(number) != 0;
}

bool Store::receiptExists(const string& receipt) const {
    shared_lock<shared_mutex> lk(mu_);
    return receipts_.count(receipt) != 0;
}

StoreDump Store::dump() const {
    shared_lock<shared_mutex> lk(mu_);
    StoreDump d;
    for (const auto& kv : lots_) d.lots.push_back(kv.second);
    for (const auto& kv : zones_) d.zones.push_back(kv.second);
    for (const auto& kv : slots_) d.slots.push_back(kv.second->data);
    for (const auto& kv : rules_) d.pricingRules.push_back(kv.second);
    for (const auto& kv : tokens_) d.tokens.push_back(kv.second->data);
    for (const auto& kv : transactions_) d.transactions.push_back(kv.second);
    for (const auto& kv : occupancies_) d.occupancies.push_back(kv.second);
    return d;
}

timed_mutex* Store::slotLock(const Id& id) const {
    shared_lock<shared_mutex> lk(mu_);
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : &it->second->lock;
}

timed_mutex* Store::tokenLock(const Id& id) const {
    shared_lock<shared_mutex> lk(mu_);
    auto it = tokens_.find(id);
    return it == tokens_.end() ? nullptr : &it->second->lock;
}

// ===================== UnitOfWork =====================

UnitOfWork::UnitOfWork(Store& store, chrono::milliseconds timeout, string label)
    : store_(store),
      deadline_(chrono::steady_clock::now() + timeout),
      label_(std::move(label)) {}

UnitOfWork::~UnitOfWork() {
    if (!committed_ && (!slots_.empty() || !tokens_.empty() || !txns_.empty() || !occupancies_.empty()))
        log::debug(label_ + ": rolled back uncommitted unit of work");
}

void UnitOfWork::checkDeadline(const char* where) const {
    if (chrono::steady_clock::now() > deadline_)
        throw TransientError(label_ + ": deadline exceeded " + where);
}

bool UnitOfWork::tryLockSlot(const Id& slotId) {
    if (holdsSlot(slotId)) return true;
    timed_mutex* m = store_.slotLock(slotId);
    if (!m) return false;
    unique_lock<timed_mutex> lk(*m, try_to_lock);
    if (!lk) return false;
    slotLocks_.emplace(slotId, std::move(lk));
    return true;
}

void UnitOfWork::lockSlot(const Id& slotId) {
    if (holdsSlot(slotId)) return;
    timed_mutex* m = store_.slotLock(slotId);
    if (!m) throw InvariantViolation(label_ + ": lock on unknown slot " + slotId);
    unique_lock<timed_mutex> lk(*m, deadline_);
    if (!lk) throw TransientError(label_ + ": lock wait timeout on slot " + slotId);
    slotLocks_.emplace(slotId, std::move(lk));
}

void UnitOfWork::lockToken(const Id& tokenId) {
    if (holdsToken(tokenId)) return;
    if (newTokens_.count(tokenId)) return;
    timed_mutex* m = store_.tokenLock(tokenId);
    if (!m) throw InvariantViolation(label_ + ": lock on unknown token " + tokenId);
    unique_lock<timed_mutex> lk(*m, deadline_);
    if (!lk) throw TransientError(label_ + ": lock wait timeout on token " + tokenId);
    tokenLocks_.emplace(tokenId, std::move(lk));
}

void UnitOfWork::unlockSlot(const Id& slotId) {
    if (slots_.count(slotId))
        throw InvariantViolation(label_ + ": unlock of slot with staged write " + slotId);
    slotLocks_.erase(slotId);
}

optional<Slot> UnitOfWork::slot(const Id& id) const {
    auto it = slots_.find(id);
    if (it != slots_.end()) return it->second;
    return store_.slot(id);
}

optional<Token> UnitOfWork::token(const Id& id) const {
    auto it = tokens_.find(id);
    if (it != tokens_.end()) return it->second;
    return store_.token(id);
}

optional<SlotOccupancy> UnitOfWork::openOccupancy(const Id& slotId, const Id& tokenId) const {
    for (const auto& kv : occupancies_) {
        const SlotOccupancy& o = kv.second;
        if (o.slotId == slotId && o.tokenId == tokenId && !o.endTime) return o;
    }
    for (const SlotOccupancy& o : store_.occupancyHistory(slotId)) {
        if (o.tokenId != tokenId || o.endTime) continue;
        if (occupancies_.count(o.id)) continue;   // staged copy already closed it
        return o;
    }
    return nullopt;
}

vector<Transaction> UnitOfWork::transactionsForToken(const Id& tokenId) const {
    vector<Transaction> res = store_.transactionsForToken(tokenId);
    for (const auto& kv : txns_)
        if (kv.second.tokenId == tokenId) res.push_back(kv.second);
    return res;
}

bool UnitOfWork::tokenNumberTaken(const string& number) const {
    for (const auto& kv : tokens_)
        if (newTokens_.count(kv.first) && kv.second.tokenNumber == number) return true;
    return store_.tokenNumberExists(number);
}

bool UnitOfWork::receiptTaken(const string& receipt) const {
    for (const auto& kv : txns_)
        if (kv.second.receiptNumber == receipt) return true;
    return store_.receiptExists(receipt);
}

void UnitOfWork::putSlot(const Slot& s) {
    if (!holdsSlot(s.id))
        throw InvariantViolation(label_ + ": write to unlocked slot " + s.id);
    slots_[s.id] = s;
}

void UnitOfWork::putToken(const Token& t) {
    bool isNew = newTokens_.count(t.id) || !store_.token(t.id);
    if (isNew) {
        newTokens_.insert(t.id);
    } else if (!holdsToken(t.id)) {
        throw InvariantViolation(label_ + ": write to unlocked token " + t.id);
    }
    tokens_[t.id] = t;
}

void UnitOfWork::insertTransaction(const Transaction& txn) {
    if (!holdsToken(txn.tokenId) && !newTokens_.count(txn.tokenId))
        throw InvariantViolation(label_ + ": transaction for unlocked token " + txn.tokenId);
    txns_[txn.id] = txn;
}

void UnitOfWork::putOccupancy(const SlotOccupancy& occ) {
    if (!holdsSlot(occ.slotId))
        throw InvariantViolation(label_ + ": occupancy write without slot lock " + occ.slotId);
    occupancies_[occ.id] = occ;
}

void UnitOfWork::commit() {
    if (committed_) throw InvariantViolation(label_ + ": committed twice");
    checkDeadline("before commit");
    {
        unique_lock<shared_mutex> lk(store_.mu_);

        // Validate everything before the first write so a failure applies nothing.
        for (const Id& id : newTokens_) {
            const Token& t = tokens_.at(id);
            if (store_.tokens_.count(id))
                throw InvariantViolation(label_ + ": token id reused " + id);
            if (store_.tokenNumbers_.count(t.tokenNumber))
                throw TransientError(label_ + ": token number collision " + t.tokenNumber);
        }
        for (const auto& kv : txns_) {
            const Transaction& txn = kv.second;
            if (store_.receipts_.count(txn.receiptNumber))
                throw TransientError(label_ + ": receipt number collision " + txn.receiptNumber);
            if (store_.txnsByToken_.count(txn.tokenId))
                throw InvariantViolation(label_ + ": second transaction for token " + txn.tokenId);
        }

        for (const auto& kv : slots_)
            store_.slots_.at(kv.first)->data = kv.second;

        for (const auto& kv : tokens_) {
            if (newTokens_.count(kv.first)) {
                auto row = make_unique<Store::TokenRow>();
                row->data = kv.second;
                store_.tokenNumbers_[kv.second.tokenNumber] = kv.first;
                store_.tokens_.emplace(kv.first, std::move(row));
            } else {
                store_.tokens_.at(kv.first)->data = kv.second;
            }
        }

        for (const auto& kv : txns_) {
            store_.transactions_[kv.first] = kv.second;
            store_.receipts_[kv.second.receiptNumber] = kv.first;
            store_.txnsByToken_[kv.second.tokenId].push_back(kv.first);
        }

        for (const auto& kv : occupancies_) {
            if (!store_.occupancies_.count(kv.first))
                store_.occupanciesBySlot_[kv.second.slotId].push_back(kv.first);
            store_.occupancies_[kv.first] = kv.second;
        }
        committed_ = true;
    }
    tokenLocks_.clear();
    slotLocks_.clear();
}

} // namespace parkcore
