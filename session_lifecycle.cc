#include "session_lifecycle.h"
#include "identifiers.h"
#include "log.h"
#include "retry.h"
#include "store.h"

#include <cctype>

using namespace std;

namespace parkcore {

bool canTransition(TokenStatus from, TokenStatus to) {
    return !isTerminal(from) && isTerminal(to);
}

static string upper(string s) {
    for (char& c : s) c = (char)toupper((unsigned char)c);
    return s;
}

SessionLifecycle::SessionLifecycle(Store& store, const SlotAllocator& allocator,
                                   const Clock& clock, const EngineConfig& cfg)
    : store_(store), allocator_(allocator), clock_(clock), cfg_(cfg) {}

Result<Session> SessionLifecycle::openIn(UnitOfWork& uow, const Id& lotId,
                                         const EntryRequest& req, TimePoint now) const {
    optional<Slot> slot = allocator_.allocate(uow, lotId, req.constraints);
    if (!slot) return Result<Session>::failure(EngineStatus::NoSlotAvailable);

    Token tk;
    tk.id = newId();
    tk.lotId = lotId;
    do {
        tk.tokenNumber = makeTokenNumber(now);
    } while (uow.tokenNumberTaken(tk.tokenNumber));
    tk.tokenType = req.tokenType;
    tk.entryTime = now;
    tk.allocatedSlotId = slot->id;
    if (req.licensePlate) tk.licensePlate = upper(*req.licensePlate);
    tk.vehicleType = req.constraints.vehicleType;
    tk.expectedDurationMinutes = req.expectedDurationMinutes;
    tk.status = TokenStatus::Active;
    uow.putToken(tk);

    SlotOccupancy occ;
    occ.id = newId();
    occ.slotId = slot->id;
    occ.tokenId = tk.id;
    occ.startTime = now;
    uow.putOccupancy(occ);

    return Result<Session>::success(Session{tk, *slot});
}

Result<Session> SessionLifecycle::open(const Id& lotId, const EntryRequest& req) const {
    return withRetry(cfg_.retry, "open session", [&] {
        UnitOfWork uow(store_, cfg_.lockTimeout, "open");
        auto res = openIn(uow, lotId, req, clock_.now());
        if (!res) {
            log::debug("open session in lot " + lotId + ": " + describe(res.status));
            return res;
        }
        uow.commit();
        log::info("Session " + res->token.tokenNumber + " opened on slot " + res->slot.slotNumber);
        return res;
    });
}

Result<Token> SessionLifecycle::loadActive(UnitOfWork& uow, const Id& tokenId) const {
    if (!store_.token(tokenId)) return Result<Token>::failure(EngineStatus::TokenNotFound);
    uow.lockToken(tokenId);
    optional<Token> tk = uow.token(tokenId);   // re-read under the row lock
    if (!tk) return Result<Token>::failure(EngineStatus::TokenNotFound);
    if (tk->status != TokenStatus::Active)
        return Result<Token>::failure(EngineStatus::InvalidStateTransition);
    return Result<Token>::success(*tk);
}

Token SessionLifecycle::close(UnitOfWork& uow, Token tk, TokenStatus target, TimePoint at) const {
    if (!canTransition(tk.status, target))
        throw InvariantViolation(string("close called for ") + toString(tk.status) +
                                 " -> " + toString(target) + " on token " + tk.tokenNumber);
    if (!uow.holdsToken(tk.id))
        throw InvariantViolation("close called without the row lock on token " + tk.tokenNumber);
    if (!tk.allocatedSlotId)
        throw InvariantViolation("ACTIVE token " + tk.tokenNumber + " has no slot");

    const Id& slotId = *tk.allocatedSlotId;
    uow.lockSlot(slotId);
    optional<Slot> slot = uow.slot(slotId);
    if (!slot)
        throw InvariantViolation("token " + tk.tokenNumber + " references unknown slot " + slotId);
    if (slot->status != SlotStatus::Reserved && slot->status != SlotStatus::Occupied)
        throw InvariantViolation("slot " + slot->slotNumber + " is " + toString(slot->status) +
                                 " while ACTIVE token " + tk.tokenNumber + " holds it");

    optional<SlotOccupancy> occ = uow.openOccupancy(slotId, tk.id);
    if (!occ)
        throw InvariantViolation("no open occupancy for token " + tk.tokenNumber +
                                 " on slot " + slot->slotNumber);

    slot->status = SlotStatus::Available;
    slot->isOccupied = false;
    uow.putSlot(*slot);

    occ->endTime = at;
    uow.putOccupancy(*occ);

    tk.status = target;
    tk.exitTime = at;
    uow.putToken(tk);
    return tk;
}

Result<Token> SessionLifecycle::transition(const Id& tokenId, TokenStatus target,
                                           const char* what) const {
    return withRetry(cfg_.retry, what, [&] {
        UnitOfWork uow(store_, cfg_.lockTimeout, what);
        auto loaded = loadActive(uow, tokenId);
        if (!loaded) {
            log::debug(string(what) + " " + tokenId + ": " + describe(loaded.status));
            return loaded;
        }
        Token closed;
        try {
            closed = close(uow, *loaded, target, clock_.now());
        } catch (const InvariantViolation& e) {
            log::fatal(string(what) + " aborted: " + e.what());
            throw;
        }
        uow.commit();
        log::info("Session " + closed.tokenNumber + " -> " + toString(target));
        return Result<Token>::success(closed);
    });
}

Result<Token> SessionLifecycle::cancel(const Id& tokenId) const {
    return transition(tokenId, TokenStatus::Cancelled, "cancel session");
}

Result<Token> SessionLifecycle::updateStatus(const Id& tokenId, TokenStatus target) const {
    if (target == TokenStatus::Active || target == TokenStatus::Completed) {
        log::debug(string("status update to ") + toString(target) + " refused for " + tokenId);
        return Result<Token>::failure(EngineStatus::InvalidStateTransition);
    }
    return transition(tokenId, target, "update session status");
}

} // namespace parkcore
