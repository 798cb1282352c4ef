#pragma once

#include <optional>
#include <string>

#include "clock.h"
#include "config.h"
#include "errors.h"
#include "models.h"
#include "slot_allocator.h"

namespace parkcore {

class Store;
class UnitOfWork;

struct EntryRequest {
    AllocationConstraints constraints;
    std::optional<std::string> licensePlate;
    TokenType tokenType = TokenType::QrCode;
    std::optional<long long> expectedDurationMinutes;
};

struct Session {
    Token token;
    Slot slot;
};

// ACTIVE may move to any terminal state; terminal states never move.
bool canTransition(TokenStatus from, TokenStatus to);

/*
 Token state machine. Token.status and Slot.status only change together,
 inside one UnitOfWork: opening reserves a slot and opens its occupancy,
 every way out of ACTIVE releases the slot and closes the occupancy.
*/
class SessionLifecycle {
public:
    SessionLifecycle(Store& store, const SlotAllocator& allocator, const Clock& clock,
                     const EngineConfig& cfg);

    // Allocate a slot and open an ACTIVE token on it, or NoSlotAvailable.
    Result<Session> open(const Id& lotId, const EntryRequest& req) const;

    // ACTIVE -> CANCELLED, no fee.
    Result<Token> cancel(const Id& tokenId) const;

    // Operator override to CANCELLED, EXPIRED or LOST.
    Result<Token> updateStatus(const Id& tokenId, TokenStatus target) const;

    // ---- steps for callers that own the unit of work ----
    Result<Session> openIn(UnitOfWork& uow, const Id& lotId, const EntryRequest& req,
                           TimePoint now) const;
    // Locks the token row and checks it is ACTIVE.
    Result<Token> loadActive(UnitOfWork& uow, const Id& tokenId) const;
    // Moves a locked ACTIVE token to `target`, releases its slot and closes
    // its occupancy at `at`. Throws InvariantViolation if the slot is not held.
    Token close(UnitOfWork& uow, Token token, TokenStatus target, TimePoint at) const;

private:
    Result<Token> transition(const Id& tokenId, TokenStatus target, const char* what) const;

    Store& store_;
    const SlotAllocator& allocator_;
    const Clock& clock_;
    EngineConfig cfg_;
};

} // namespace parkcore
