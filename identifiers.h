#pragma once

#include <string>

#include "types.h"

namespace parkcore {

// Opaque row id (lower-case UUID text).
Id newId();

// "yyMMdd" / "yyyyMMdd" of t in UTC.
std::string shortDate(TimePoint t);
std::string longDate(TimePoint t);

// TK<yyMMdd>-<6 hex>, the display-facing session number.
std::string makeTokenNumber(TimePoint t);

// RCP<yyyyMMdd>-<6 alphanumerics>. Callers check uniqueness against the store.
std::string makeReceiptNumber(TimePoint t);

} // namespace parkcore
