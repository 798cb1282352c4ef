#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace parkcore {

// ---- Business outcomes (returned, never thrown) ----
enum class EngineStatus { Ok, NoSlotAvailable, TokenNotFound, InvalidStateTransition };

const char* toString(EngineStatus s);
// Operator-facing wording ("no slots available", "session already closed").
const char* describe(EngineStatus s);

template <typename T>
struct Result {
    EngineStatus status = EngineStatus::Ok;
    std::optional<T> value;

    static Result success(T v) { return Result{EngineStatus::Ok, std::move(v)}; }
    static Result failure(EngineStatus s) { return Result{s, std::nullopt}; }

    bool ok() const { return status == EngineStatus::Ok; }
    explicit operator bool() const { return ok(); }
    const T& operator*() const { return *value; }
    T& operator*() { return *value; }
    const T* operator->() const { return &*value; }
    T* operator->() { return &*value; }
};

// ---- Faults ----
struct EngineError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Missing key, bad enum name or inconsistent facility layout.
struct ConfigError : EngineError {
    using EngineError::EngineError;
};

struct InvalidDuration : EngineError {
    using EngineError::EngineError;
};

// Lock wait or unit-of-work deadline exceeded. Safe to retry the whole unit.
struct TransientError : EngineError {
    using EngineError::EngineError;
};

// Engine bug; the unit of work that detected it is never committed.
struct InvariantViolation : EngineError {
    using EngineError::EngineError;
};

} // namespace parkcore
