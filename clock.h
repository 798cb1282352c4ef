#pragma once

#include <chrono>
#include <mutex>

#include "types.h"

namespace parkcore {

struct Clock {
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

struct SystemClock final : Clock {
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Hand-driven time for tests and the demo.
class ManualClock final : public Clock {
    TimePoint t_;
    mutable std::mutex mu_;

public:
    explicit ManualClock(TimePoint start = std::chrono::system_clock::now()) : t_(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lk(mu_);
        return t_;
    }
    void advance(std::chrono::system_clock::duration d) {
        std::lock_guard<std::mutex> lk(mu_);
        t_ += d;
    }
    void set(TimePoint t) {
        std::lock_guard<std::mutex> lk(mu_);
        t_ = t;
    }
};

} // namespace parkcore
