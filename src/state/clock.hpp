#pragma once

#include <chrono>

namespace projstate {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Time source for snapshot and transaction timestamps, so that tests can use a
// deterministic, manually-advanceable clock instead of wall-clock time.

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────
//
// Production implementation: delegates to std::chrono::system_clock.

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.

class MockClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta;
    }

    void set(time_point tp) {
        now_ = tp;
    }

private:
    time_point now_{};
};

} // namespace projstate
