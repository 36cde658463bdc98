#pragma once

#include <chrono>

namespace chandb {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Wall-clock time source for last-modified stamps, so that tests can control
// time instead of depending on std::chrono::system_clock.

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────

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
    time_point now_{std::chrono::milliseconds{1'700'000'000'000}};
};

} // namespace chandb
