/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file clock.hpp
 * @brief Injectable time source and the wait-for-condition primitive.
 *
 * @details
 * The readiness poll and the bounded shutdown wait never call
 * `std::this_thread::sleep_for` directly. They go through a `Clock` so that
 * tests can advance time instantly with a manual clock.
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>

namespace nodeboot::infra {

/**
 * @class Clock
 * @brief Abstract monotonic clock with a blocking sleep.
 */
class Clock {
  public:
    using Duration = std::chrono::milliseconds;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    /// @brief Suspends the caller for `d`. Manual clocks just advance `now()`.
    virtual void sleep_for(Duration d) = 0;
};

/**
 * @class SystemClock
 * @brief `std::chrono::steady_clock` plus `std::this_thread::sleep_for`.
 */
class SystemClock : public Clock {
  public:
    TimePoint now() const override;
    void sleep_for(Duration d) override;
};

/**
 * @enum Probe
 * @brief Result of one evaluation of a polled condition.
 */
enum class Probe {
    Ready,   ///< Condition satisfied; stop waiting with success.
    Pending, ///< Not yet; sleep one interval and try again.
    Abandon  ///< Condition can never be satisfied; stop waiting with failure.
};

/**
 * @brief Evaluates `probe` until it reports `Ready` or `Abandon`.
 *
 * The probe runs immediately, then once per `interval`. Without a `deadline`
 * the wait is unbounded; the probe itself decides when to give up.
 *
 * @return true when the probe reported `Ready`; false on `Abandon` or when
 * the deadline elapsed first.
 */
bool poll_until(Clock& clock, Clock::Duration interval, const std::function<Probe()>& probe,
                std::optional<Clock::Duration> deadline = std::nullopt);

} // namespace nodeboot::infra
