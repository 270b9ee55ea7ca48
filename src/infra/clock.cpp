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
 * @file clock.cpp
 * @brief Steady clock implementation and the polling loop.
 */

#include "nodeboot/infra/clock.hpp"

#include <thread>

namespace nodeboot::infra {

Clock::TimePoint SystemClock::now() const
{
    return std::chrono::steady_clock::now();
}

void SystemClock::sleep_for(Duration d)
{
    std::this_thread::sleep_for(d);
}

bool poll_until(Clock& clock, Clock::Duration interval, const std::function<Probe()>& probe,
                std::optional<Clock::Duration> deadline)
{
    const auto started = clock.now();
    while (true) {
        switch (probe()) {
        case Probe::Ready:
            return true;
        case Probe::Abandon:
            return false;
        case Probe::Pending:
            break;
        }

        if (deadline && clock.now() - started >= *deadline) {
            return false;
        }
        clock.sleep_for(interval);
    }
}

} // namespace nodeboot::infra
