/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimulationClock.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>

SimulationClock::SimulationClock(float tickRate)
    : m_fixedTimestep(1.0f / 60.0f)
{
    setTickRate(tickRate);
    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void SimulationClock::startFrame() {
    auto currentTime = std::chrono::high_resolution_clock::now();

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = currentTime;
        m_frameStart = currentTime;
        return;
    }

    auto deltaTimeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(currentTime - m_lastFrameTime);
    m_lastFrameTime = currentTime;
    m_frameStart = currentTime;

    advanceBy(static_cast<double>(deltaTimeNs.count()) / 1e9);
}

void SimulationClock::advanceBy(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return;
    }
    // Clamp to prevent spiral of death after a long stall
    m_accumulator = std::min(m_accumulator + std::min(seconds, MAX_ACCUMULATOR), MAX_ACCUMULATOR);
}

bool SimulationClock::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        ++m_tickCount;
        return true;
    }
    return false;
}

double SimulationClock::getInterpolationAlpha() const {
    return std::clamp(m_accumulator / m_fixedTimestep, 0.0, 1.0);
}

void SimulationClock::endFrame() const {
    if (!m_realtimePacing) {
        return;
    }

    int64_t targetFrameNs = static_cast<int64_t>(static_cast<double>(m_fixedTimestep) * 1e9);
    auto targetEndTime = m_frameStart + std::chrono::nanoseconds(targetFrameNs);
    auto now = std::chrono::high_resolution_clock::now();
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEndTime - now);

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}

void SimulationClock::setTickRate(float tickRate) {
    if (!(tickRate > 0.0f) || !std::isfinite(tickRate)) {
        SIMLOOP_WARN("Invalid tick rate " + std::to_string(tickRate) + ", keeping " +
                     std::to_string(getTickRate()));
        return;
    }
    m_fixedTimestep = 1.0f / tickRate;
}

void SimulationClock::reset() {
    m_accumulator = 0.0;
    m_tickCount = 0;
    m_firstFrame = true;

    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}
