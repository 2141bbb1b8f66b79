/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_CLOCK_HPP
#define SIMULATION_CLOCK_HPP

#include <chrono>
#include <cstdint>

/**
 * SimulationClock drives the fixed-tick simulation loop.
 *
 * Frame time is fed into an accumulator that is drained in fixed steps, so
 * WaveField, BuildSession and the motion controller always see the same dt.
 * The accumulator is clamped to avoid a spiral of death after a stall.
 *
 * Two ways to feed it:
 *   - startFrame() measures wall time (interactive runs, optional pacing
 *     through SDL_DelayPrecise in endFrame())
 *   - advanceBy(seconds) injects simulated time (headless runs, tests)
 */
class SimulationClock {
public:
    /**
     * @param tickRate Fixed updates per second (e.g., 60)
     */
    explicit SimulationClock(float tickRate = 60.0f);

    void startFrame();

    /**
     * Inject elapsed time without reading the wall clock
     * @param seconds Negative or non-finite values are ignored
     */
    void advanceBy(double seconds);

    /**
     * Returns true and consumes one step while the accumulator holds a full step.
     * May return true several times per frame for catch-up.
     */
    bool shouldUpdate();

    float getUpdateDeltaTime() const { return m_fixedTimestep; }
    float getTickRate() const { return 1.0f / m_fixedTimestep; }
    uint64_t getTickCount() const { return m_tickCount; }
    double getSimulatedSeconds() const { return static_cast<double>(m_tickCount) * m_fixedTimestep; }

    /**
     * Fraction of the next step already accumulated, in [0, 1]
     */
    double getInterpolationAlpha() const;

    /**
     * Sleeps out the remainder of the frame when real-time pacing is on
     */
    void endFrame() const;

    void setRealtimePacing(bool enabled) { m_realtimePacing = enabled; }
    bool isRealtimePacing() const { return m_realtimePacing; }

    void setTickRate(float tickRate);
    void reset();

    static constexpr double MAX_ACCUMULATOR = 0.25;

private:
    float m_fixedTimestep;
    double m_accumulator{0.0};
    uint64_t m_tickCount{0};
    bool m_firstFrame{true};
    bool m_realtimePacing{false};

    std::chrono::high_resolution_clock::time_point m_frameStart;
    std::chrono::high_resolution_clock::time_point m_lastFrameTime;
};

#endif // SIMULATION_CLOCK_HPP
