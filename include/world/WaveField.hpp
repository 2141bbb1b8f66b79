/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WAVE_FIELD_HPP
#define WAVE_FIELD_HPP

/**
 * @file WaveField.hpp
 * @brief Procedural ocean surface: a fixed set of trochoidal components summed over time
 *
 * Sampling (height, normal, current) is const and side-effect free, so any
 * number of floating bodies may query the field during a tick. Only advance()
 * and setStormIntensity() mutate it.
 *
 * Per component i:
 *   theta_i = k_i * dot(dir_i, xz) + omega_i * t + phase_i
 *   k_i     = 2*pi / wavelength_i
 *   omega_i = sqrt(g * k_i) * speedScale        (deep-water dispersion)
 *   height  = sum(A_i * sin(theta_i))
 */

#include "controllers/IUpdatable.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>
#include <vector>

namespace Driftwood {

class SettingsManager;

struct WaveComponent {
    float dirX{1.0f};        // unit direction in the XZ plane
    float dirZ{0.0f};
    float amplitudeScale{0.0f}; // amplitude / base height at init
    float wavelength{1.0f};
    float phase{0.0f};
    float wavenumber{0.0f};  // cached 2*pi / wavelength
};

/**
 * @brief Surface parameters at one end of the storm interpolation
 */
struct SeaStatePreset {
    float height{0.6f};
    float speed{1.0f};
    float currentStrength{0.4f};
};

struct WaveFieldConfig {
    int componentCount{4};
    uint32_t seed{1337};
    float baseHeight{0.6f};
    float baseSpeed{1.0f};
    float baseWavelength{12.0f};
    Vector3D currentDirection{1.0f, 0.0f, 0.0f};
    float currentStrength{0.4f};
    float turbulence{0.25f};
    SeaStatePreset calm{0.6f, 1.0f, 0.4f};
    SeaStatePreset storm{2.4f, 1.6f, 1.8f};

    static WaveFieldConfig fromSettings(const SettingsManager& settings);
};

class WaveField : public IUpdatable {
public:
    static constexpr double GRAVITY = 9.8;

    WaveField() = default;
    explicit WaveField(const WaveFieldConfig& config);
    ~WaveField() override = default;

    /**
     * @brief Regenerate the component set and reset the clock
     *
     * Direction angles are spread evenly around the circle with bounded
     * jitter, wavelengths grow with the component index, amplitudes fall off
     * as 1/(i+1). The same seed always yields the same components.
     */
    void init(int count, float baseHeight, float baseSpeed, uint32_t seed);

    /**
     * @brief Accumulate simulation time; ignores negative or non-finite dt
     */
    void advance(float deltaTime);

    // IUpdatable
    void update(float deltaTime) override { advance(deltaTime); }

    float height(const Vector3D& position) const;

    /**
     * @brief Surface normal from the analytic slope; (0,1,0) when degenerate
     */
    Vector3D normal(const Vector3D& position) const;

    /**
     * @brief Prevailing current plus wave-driven turbulence (y is always 0)
     */
    Vector3D current(const Vector3D& position) const;

    /**
     * @brief Blend height, speed and current strength between calm and storm
     * @param intensity clamped to [0, 1]
     */
    void setStormIntensity(float intensity);

    /**
     * @brief Upper bound of |height| with the present sea state
     */
    float amplitudeSum() const;

    float amplitude(size_t index) const;

    double getElapsedTime() const { return m_elapsed; }
    float getStormIntensity() const { return m_stormIntensity; }
    float getBaseHeight() const { return m_baseHeight; }
    float getSpeedScale() const { return m_speedScale; }
    float getCurrentStrength() const { return m_currentStrength; }
    const std::vector<WaveComponent>& getComponents() const { return m_components; }
    size_t getComponentCount() const { return m_components.size(); }

    void setCurrentDirection(const Vector3D& direction);
    void setPresets(const SeaStatePreset& calm, const SeaStatePreset& storm);
    void setBaseWavelength(float wavelength) { m_baseWavelength = wavelength > 1.0f ? wavelength : 1.0f; }
    void setTurbulence(float turbulence) { m_turbulence = turbulence; }

private:
    double phaseAt(const WaveComponent& wave, float x, float z) const;

    std::vector<WaveComponent> m_components;
    double m_elapsed{0.0};

    float m_baseHeight{0.6f};
    float m_speedScale{1.0f};
    float m_currentStrength{0.4f};
    float m_baseWavelength{12.0f};
    float m_turbulence{0.25f};
    float m_stormIntensity{0.0f};
    Vector3D m_currentDirection{1.0f, 0.0f, 0.0f};

    SeaStatePreset m_calm{};
    SeaStatePreset m_storm{2.4f, 1.6f, 1.8f};
};

} // namespace Driftwood

#endif // WAVE_FIELD_HPP
