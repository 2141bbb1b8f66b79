/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WaveField.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace Driftwood {

namespace {
constexpr double TWO_PI = 6.283185307179586;
constexpr float DIRECTION_JITTER = 0.35f;
constexpr float WAVELENGTH_GROWTH = 0.6f;
constexpr float WAVELENGTH_JITTER = 1.0f;
constexpr float MIN_WAVELENGTH = 1.0f;
}

WaveFieldConfig WaveFieldConfig::fromSettings(const SettingsManager& settings) {
    WaveFieldConfig config;
    config.componentCount = settings.get<int>("ocean", "component_count", config.componentCount);
    config.seed = static_cast<uint32_t>(settings.get<int>("ocean", "seed", static_cast<int>(config.seed)));
    config.baseHeight = settings.get<float>("ocean", "base_height", config.baseHeight);
    config.baseSpeed = settings.get<float>("ocean", "base_speed", config.baseSpeed);
    config.baseWavelength = settings.get<float>("ocean", "base_wavelength", config.baseWavelength);
    config.currentDirection = Vector3D(settings.get<float>("ocean", "current_dir_x", 1.0f), 0.0f,
                                       settings.get<float>("ocean", "current_dir_z", 0.0f));
    config.currentStrength = settings.get<float>("ocean", "current_strength", config.currentStrength);
    config.turbulence = settings.get<float>("ocean", "turbulence", config.turbulence);

    config.calm.height = settings.get<float>("ocean", "calm_height", config.calm.height);
    config.calm.speed = settings.get<float>("ocean", "calm_speed", config.calm.speed);
    config.calm.currentStrength = settings.get<float>("ocean", "calm_current", config.calm.currentStrength);
    config.storm.height = settings.get<float>("ocean", "storm_height", config.storm.height);
    config.storm.speed = settings.get<float>("ocean", "storm_speed", config.storm.speed);
    config.storm.currentStrength = settings.get<float>("ocean", "storm_current", config.storm.currentStrength);
    return config;
}

WaveField::WaveField(const WaveFieldConfig& config)
    : m_baseWavelength(std::max(config.baseWavelength, MIN_WAVELENGTH)),
      m_turbulence(config.turbulence),
      m_calm(config.calm),
      m_storm(config.storm) {
    setCurrentDirection(config.currentDirection);
    init(config.componentCount, config.baseHeight, config.baseSpeed, config.seed);
    m_currentStrength = config.currentStrength;
}

void WaveField::init(int count, float baseHeight, float baseSpeed, uint32_t seed) {
    const int componentCount = std::max(count, 0);

    m_components.clear();
    m_components.reserve(static_cast<size_t>(componentCount));
    m_elapsed = 0.0;
    m_baseHeight = baseHeight;
    m_speedScale = baseSpeed;
    m_stormIntensity = 0.0f;

    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> angleJitter(-DIRECTION_JITTER, DIRECTION_JITTER);
    std::uniform_real_distribution<float> lengthJitter(-WAVELENGTH_JITTER, WAVELENGTH_JITTER);
    std::uniform_real_distribution<float> amplitudeRoll(0.5f, 1.0f);
    std::uniform_real_distribution<float> phaseRoll(0.0f, static_cast<float>(TWO_PI));

    for (int i = 0; i < componentCount; ++i) {
        WaveComponent wave;

        const float angle = static_cast<float>(TWO_PI * i / componentCount) + angleJitter(rng);
        wave.dirX = std::cos(angle);
        wave.dirZ = std::sin(angle);

        wave.wavelength = std::max(m_baseWavelength * (1.0f + WAVELENGTH_GROWTH * i) + lengthJitter(rng),
                                   MIN_WAVELENGTH);
        wave.wavenumber = static_cast<float>(TWO_PI / wave.wavelength);

        // Stored relative to base height so storm intensity can rescale the sea
        wave.amplitudeScale = amplitudeRoll(rng) / static_cast<float>(i + 1);
        wave.phase = phaseRoll(rng);

        m_components.push_back(wave);
    }

    WAVE_INFO("Initialized " + std::to_string(componentCount) + " wave components (seed " +
              std::to_string(seed) + ", base height " + std::to_string(baseHeight) + ")");
}

void WaveField::advance(float deltaTime) {
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        WAVE_WARN("Ignoring invalid timestep: " + std::to_string(deltaTime));
        return;
    }
    m_elapsed += static_cast<double>(deltaTime);
}

double WaveField::phaseAt(const WaveComponent& wave, float x, float z) const {
    const double k = static_cast<double>(wave.wavenumber);
    const double omega = std::sqrt(GRAVITY * k) * static_cast<double>(m_speedScale);

    // Reduce the time term first so precision holds for long sessions
    const double timeTerm = std::fmod(omega * m_elapsed, TWO_PI);
    const double spatial = k * (static_cast<double>(wave.dirX) * x + static_cast<double>(wave.dirZ) * z);
    return spatial + timeTerm + static_cast<double>(wave.phase);
}

float WaveField::amplitude(size_t index) const {
    if (index >= m_components.size()) {
        return 0.0f;
    }
    return m_components[index].amplitudeScale * m_baseHeight;
}

float WaveField::height(const Vector3D& position) const {
    double sum = 0.0;
    for (const auto& wave : m_components) {
        const double a = static_cast<double>(wave.amplitudeScale) * m_baseHeight;
        sum += a * std::sin(phaseAt(wave, position.getX(), position.getZ()));
    }
    return static_cast<float>(sum);
}

Vector3D WaveField::normal(const Vector3D& position) const {
    double dx = 0.0;
    double dz = 0.0;
    for (const auto& wave : m_components) {
        const double a = static_cast<double>(wave.amplitudeScale) * m_baseHeight;
        const double slope = a * wave.wavenumber * std::cos(phaseAt(wave, position.getX(), position.getZ()));
        dx += slope * wave.dirX;
        dz += slope * wave.dirZ;
    }

    Vector3D n(static_cast<float>(-dx), 1.0f, static_cast<float>(-dz));
    if (!n.isFinite()) {
        return Vector3D(0.0f, 1.0f, 0.0f);
    }
    return n.normalized();
}

Vector3D WaveField::current(const Vector3D& position) const {
    Vector3D result = m_currentDirection * m_currentStrength;

    if (m_baseHeight <= 0.0f || m_turbulence == 0.0f) {
        return result;
    }

    const float crest = std::clamp(height(position) / m_baseHeight, 0.0f, 1.0f);
    const double t = std::fmod(m_elapsed, TWO_PI * 20.0); // common period of the 0.5 and 0.3 rates
    const float swirlX = static_cast<float>(std::sin(t * 0.5 + position.getX() * 0.1));
    const float swirlZ = static_cast<float>(std::cos(t * 0.3 + position.getZ() * 0.1));

    result += Vector3D(swirlX, 0.0f, swirlZ) * (m_turbulence * crest);
    return result;
}

void WaveField::setStormIntensity(float intensity) {
    if (!std::isfinite(intensity)) {
        WAVE_WARN("Ignoring non-finite storm intensity");
        return;
    }

    m_stormIntensity = std::clamp(intensity, 0.0f, 1.0f);
    const float t = m_stormIntensity;
    m_baseHeight = m_calm.height + (m_storm.height - m_calm.height) * t;
    m_speedScale = m_calm.speed + (m_storm.speed - m_calm.speed) * t;
    m_currentStrength = m_calm.currentStrength + (m_storm.currentStrength - m_calm.currentStrength) * t;

    WAVE_DEBUG("Storm intensity " + std::to_string(m_stormIntensity) + ": height " +
               std::to_string(m_baseHeight) + ", speed " + std::to_string(m_speedScale));
}

float WaveField::amplitudeSum() const {
    float sum = 0.0f;
    for (const auto& wave : m_components) {
        sum += wave.amplitudeScale;
    }
    return sum * std::fabs(m_baseHeight);
}

void WaveField::setCurrentDirection(const Vector3D& direction) {
    Vector3D flat = direction.flattened();
    if (flat.lengthSquared() == 0.0f) {
        WAVE_WARN("Zero current direction, current is disabled");
    }
    m_currentDirection = flat;
}

void WaveField::setPresets(const SeaStatePreset& calm, const SeaStatePreset& storm) {
    m_calm = calm;
    m_storm = storm;
}

} // namespace Driftwood
