/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/RaftMotionController.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include "world/StructureRegistry.hpp"
#include "world/WaveField.hpp"
#include <algorithm>
#include <cmath>

namespace {
constexpr float TWO_PI = 6.28318530718f;
}

RaftMotionConfig RaftMotionConfig::fromSettings(const Driftwood::SettingsManager& settings)
{
    RaftMotionConfig config;
    config.massPerTile = settings.get<float>("motion", "mass_per_tile", config.massPerTile);
    config.turnRate = settings.get<float>("motion", "turn_rate", config.turnRate);
    config.currentDrag = settings.get<float>("motion", "current_drag", config.currentDrag);
    config.linearDamping = settings.get<float>("motion", "linear_damping", config.linearDamping);
    config.freeboard = settings.get<float>("motion", "freeboard", config.freeboard);
    config.buoyancyRate = settings.get<float>("motion", "buoyancy_rate", config.buoyancyRate);
    return config;
}

RaftMotionController::RaftMotionController(const Driftwood::StructureRegistry& registry,
                                           const Driftwood::WaveField& ocean,
                                           RaftMotionConfig config)
    : m_registry(registry), m_ocean(ocean), m_config(config)
{
}

void RaftMotionController::setThrottle(float throttle)
{
    m_throttle = std::isfinite(throttle) ? std::clamp(throttle, 0.0f, 1.0f) : 0.0f;
}

void RaftMotionController::setSteerInput(float steer)
{
    m_steer = std::isfinite(steer) ? std::clamp(steer, -1.0f, 1.0f) : 0.0f;
}

Vector3D RaftMotionController::getForward() const
{
    return Vector3D(std::cos(m_heading), 0.0f, std::sin(m_heading));
}

Vector3D RaftMotionController::getCenterWorldPosition() const
{
    const Vector3D& local = m_registry.aggregate().centerOfMass;
    return Vector3D(m_position.getX() + local.getX(), m_position.getY(),
                    m_position.getZ() + local.getZ());
}

void RaftMotionController::update(float deltaTime)
{
    if (!std::isfinite(deltaTime) || deltaTime <= 0.0f) {
        return;
    }

    const Driftwood::StructureAggregate& agg = m_registry.aggregate();
    if (agg.tileCount == 0) {
        return;
    }

    // Rudders only bite while the raft is under way
    if (agg.canMove && agg.steering > 0.0f) {
        m_heading += agg.steering * m_config.turnRate * m_steer * deltaTime;
        m_heading = std::fmod(m_heading, TWO_PI);
    }

    const Vector3D center = getCenterWorldPosition();
    const float mass = std::max(m_config.massPerTile * static_cast<float>(agg.tileCount), 1.0f);

    Vector3D acceleration = m_ocean.current(center) * m_config.currentDrag;
    if (agg.canMove) {
        acceleration += getForward() * (agg.thrust / mass * m_throttle);
    }

    m_velocity += acceleration * deltaTime;
    m_velocity *= std::max(0.0f, 1.0f - m_config.linearDamping * deltaTime);
    m_velocity.setY(0.0f);
    m_position += m_velocity * deltaTime;

    // Ease the deck toward the local surface instead of snapping to it
    const float targetY = m_ocean.height(center) + m_config.freeboard;
    const float blend = std::min(m_config.buoyancyRate * deltaTime, 1.0f);
    m_position.setY(m_position.getY() + (targetY - m_position.getY()) * blend);

    m_up = m_ocean.normal(center);

    if (!m_position.isFinite()) {
        MOTION_ERROR("Raft position became non-finite, resetting velocity");
        m_position = Vector3D(0.0f, targetY, 0.0f);
        m_velocity = Vector3D();
    }
}
