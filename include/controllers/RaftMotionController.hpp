/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAFT_MOTION_CONTROLLER_HPP
#define RAFT_MOTION_CONTROLLER_HPP

/**
 * @file RaftMotionController.hpp
 * @brief Floats and propels a raft using its structure aggregate and the ocean
 *
 * Read-only consumer of StructureRegistry::aggregate() and WaveField samples.
 * Registered after the WaveField in the update order so it samples the
 * surface for the current tick.
 */

#include "controllers/IUpdatable.hpp"
#include "utils/Vector3D.hpp"
#include <string_view>

namespace Driftwood {
class SettingsManager;
class StructureRegistry;
class WaveField;
}

struct RaftMotionConfig {
    float massPerTile{80.0f};     // kg contributed by each tile
    float turnRate{0.35f};        // rad/s per rudder at full steer input
    float currentDrag{0.8f};      // how strongly the current pulls the hull
    float linearDamping{0.5f};    // 1/s
    float freeboard{0.3f};        // deck height above the local surface
    float buoyancyRate{4.0f};     // 1/s, how fast the deck eases to the surface

    static RaftMotionConfig fromSettings(const Driftwood::SettingsManager& settings);
};

class RaftMotionController : public IUpdatable
{
public:
    RaftMotionController(const Driftwood::StructureRegistry& registry,
                         const Driftwood::WaveField& ocean,
                         RaftMotionConfig config = {});
    ~RaftMotionController() override = default;

    void update(float deltaTime) override;

    /**
     * @brief Engine output fraction
     * @param throttle clamped to [0, 1]
     */
    void setThrottle(float throttle);

    /**
     * @brief Turn request; the sign picks the side, the rudder count the strength
     * @param steer clamped to [-1, 1]
     */
    void setSteerInput(float steer);

    /**
     * @brief Offset of the raft's local grid origin in the world
     */
    [[nodiscard]] const Vector3D& getPosition() const { return m_position; }
    void setPosition(const Vector3D& position) { m_position = position; }

    [[nodiscard]] const Vector3D& getVelocity() const { return m_velocity; }
    [[nodiscard]] float getHeading() const { return m_heading; }
    void setHeading(float heading) { m_heading = heading; }

    [[nodiscard]] Vector3D getForward() const;
    [[nodiscard]] const Vector3D& getUp() const { return m_up; }
    [[nodiscard]] float getThrottle() const { return m_throttle; }
    [[nodiscard]] float getSteerInput() const { return m_steer; }

    /**
     * @brief World position of the structure's center of mass
     */
    [[nodiscard]] Vector3D getCenterWorldPosition() const;

    [[nodiscard]] std::string_view getName() const { return "RaftMotionController"; }

private:
    const Driftwood::StructureRegistry& m_registry;
    const Driftwood::WaveField& m_ocean;
    RaftMotionConfig m_config;

    Vector3D m_position{};
    Vector3D m_velocity{};
    Vector3D m_up{0.0f, 1.0f, 0.0f};
    float m_heading{0.0f}; // radians about +Y, 0 faces +X
    float m_throttle{0.0f};
    float m_steer{0.0f};
};

#endif // RAFT_MOTION_CONTROLLER_HPP
