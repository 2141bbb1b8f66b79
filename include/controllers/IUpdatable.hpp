/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IUPDATABLE_HPP
#define IUPDATABLE_HPP

/**
 * @file IUpdatable.hpp
 * @brief Interface for systems stepped once per fixed simulation tick
 *
 * The simulation loop owns an ordered list of IUpdatable pointers and calls
 * update() with the fixed timestep from SimulationClock. Order matters: the
 * ocean advances before the raft samples it.
 *
 * Implemented by WaveField and RaftMotionController. BuildSession is driven
 * explicitly through tick() because it needs the actor's anchor pose.
 */
class IUpdatable
{
public:
    virtual ~IUpdatable() = default;

    /**
     * @brief Advance one fixed step
     * @param deltaTime Fixed timestep in seconds
     */
    virtual void update(float deltaTime) = 0;
};

#endif // IUPDATABLE_HPP
