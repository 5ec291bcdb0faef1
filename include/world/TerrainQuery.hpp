/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TERRAIN_QUERY_HPP
#define TERRAIN_QUERY_HPP

/**
 * @brief Ground height lookup supplied by the world/terrain layer
 *
 * Used to place units on the ground at spawn and to land units that fall
 * under gravity.
 */
class TerrainQuery
{
public:
    virtual ~TerrainQuery() = default;

    /// World-space ground height (Y) at the given X/Z position
    [[nodiscard]] virtual float getHeightAt(float x, float z) const = 0;
};

#endif // TERRAIN_QUERY_HPP
