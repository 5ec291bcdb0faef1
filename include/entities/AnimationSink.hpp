/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ANIMATION_SINK_HPP
#define ANIMATION_SINK_HPP

/**
 * @file AnimationSink.hpp
 * @brief Host-supplied animation playback capability
 *
 * The simulation only names animations ("idle", "walk", "run", "attack",
 * "lightAttack", "heavyAttack", "hitToBody"). How clips are blended or
 * rendered is entirely up to the implementation.
 */

#include <string_view>

struct Unit;

class AnimationSink
{
public:
    static constexpr float DEFAULT_FADE_DURATION{0.2f};

    virtual ~AnimationSink() = default;

    /**
     * @brief Start (or cross-fade to) a named animation on a unit
     * @param unit Unit to animate
     * @param name Animation clip name
     * @param fadeDuration Cross-fade time in seconds
     */
    virtual void playAnimation(const Unit& unit, std::string_view name, float fadeDuration) = 0;

    virtual void stopAnimations(const Unit& unit) = 0;

    [[nodiscard]] virtual bool isAnimationPlaying(const Unit& unit, std::string_view name) const = 0;
};

#endif // ANIMATION_SINK_HPP
