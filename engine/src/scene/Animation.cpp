#include "orrery/scene/Animation.hpp"

#include <cmath>

namespace orrery::scene
{
    std::string_view toString(AnimationStatus status)
    {
        switch (status)
        {
        case AnimationStatus::Playing: return "playing";
        case AnimationStatus::Paused: return "paused";
        case AnimationStatus::Stopped: return "stopped";
        }
        return "unknown";
    }

    std::string_view toString(AnimationPlayMode mode)
    {
        switch (mode)
        {
        case AnimationPlayMode::Loop: return "loop";
        case AnimationPlayMode::Once: return "once";
        case AnimationPlayMode::PingPong: return "pingpong";
        }
        return "unknown";
    }

    void AnimationInstance::update(float dt)
    {
        if (status != AnimationStatus::Playing || !std::isfinite(dt))
        {
            return;
        }
        if (duration <= 0.0f)
        {
            time = 0.0f;
            if (mode == AnimationPlayMode::Once)
            {
                status = AnimationStatus::Stopped;
            }
            return;
        }

        switch (mode)
        {
        case AnimationPlayMode::Loop:
            time = std::fmod(time + dt, duration);
            if (time < 0.0f)
            {
                time += duration;
            }
            break;
        case AnimationPlayMode::Once:
            time += dt;
            if (time >= duration)
            {
                time = duration;
                status = AnimationStatus::Stopped;
            }
            break;
        case AnimationPlayMode::PingPong:
        {
            // Unfold the bounce onto [0, 2 * duration) so any step size lands in one fold.
            const float period = 2.0f * duration;
            const float unfolded = direction < 0.0f ? period - time : time;
            float phase = std::fmod(unfolded + dt, period);
            if (phase < 0.0f)
            {
                phase += period;
            }
            if (phase <= duration)
            {
                time = phase;
                direction = 1.0f;
            }
            else
            {
                time = period - phase;
                direction = -1.0f;
            }
            break;
        }
        }
    }

    void AnimationInstance::pause()
    {
        if (status == AnimationStatus::Playing)
        {
            status = AnimationStatus::Paused;
        }
    }

    void AnimationInstance::resume()
    {
        if (status == AnimationStatus::Paused)
        {
            status = AnimationStatus::Playing;
        }
    }

    void AnimationInstance::stop()
    {
        status = AnimationStatus::Stopped;
        time = 0.0f;
        direction = 1.0f;
    }

    void AnimationInstance::setMode(AnimationPlayMode newMode)
    {
        mode = newMode;
        if (mode != AnimationPlayMode::PingPong)
        {
            direction = 1.0f;
        }
    }
}
