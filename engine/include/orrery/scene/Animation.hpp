#pragma once

#include <cstdint>
#include <string_view>

namespace orrery::scene
{
    enum class AnimationStatus : uint8_t
    {
        Playing,
        Paused,
        Stopped
    };

    enum class AnimationPlayMode : uint8_t
    {
        Loop,
        Once,
        PingPong
    };

    std::string_view toString(AnimationStatus status);
    std::string_view toString(AnimationPlayMode mode);

    // Playback cursor for one clip on a skeletal mesh node. Sampling the clip into
    // a pose is the animation system's job; this only tracks time.
    struct AnimationInstance
    {
        uint32_t clip = 0;
        AnimationPlayMode mode = AnimationPlayMode::Once;
        AnimationStatus status = AnimationStatus::Playing;
        float time = 0.0f;
        float duration = 0.0f;
        float direction = 1.0f; // -1 while a ping-pong runs backwards

        void update(float dt);

        void pause();
        void resume();
        void stop();
        void setMode(AnimationPlayMode newMode);

        bool isPlaying() const { return status == AnimationStatus::Playing; }
        float normalizedTime() const { return duration > 0.0f ? time / duration : 0.0f; }
    };
}
