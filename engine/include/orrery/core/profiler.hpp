#pragma once

#include <cstring>

#if defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    // CPU Profiling Macros
    #define ORRERY_PROFILE_FRAME(name) FrameMarkNamed(name)
    #define ORRERY_PROFILE_FRAME_MARK() FrameMark
    #define ORRERY_PROFILE_FUNCTION() ZoneScoped
    #define ORRERY_PROFILE_SCOPE(name) ZoneScopedN(name)
    #define ORRERY_PROFILE_TAG(str) ZoneText(str, strlen(str))

#else
    // Empty macros when disabled
    #define ORRERY_PROFILE_FRAME(name)
    #define ORRERY_PROFILE_FRAME_MARK()
    #define ORRERY_PROFILE_FUNCTION()
    #define ORRERY_PROFILE_SCOPE(name)
    #define ORRERY_PROFILE_TAG(str)

#endif
