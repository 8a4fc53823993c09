#pragma once

#include <cstring>

#if defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    // CPU Profiling Macros
    #define PRISM_PROFILE_FUNCTION() ZoneScoped
    #define PRISM_PROFILE_SCOPE(name) ZoneScopedN(name)
    #define PRISM_PROFILE_TAG(str) ZoneText(str, strlen(str))

#else
    // Empty macros when disabled
    #define PRISM_PROFILE_FUNCTION()
    #define PRISM_PROFILE_SCOPE(name)
    #define PRISM_PROFILE_TAG(str)

#endif
