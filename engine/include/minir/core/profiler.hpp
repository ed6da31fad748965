#pragma once

// Tracy zones for the frame loop and scene passes. Compiled out unless the
// build sets MINIR_ENABLE_TRACY, which defines TRACY_ENABLE.

#if defined(TRACY_ENABLE)
#include <tracy/Tracy.hpp>

#define MINIR_PROFILE_FRAME(name) FrameMarkNamed(name)
#define MINIR_PROFILE_FUNCTION() ZoneScoped
#define MINIR_PROFILE_SCOPE(name) ZoneScopedN(name)
#define MINIR_PROFILE_PLOT(name, value) TracyPlot(name, value)
#else
#define MINIR_PROFILE_FRAME(name)
#define MINIR_PROFILE_FUNCTION()
#define MINIR_PROFILE_SCOPE(name)
#define MINIR_PROFILE_PLOT(name, value)
#endif
