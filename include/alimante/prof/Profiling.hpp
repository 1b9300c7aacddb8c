#pragma once
// include/alimante/prof/Profiling.hpp
//
// Scope zones for the Tracy profiler. Define ALIMANTE_WITH_TRACY (CMake option
// ALIMANTE_ENABLE_TRACY) to enable them; otherwise they compile to nothing.

#if defined(ALIMANTE_WITH_TRACY)
    #include <tracy/Tracy.hpp>
    #define ALIMANTE_ZONE(name) ZoneScopedN(name)
    #define ALIMANTE_THREAD_NAME(name) tracy::SetThreadName(name)
#else
    #define ALIMANTE_ZONE(name) ((void)0)
    #define ALIMANTE_THREAD_NAME(name) ((void)0)
#endif
