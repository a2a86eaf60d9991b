#pragma once

#include <audiopipe/sdk/compiler.hh>

#if defined(AUDIOPIPE_COMPILER_MSVC)
#pragma warning( push )
#pragma warning( disable : 4820)
#elif defined(AUDIOPIPE_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(AUDIOPIPE_COMPILER_CLANG)
# pragma clang diagnostic push
#endif

#include <SDL3/SDL.h>

#if defined(AUDIOPIPE_COMPILER_MSVC)
#pragma warning( pop )
#elif defined(AUDIOPIPE_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(AUDIOPIPE_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif
