/**
 * @file compiler.hh
 * @brief Compiler detection used to scope warning suppression around C headers
 */
#pragma once

#if defined(__clang__)
#define AUDIOPIPE_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
#define AUDIOPIPE_COMPILER_GCC
#elif defined(_MSC_VER)
#define AUDIOPIPE_COMPILER_MSVC
#endif
