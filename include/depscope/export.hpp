#pragma once

/// @file export.hpp
/// DEPSCOPE_EXPORT marks the public API of libdepscope.  The library builds
/// with hidden visibility, so anything a consumer links against (including
/// the dependency base class, whose vtable user descriptors extend) carries it.
///
/// CMake defines DEPSCOPE_BUILDING for the library's own sources and exports
/// DEPSCOPE_STATIC to consumers when BUILD_SHARED_LIBS is off.

#if defined(DEPSCOPE_STATIC)
  #define DEPSCOPE_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef DEPSCOPE_BUILDING
    #define DEPSCOPE_EXPORT __declspec(dllexport)
  #else
    #define DEPSCOPE_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define DEPSCOPE_EXPORT __attribute__((visibility("default")))
#else
  #define DEPSCOPE_EXPORT
#endif
