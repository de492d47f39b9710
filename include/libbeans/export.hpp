#pragma once

/// @file export.hpp
/// LIBBEANS_EXPORT marks the public classes of a shared libbeans build.
///
/// CMake defines LIBBEANS_BUILDING while compiling the library and
/// LIBBEANS_STATIC for static builds (consumers inherit it).

#if defined(_WIN32) || defined(__CYGWIN__)
  #define LIBBEANS_DSO_EXPORT __declspec(dllexport)
  #define LIBBEANS_DSO_IMPORT __declspec(dllimport)
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBBEANS_DSO_EXPORT __attribute__((visibility("default")))
  #define LIBBEANS_DSO_IMPORT __attribute__((visibility("default")))
#else
  #define LIBBEANS_DSO_EXPORT
  #define LIBBEANS_DSO_IMPORT
#endif

#if defined(LIBBEANS_STATIC)
  #define LIBBEANS_EXPORT
#elif defined(LIBBEANS_BUILDING)
  #define LIBBEANS_EXPORT LIBBEANS_DSO_EXPORT
#else
  #define LIBBEANS_EXPORT LIBBEANS_DSO_IMPORT
#endif
