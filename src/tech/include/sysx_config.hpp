#pragma once

#ifdef _MSC_VER
#define SYSX_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__)
#define SYSX_ALWAYS_INLINE inline __attribute__((__always_inline__))
#else
#define SYSX_ALWAYS_INLINE inline
#endif

#ifdef _MSC_VER
#define SYSX_PRETTY_FUNCTION __FUNCSIG__
#else
#define SYSX_PRETTY_FUNCTION __PRETTY_FUNCTION__
#endif
