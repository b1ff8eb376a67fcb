#pragma once

// Force inline for member functions (no static keyword)
#ifdef PULSELED_NO_FORCE_INLINE
#define PL_FORCE_INLINE inline
#else
#define PL_FORCE_INLINE __attribute__((always_inline)) inline
#endif

#define PL_NORETURN __attribute__((noreturn))

#if defined(__GNUC__) || defined(__clang__)
#define PL_LIKELY(x) __builtin_expect(!!(x), 1)
#define PL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define PL_LIKELY(x) (x)
#define PL_UNLIKELY(x) (x)
#endif

