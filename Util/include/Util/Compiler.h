#ifndef UTIL_COMPILER_H_
#define UTIL_COMPILER_H_

#if defined(__GNUC__)
#define COLD_CODE    __attribute__((noinline, cold))
#define FORCE_INLINE __attribute__((always_inline)) inline
#define LIKELY(x)    __builtin_expect(!!(x), 1)
#define UNLIKELY(x)  __builtin_expect(!!(x), 0)
#elif defined(_MSC_VER)
#define COLD_CODE
#define FORCE_INLINE __forceinline
#define LIKELY(x)   (x)
#define UNLIKELY(x) (x)
#else
#define COLD_CODE
#define FORCE_INLINE inline
#define LIKELY(x)   (x)
#define UNLIKELY(x) (x)
#endif

#endif
