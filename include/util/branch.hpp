#pragma once

// Branch prediction hints for hot loops (the log drain).
// No-ops on compilers without __builtin_expect.
#if defined(__GNUC__) || defined(__clang__)
#define RESYNC_LIKELY(x) (__builtin_expect(!!(x), 1))
#define RESYNC_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define RESYNC_LIKELY(x) (x)
#define RESYNC_UNLIKELY(x) (x)
#endif
