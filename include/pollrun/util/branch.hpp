#pragma once

// Branch prediction hints for the runner and channel fast paths.
#if defined(__GNUC__) || defined(__clang__)
#define POLLRUN_LIKELY(x) (__builtin_expect(!!(x), 1))
#define POLLRUN_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define POLLRUN_LIKELY(x) (x)
#define POLLRUN_UNLIKELY(x) (x)
#endif
