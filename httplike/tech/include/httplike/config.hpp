#pragma once

#if defined(__GNUC__)
#define HTTPLIKE_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define HTTPLIKE_UNLIKELY(x) (!!(x))
#endif
