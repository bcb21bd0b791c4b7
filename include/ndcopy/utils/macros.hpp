#pragma once

#define NDCOPY_INLINE   __attribute__((always_inline)) inline

#define NDCOPY_UNLIKELY(expr) (__builtin_expect(!!(expr), false))
#define NDCOPY_LIKELY(expr)   (__builtin_expect(!!(expr), true))
