// shadegraph

#pragma once

#if !defined(SG_ASSERT)
#include <cassert>
#define SG_ASSERT(x, ...) assert(x)
#endif

#if !defined(SG_BREAK)
#if _MSC_VER
#define SG_BREAK() __debugbreak()
#else
#define SG_BREAK() (void)0
#endif
#endif

// Rejects misuse of the builder and lookup calls: breaks into an attached
// debugger where supported, then returns from the calling function.
#define SG_GUARD_OR(x, r, ...) \
    if (x)                     \
    {                          \
    }                          \
    else                       \
    {                          \
        SG_BREAK();            \
        return (r);            \
    }

#define SG_GUARD_VOID(x, ...) \
    if (x)                    \
    {                         \
    }                         \
    else                      \
    {                         \
        SG_BREAK();           \
        return;               \
    }
