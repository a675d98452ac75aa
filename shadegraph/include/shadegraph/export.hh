// shadegraph

#pragma once

#if defined(SG_EXPORT)
#if defined(_WINDOWS)
#define SG_API __declspec(dllexport)
#else
#define SG_API [[gnu::visibility("default")]]
#endif
#else
#define SG_API
#endif
