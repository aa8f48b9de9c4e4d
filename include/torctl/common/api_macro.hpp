#pragma once

#if defined(TORCTL_SHARED_LIB)
#if defined(_WIN32)
#ifdef TORCTL_EXPORTS
#define TORCTL_API __declspec(dllexport)
#else
#define TORCTL_API __declspec(dllimport)
#endif
#else
#define TORCTL_API __attribute__((visibility("default")))
#endif
#else
#define TORCTL_API
#endif
