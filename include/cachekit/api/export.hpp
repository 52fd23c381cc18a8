#pragma once

#if defined(_WIN32)
#if defined(CACHEKIT_BUILD_DLL)
#define CACHEKIT_API __declspec(dllexport)
#elif defined(CACHEKIT_USE_DLL)
#define CACHEKIT_API __declspec(dllimport)
#else
#define CACHEKIT_API
#endif
#else
#define CACHEKIT_API
#endif
