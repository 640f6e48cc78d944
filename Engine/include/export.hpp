#pragma once

#if defined(_WIN32)
    #if defined(STONETRAIL_EXPORT)
        #define STONETRAIL_API __declspec(dllexport)
    #else
        #define STONETRAIL_API __declspec(dllimport)
    #endif
#else
    #define STONETRAIL_API __attribute__((visibility("default")))
#endif
