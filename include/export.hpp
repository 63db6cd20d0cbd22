#pragma once

#if defined(_WIN32)
    #if defined(SLOWOSIEC_EXPORT)
        #define SLOWOSIEC_API __declspec(dllexport)
    #else
        #define SLOWOSIEC_API __declspec(dllimport)
    #endif
#else
    #define SLOWOSIEC_API __attribute__((visibility("default")))
#endif
