#pragma once

#if defined(LOCALSYNC_STATIC)
    #define LS_API
#elif defined(_WIN32)
    #ifdef LOCALSYNC_EXPORTS
        #define LS_API __declspec(dllexport)
    #else
        #define LS_API __declspec(dllimport)
    #endif
#else
    #define LS_API __attribute__((visibility("default")))
#endif
