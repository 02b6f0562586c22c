#pragma once

#ifdef DOCCHUNK_STATIC
    // For static library linking, no import/export needed
    #define DOCCHUNK_API
#elif defined(_WIN32)
    #ifdef DOCCHUNK_BUILD
        #define DOCCHUNK_API __declspec(dllexport)
    #else
        #define DOCCHUNK_API __declspec(dllimport)
    #endif
#else
    #ifdef DOCCHUNK_BUILD
        #define DOCCHUNK_API __attribute__((visibility("default")))
    #else
        #define DOCCHUNK_API
    #endif
#endif
