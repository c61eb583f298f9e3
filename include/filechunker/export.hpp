#pragma once

#ifdef _WIN32
// Suppress C4251 warnings for STL containers in exported classes
#pragma warning(push)
#pragma warning(disable: 4251)
#endif

#ifdef FILECHUNKER_STATIC
    // For static library linking, no import/export needed
    #define FILECHUNKER_API
#elif defined(_WIN32)
    #ifdef FILECHUNKER_BUILD
        #define FILECHUNKER_API __declspec(dllexport)
    #else
        #define FILECHUNKER_API __declspec(dllimport)
    #endif
#else
    #ifdef FILECHUNKER_BUILD
        #define FILECHUNKER_API __attribute__((visibility("default")))
    #else
        #define FILECHUNKER_API
    #endif
#endif

#ifdef _WIN32
#pragma warning(pop)
#endif
