#pragma once

// Static builds are the default; PREBUILT_SHARED is set by the build when the
// engine is produced as a DLL.
#if defined(_WIN32) && defined(PREBUILT_SHARED)
    #if defined(PREBUILT_EXPORT)
        #define PREBUILT_API __declspec(dllexport)
    #else
        #define PREBUILT_API __declspec(dllimport)
    #endif
#elif defined(_WIN32)
    #define PREBUILT_API
#else
    #define PREBUILT_API __attribute__((visibility("default")))
#endif
