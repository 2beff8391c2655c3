#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(WARDEN_EXPORTS)
    #define WDN_API __declspec(dllexport)
  #elif defined(WARDEN_SHARED)
    #define WDN_API __declspec(dllimport)
  #else
    #define WDN_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define WDN_API __attribute__((visibility("default")))
#else
  #define WDN_API
#endif
