#pragma once

#if defined(_WIN32) && defined(LERPABLE_CORE_SHARED)
  #if defined(LERPABLE_CORE_BUILDING)
    #define LERPABLE_CORE_API __declspec(dllexport)
  #else
    #define LERPABLE_CORE_API __declspec(dllimport)
  #endif
#else
  #define LERPABLE_CORE_API
#endif
