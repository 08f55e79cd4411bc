#pragma once

#if defined(_WIN32) && defined(BATCHKIN_CORE_SHARED)
  #if defined(BATCHKIN_CORE_BUILDING)
    #define BATCHKIN_CORE_API __declspec(dllexport)
  #else
    #define BATCHKIN_CORE_API __declspec(dllimport)
  #endif
#else
  #define BATCHKIN_CORE_API
#endif
