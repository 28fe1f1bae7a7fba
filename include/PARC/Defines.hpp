#pragma once

#ifndef PARC_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(PARC_SHARED_BUILD)
#define PARC_API __declspec(dllexport)
#elif defined(PARC_SHARED)
#define PARC_API __declspec(dllimport)
#else
#define PARC_API
#endif
#elif defined(PARC_SHARED_BUILD) || defined(PARC_SHARED)
#define PARC_API __attribute__((visibility("default")))
#else
#define PARC_API
#endif
#endif

namespace PARC
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

}// namespace PARC
