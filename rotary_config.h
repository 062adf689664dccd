#pragma once

// This file is included by C and C++ files.
// So do not output any token!

#define ROTARY_ARCH(ROTARY_FEATURE) (ROTARY_ARCH_##ROTARY_FEATURE)
#define ROTARY_PLATFORM(ROTARY_FEATURE) (ROTARY_PLATFORM_##ROTARY_FEATURE)

// ARCH defines
#if defined(_M_IX86) || defined(__i386__)
    #define ROTARY_ARCH_X86 1
    #define ROTARY_ARCH_32BIT 1
#endif

#if defined(_M_X64) || defined(__amd64__) || defined(__x86_64__)
    #define ROTARY_ARCH_AMD64 1
    #if defined(__ILP32__)
        #define ROTARY_ARCH_32BIT 1
    #else
        #define ROTARY_ARCH_64BIT 1
    #endif
#endif

#if defined(__arm__) || defined(_M_ARM)
    #define ROTARY_ARCH_ARM 1
    #define ROTARY_ARCH_32BIT 1
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
    #define ROTARY_ARCH_ARM64 1
    #define ROTARY_ARCH_64BIT 1
#endif

#if defined(__riscv) && defined(__riscv_xlen) && __riscv_xlen == 64
    #define ROTARY_ARCH_RISCV64 1
    #define ROTARY_ARCH_64BIT 1
#endif

// PLATFORM defines
#if defined(_WIN32)
    // Covers both 32 and 64bit Windows
    #define ROTARY_PLATFORM_WINDOWS 1
#elif defined(__APPLE__)
    #include <TargetConditionals.h>
    #if TARGET_OS_IPHONE
        #define ROTARY_PLATFORM_IOS 1
    #elif TARGET_OS_MAC
        #define ROTARY_PLATFORM_MAC 1
    #else
        #error "Unknown Apple platform"
    #endif
#elif defined(__ANDROID__)
    // Head units run Android, but the engine never talks to the framework directly.
    #define ROTARY_PLATFORM_ANDROID 1
    #define ROTARY_PLATFORM_LINUX 1
#elif defined(__linux__)
    #define ROTARY_PLATFORM_LINUX 1
#endif
