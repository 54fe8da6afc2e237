/* wasmjit WebAssembly Runtime Compiler
Copyright (c)2021 Fundament Software

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
*/

#ifndef WJ__WASMJIT_H
#define WJ__WASMJIT_H

#define WASMJIT_VERSION_MAJOR       0
#define WASMJIT_VERSION_MINOR       1
#define WASMJIT_VERSION_REVISION    0
#define WASMJIT_WASM_MAGIC_COOKIE   0x6d736100
#define WASMJIT_WASM_MAGIC_VERSION  0x01
#define WASMJIT_VERSION(v, m, r)    (((v | 0ULL) << 32) | ((m | 0ULL) << 16) | (r | 0ULL))

// CPU Architecture (possible pre-defined macros found on http://predef.sourceforge.net/prearch.html)
#if defined(_M_X64) || defined(__amd64__) || defined(__amd64) || defined(_AMD64_) || defined(__x86_64__) || \
  defined(__x86_64) || defined(_LP64)
  #define WJ_CPU_x86_64 // x86-64 architecture
  #define WJ_64BIT
#elif defined(_M_IX86) || defined(__i386) || defined(__i386__) || defined(__X86__) || defined(_X86_) || \
  defined(__I86__) || defined(__THW_INTEL__) || defined(__INTEL__)
  #define WJ_CPU_x86 // x86 architecture
  #define WJ_32BIT
#elif defined(__arm__) || defined(__thumb__) || defined(__TARGET_ARCH_ARM) || defined(__TARGET_ARCH_THUMB) || \
  defined(_ARM) || defined(__aarch64__)
  #ifdef __aarch64__
    #define WJ_CPU_ARM64 // ARM 64-bit architecture
    #define WJ_64BIT
  #else
    #define WJ_CPU_ARM // ARM 32-bit architecture
    #define WJ_32BIT
  #endif
#else
  #define WJ_CPU_UNKNOWN
#endif

// Compiler detection and macro generation
#if defined(__clang__) // Clang (must be before GCC, because clang also pretends it's GCC)
  #define WJ_COMPILER_CLANG
  #define WJ_FORCEINLINE __attribute__((always_inline)) inline
  #define WJ_NORETURN    __attribute__((noreturn))
#elif defined __GNUC__ // GCC
  #define WJ_COMPILER_GCC
  #define WJ_FORCEINLINE __attribute__((always_inline)) inline
  #define WJ_NORETURN    __attribute__((noreturn))
#elif defined _MSC_VER // VC++
  #define WJ_COMPILER_MSC
  #define WJ_FORCEINLINE __forceinline
  #define WJ_NORETURN    __declspec(noreturn)
#endif

// Platform detection
#if defined(WIN32) || defined(_WIN32) || defined(_WIN64) || defined(__TOS_WIN__) || defined(__WINDOWS__)
  #define WJ_PLATFORM_WIN32
#elif defined(_POSIX_VERSION) || defined(_XOPEN_VERSION) || defined(unix) || defined(__unix__) || defined(__unix)
  #define WJ_PLATFORM_POSIX
#endif

#if defined(__APPLE__) || defined(__MACH__)
  #define WJ_PLATFORM_APPLE // Should also define POSIX, use only for Apple OS specific features
#endif

#if defined(__linux__) || defined(__linux)
  #define WJ_PLATFORM_LINUX // Should also define POSIX, use only for linux specific features
#endif

#if !(defined(WJ_PLATFORM_WIN32) || defined(WJ_PLATFORM_POSIX) || defined(WJ_PLATFORM_APPLE))
  #error "Unknown Platform"
#endif

// Debug detection
#ifdef WJ_COMPILER_GCC
  #ifndef NDEBUG
    #define WJ_DEBUG
  #endif
#else
  #if defined(DEBUG) || defined(_DEBUG)
    #define WJ_DEBUG
  #endif
#endif

#ifdef WJ_COMPILER_MSC
  #define STRICMP(a, b)         _stricmp(a, b)
  #define FPRINTF(f, ...)       fprintf_s(f, __VA_ARGS__)
  #define VFPRINTF(f, fmt, va)  vfprintf_s(f, fmt, va)
  #define STRNICMP(a, b, n)     _strnicmp(a, b, n)
#else
  #define STRICMP(a, b)         strcasecmp(a, b)
  #define FPRINTF(f, ...)       fprintf(f, __VA_ARGS__)
  #define VFPRINTF(f, fmt, va)  vfprintf(f, fmt, va)
  #define STRNICMP(a, b, n)     strncasecmp(a, b, n)
#endif

#endif
