/*
 * Copyright (c) 2017-present Samsung Electronics Co., Ltd
 *
 *  This library is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public
 *  License as published by the Free Software Foundation; either
 *  version 2.1 of the License, or (at your option) any later version.
 *
 *  This library is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 *  Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public
 *  License along with this library; if not, write to the Free Software
 *  Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301
 *  USA
 */

#ifndef __Interop__
#define __Interop__

#include <algorithm>
#include <cassert>
#include <climits>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <functional>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

/* COMPILER() - the compiler being used to build the project */
#if defined(__clang__)
#define COMPILER_CLANG 1
#elif defined(_MSC_VER)
#define COMPILER_MSVC 1
#elif (__GNUC__)
#define COMPILER_GCC 1
#else
#error "Compiler dectection failed"
#endif

/* ALWAYS_INLINE */
#ifndef ALWAYS_INLINE
#if (defined(COMPILER_GCC) || defined(COMPILER_CLANG)) && defined(NDEBUG)
#define ALWAYS_INLINE inline __attribute__((__always_inline__))
#elif defined(COMPILER_MSVC) && defined(NDEBUG)
#define ALWAYS_INLINE __forceinline
#else
#define ALWAYS_INLINE inline
#endif
#endif

/* UNLIKELY */
#ifndef UNLIKELY
#if defined(COMPILER_GCC) || defined(COMPILER_CLANG)
#define UNLIKELY(x) __builtin_expect((x), 0)
#else
#define UNLIKELY(x) (x)
#endif
#endif

/* LIKELY */
#ifndef LIKELY
#if defined(COMPILER_GCC) || defined(COMPILER_CLANG)
#define LIKELY(x) __builtin_expect((x), 1)
#else
#define LIKELY(x) (x)
#endif
#endif

/* NO_RETURN */
#ifndef NO_RETURN
#if defined(COMPILER_GCC) || defined(COMPILER_CLANG)
#define NO_RETURN __attribute((__noreturn__))
#elif defined(COMPILER_MSVC)
#define NO_RETURN __declspec(noreturn)
#else
#define NO_RETURN
#endif
#endif

/* EXPORT */
#ifndef EXPORT
#if defined(COMPILER_MSVC)
#define EXPORT __declspec(dllexport)
#else
#define EXPORT __attribute__((visibility("default")))
#endif
#endif

#ifdef ENABLE_CUSTOM_LOGGING
// use customized logging
namespace Interop {
void customInteropInfoLogger(const char* format, ...);
void customInteropErrorLogger(const char* format, ...);
} // namespace Interop
#define INTEROP_LOG_INFO(...) ::Interop::customInteropInfoLogger(__VA_ARGS__);
#define INTEROP_LOG_ERROR(...) ::Interop::customInteropErrorLogger(__VA_ARGS__);
#else
// use default logging
#define INTEROP_LOG_INFO(...) fprintf(stdout, __VA_ARGS__);
#define INTEROP_LOG_ERROR(...) fprintf(stderr, __VA_ARGS__);
#endif

// engine tracing, compiled in only when INTEROP_TRACE is defined
#ifdef INTEROP_TRACE
#define INTEROP_LOG_TRACE(...) INTEROP_LOG_INFO(__VA_ARGS__)
#else
#define INTEROP_LOG_TRACE(...)
#endif

#if defined(NDEBUG)
#define ASSERT(assertion) ((void)0)
#define ASSERT_NOT_REACHED() ((void)0)
#else
#define ASSERT(assertion) assert(assertion);
#define ASSERT_NOT_REACHED() \
    do {                     \
        assert(false);       \
    } while (0)
#endif

#define RELEASE_ASSERT(assertion)                                                 \
    do {                                                                          \
        if (!(assertion)) {                                                       \
            INTEROP_LOG_ERROR("RELEASE_ASSERT at %s (%d)\n", __FILE__, __LINE__); \
            abort();                                                              \
        }                                                                         \
    } while (0);
#define RELEASE_ASSERT_NOT_REACHED()                                                      \
    do {                                                                                  \
        INTEROP_LOG_ERROR("RELEASE_ASSERT_NOT_REACHED at %s (%d)\n", __FILE__, __LINE__); \
        abort();                                                                          \
    } while (0)

#if !defined(UNUSED_PARAMETER)
#define UNUSED_PARAMETER(variable) (void)variable
#endif

#if !defined(UNUSED_VARIABLE)
#define UNUSED_VARIABLE(variable) UNUSED_PARAMETER(variable)
#endif

#define MAKE_STACK_ALLOCATED()                    \
    static void* operator new(size_t) = delete;   \
    static void* operator new[](size_t) = delete; \
    static void operator delete(void*) = delete;  \
    static void operator delete[](void*) = delete;

// upper bound applied to the step budget of a single flushChain call
#ifndef INTEROP_FLUSH_STEP_LIMIT
#define INTEROP_FLUSH_STEP_LIMIT 1024
#endif

// largest encoded cross-chain message accepted by the decoder
#ifndef INTEROP_MESSAGE_SIZE_LIMIT
#define INTEROP_MESSAGE_SIZE_LIMIT 1024 * 1024 * 4 // 4MB
#endif

#include <tsl/robin_set.h>
template <class Key, class Hash = std::hash<Key>,
          class KeyEqual = std::equal_to<Key>,
          class Allocator = std::allocator<Key>,
          bool StoreHash = false,
          class GrowthPolicy = tsl::rh::power_of_two_growth_policy<2>>
using HashSet = tsl::robin_set<Key, Hash, KeyEqual, Allocator, StoreHash, GrowthPolicy>;

#include <tsl/robin_map.h>
template <class Key, class T, class Hash = std::hash<Key>,
          class KeyEqual = std::equal_to<Key>,
          class Allocator = std::allocator<std::pair<Key, T>>,
          bool StoreHash = false,
          class GrowthPolicy = tsl::rh::power_of_two_growth_policy<2>>
using HashMap = tsl::robin_map<Key, T, Hash, KeyEqual, Allocator, StoreHash, GrowthPolicy>;

namespace Interop {

// principal identifier, identical for the same component on every chain
typedef uint64_t Address;
typedef uint64_t ChainId;
typedef uint64_t MessageId;
// handler reference inside a callback target
typedef uint32_t Selector;

} // namespace Interop

#include "heap/Heap.h"
#include "util/Optional.h"

#endif
