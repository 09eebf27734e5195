/**
 * @file shared.hxx
 * @brief Common includes, macros, and shared namespace for the CXXGATE.
 */

#ifndef CXXGATE_SHARED_HXX
#define CXXGATE_SHARED_HXX

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <coroutine>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <regex>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/url.hpp>

#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <boost/system/system_error.hpp>

#include <boost/unordered_map.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <boost/filesystem.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <boost/lexical_cast.hpp>

#if defined(_WIN32)
#include <stdlib.h>
#endif // _WIN32

#ifdef __MSVC_COMPILER__
/** @brief Forces function inlining. */
#define CXXGATE_INLINE __forceinline

/** @brief Prevents function inlining. */
#define CXXGATE_NOINLINE __declspec(noinline)
#elif __CLANG_COMPILER__ || __GCC_COMPILER__ || __INTEL_COMPILER__
/** @brief Forces function inlining. */
#define CXXGATE_INLINE __attribute__((always_inline)) inline

/** @brief Prevents function inlining. */
#define CXXGATE_NOINLINE __attribute__((noinline))
#else
/** @brief Forces function inlining. */
#define CXXGATE_INLINE inline

/** @brief Prevents function inlining. */
#define CXXGATE_NOINLINE
#endif // ...

#include <nlohmann/json.hpp>

#ifdef CXXGATE_USE_LOGGING_IMPL
#include "logging/logging.hxx"
#endif // CXXGATE_USE_LOGGING_IMPL

#include "json_traits/json_traits.hxx"

/**
 * @namespace shared
 * @brief Contains shared types, utilities, and configuration used across the CXXGATE.
 *
 * This namespace is intended for common components that are reused by multiple modules,
 * such as logging, JSON handling, and platform-specific macros.
 */
namespace shared {
    // ...
}

#endif // CXXGATE_SHARED_HXX
