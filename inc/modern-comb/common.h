// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_COMB_COMMON_H_INCLUDED
#define HEADER_MODERN_COMB_COMMON_H_INCLUDED

// Config macros:
//
// The following macros must be defined identically when using and building this library:
//
// MCOMB_USE_EXCEPTIONS - auto-detected. Set to 1 to force usage of exceptions and 0 to force not using them
// MCOMB_SHARED - set to 1 when using/building a shared library version of the library
//
// The following macro should be set when building the library itself but not when using it:
//
// MCOMB_BUILDING_MCOMB - set 1 if building the library itself.
//
// The following macro may be set by the user to require fmt support:
//
// MCOMB_USE_FMT - fail compilation if <fmt/format.h> has not been included before this header

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cstdio>

#include <concepts>
#include <compare>
#include <type_traits>
#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <optional>
#include <limits>
#include <chrono>
#include <istream>
#include <ostream>
#include <iterator>

#if !defined(MCOMB_USE_EXCEPTIONS)
    #if defined(__GNUC__) && !defined(__EXCEPTIONS)
        #define MCOMB_USE_EXCEPTIONS 0
    #elif defined(__clang__) && !defined(__cpp_exceptions)
        #define MCOMB_USE_EXCEPTIONS 0
    #elif defined(_MSC_VER) && !_HAS_EXCEPTIONS
        #define MCOMB_USE_EXCEPTIONS 0
    #else
        #define MCOMB_USE_EXCEPTIONS 1
    #endif
#endif

#if MCOMB_SHARED
    #if defined(_WIN32) || defined(_WIN64)
        #if MCOMB_BUILDING_MCOMB
            #define MCOMB_EXPORTED __declspec(dllexport)
        #else
            #define MCOMB_EXPORTED __declspec(dllimport)
        #endif
    #elif defined(__GNUC__)
        #define MCOMB_EXPORTED [[gnu::visibility("default")]]
    #else
        #define MCOMB_EXPORTED
    #endif
#else
    #define MCOMB_EXPORTED
#endif

//libc++ does not set __cpp_lib_format until it is complete so we check its version too
#if (__cpp_lib_format >= 201907L || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000)) && __has_include(<format>)

    #define MCOMB_SUPPORTS_STD_FORMAT 1

#endif

#if defined(FMT_VERSION) && FMT_VERSION >= 60000 && defined(FMT_THROW)

    #define MCOMB_SUPPORTS_FMT_FORMAT 1

#endif

#if MCOMB_USE_FMT && !MCOMB_SUPPORTS_FMT_FORMAT

    #error "MCOMB_USE_FMT is requested but fmt library (of version >= 6.0) is not detected. Did you forget to include <fmt/format.h> before this header?"

#endif

#if MCOMB_SUPPORTS_STD_FORMAT
    #include <format>
#endif

namespace mcomb
{
    namespace impl {
        template<class T, size_t Extent>
        std::true_type is_span_helper(std::span<T, Extent> * x);

        std::false_type is_span_helper(...);

        template<class T>
        constexpr bool is_span = decltype(is_span_helper((T *)nullptr))::value;

        template<class T>
        concept byte_like = std::is_standard_layout_v<T> &&
                            sizeof(T) == sizeof(uint8_t) &&
        requires {
            static_cast<T>(uint8_t{});
            static_cast<uint8_t>(T{});
        };

        static_assert(byte_like<char>);
        static_assert(byte_like<unsigned char>);
        static_assert(byte_like<signed char>);
        static_assert(byte_like<std::byte>);

        template<class T>
        concept char_like = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                            std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

        //Deliberately not defined. Calling it from a consteval context makes compilation fail
        void invalid_constexpr_call(const char *);

        #if MCOMB_USE_EXCEPTIONS
            #define MCOMB_THROW(x) throw x
        #else
            [[noreturn]] inline void fail(const char* message) {
                fprintf(stderr, "mcomb: fatal error: %s", message);
                abort();
            }
            #define MCOMB_THROW(x) ::mcomb::impl::fail((x).what())
        #endif

        template<std::same_as<size_t> S>
        constexpr size_t hash_combine(S prev, S next) {
            constexpr auto digits = std::numeric_limits<S>::digits;
            static_assert(digits == 64 || digits == 32);

            if constexpr (digits == 64) {
                S x = prev + 0x9e3779b9 + next;
                const S m = 0xe9846af9b1a615d;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 28;
                return x;
            } else {
                S x = prev + 0x9e3779b9 + next;
                const S m1 = 0x21f0aaad;
                const S m2 = 0x735a2d97;
                x ^= x >> 16;
                x *= m1;
                x ^= x >> 15;
                x *= m2;
                x ^= x >> 15;
                return x;
            }
        }

        /// Reads a big-endian unsigned integer from bytes
        template<impl::byte_like Byte, std::unsigned_integral T>
        constexpr const Byte * read_bytes(const Byte * bytes, T & val) noexcept {
            T tmp = uint8_t(*bytes++);
            for(unsigned i = 0; i < sizeof(T) - 1; ++i)
                tmp = T(T(tmp << 8) | uint8_t(*bytes++));
            val = tmp;
            return bytes;
        }

        /// Writes an unsigned integer into bytes, most significant byte first
        template<impl::byte_like Byte, std::unsigned_integral T>
        constexpr Byte * write_bytes(T val, Byte * bytes) noexcept {
            for(size_t i = sizeof(T); i != 0; --i) {
                bytes[i - 1] = Byte(static_cast<uint8_t>(val));
                if constexpr (sizeof(T) > 1)
                    val >>= 8;
            }
            return bytes + sizeof(T);
        }

        template<char_like C>
        constexpr uint8_t hex_digit_value(C c) noexcept {
            if (c >= C('0') && c <= C('9'))
                return uint8_t(c - C('0'));
            if (c >= C('a') && c <= C('f'))
                return uint8_t(c - C('a') + 10);
            if (c >= C('A') && c <= C('F'))
                return uint8_t(c - C('A') + 10);
            return 16;
        }

        template<char_like C>
        constexpr C hex_digit(uint8_t val, bool uppercase) noexcept {
            constexpr const char digits[] = "0123456789abcdef0123456789ABCDEF";
            return C(digits[val + (uppercase ? 16 : 0)]);
        }
    }
}

#endif
