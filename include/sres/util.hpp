#pragma once

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>

#ifdef _MSC_VER
#    ifdef SRES_API_EXPORT
#        define SRES_API __declspec(dllexport)
#    else
#        define SRES_API __declspec(dllimport)
#    endif
#else
#    define SRES_API __attribute__((visibility("default")))
#endif

namespace sres {

//
// Fixed string - fixed length, does not allocate, truncates if too long

template <size_t N>
struct fixed_string {
    char data[N] = {0};
    size_t length = 0;

    constexpr fixed_string() {}

    fixed_string(char const* str) {
        auto view = std::string_view(str);
        length = std::min(view.size(), N - 1);
        std::copy(view.begin(), view.begin() + length, data);
    }

    template <size_t M>
    constexpr fixed_string(char const (&str)[M]) {
        static_assert(M <= N, "String literal is too long for fixed_string");
        length = M - 1;
        std::copy(str, str + length, data);
    }

    char const* c_str() const { return data; }

    std::string_view view() const { return {data, length}; }

    explicit operator bool() const { return length > 0; }
};

//
// Exception types used in the library
//
// * shape_error: operands have incompatible shapes (caller bug, never retried)
// * config_error: weights do not match the declared block configuration

struct exception : std::exception {
    fixed_string<128> message;

    explicit exception(char const* msg) : message(msg) {}
    explicit exception(fixed_string<128> msg) : message(msg) {}

    char const* what() const noexcept override { return message.c_str(); }
};

struct shape_error : exception {
    using exception::exception;
};

struct config_error : exception {
    using exception::exception;
};

//
// Simple vector type (fixed-size array)

template <typename T>
struct vec4 {
    using value_type = T;
    static constexpr int dim = 4;

    T v[4];

    constexpr vec4() : v{0, 0, 0, 0} {}
    constexpr vec4(T x, T y, T z, T w) : v{x, y, z, w} {}
    constexpr vec4(T x) : v{x, x, x, x} {}

    constexpr T& operator[](size_t i) { return v[i]; }
    constexpr T const& operator[](size_t i) const { return v[i]; }

    constexpr auto operator<=>(vec4 const&) const = default;
};

using i64x4 = vec4<int64_t>;

} // namespace sres
