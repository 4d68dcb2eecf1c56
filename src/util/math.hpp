#pragma once

#include <cstdint>

namespace sres {

constexpr int64_t div_ceil(int64_t a, int64_t b) { return (a + b - 1) / b; }

// First index `i` in [0, size) with `i * stride + offset >= 0`.
constexpr int64_t first_inside(int64_t offset, int64_t stride) {
    return offset >= 0 ? 0 : div_ceil(-offset, stride);
}

// One past the last index `i` with `i * stride + offset < limit`, clamped to [0, size].
constexpr int64_t end_inside(int64_t offset, int64_t stride, int64_t limit, int64_t size) {
    int64_t end = limit - offset <= 0 ? 0 : div_ceil(limit - offset, stride);
    return end < size ? end : size;
}

} // namespace sres
