#pragma once

#include "sres/util.hpp"

#include <initializer_list>
#include <memory>
#include <span>

namespace sres {
using std::span;
struct tensor_data;

//
// Tensor shape - batch, channels, height, width (row-major NCHW)

struct tensor_shape {
    int64_t n = 0;
    int64_t c = 0;
    int64_t h = 0;
    int64_t w = 0;

    constexpr bool operator==(tensor_shape const&) const = default;
};

constexpr int64_t n_elements(tensor_shape const& s) {
    return s.n * s.c * s.h * s.w;
}

// Extent in the order used by ggml tensors: width, height, channels, batch
constexpr i64x4 extent(tensor_shape const& s) {
    return {s.w, s.h, s.c, s.n};
}

//
// Tensor view - read-only, non-owning reference to tensor data
//
// * channel planes of one batch entry are contiguous
// * `batch_stride` is the distance in elements between batch entries, it is larger than
//   c*h*w for views which only select a range of channels

struct SRES_API tensor_view {
    tensor_shape shape;
    int64_t batch_stride = 0;
    float const* data = nullptr;

    tensor_view() = default;
    tensor_view(tensor_data const&);
    tensor_view(tensor_shape shape, float const* data);

    bool is_contiguous() const { return shape.n <= 1 || batch_stride == plane_size(); }

    int64_t plane_size() const { return shape.c * shape.h * shape.w; }

    // Pointer to the first element of channel `c` in batch entry `n`
    float const* channel(int64_t n, int64_t c) const;
};

//
// Tensor data - storage for a dense float tensor
//
// * owns its buffer exclusively, move only
// * can be passed to functions that expect tensor_view

struct tensor_data {
    tensor_shape shape;
    std::unique_ptr<float[]> data;

    span<float> as_f32() { return {data.get(), size_t(n_elements(shape))}; }
    span<float const> as_f32() const { return {data.get(), size_t(n_elements(shape))}; }
};

// Allocate tensor data. Elements are not initialized.
SRES_API tensor_data tensor_alloc(tensor_shape shape);

// Allocate tensor data with all elements set to `value`.
SRES_API tensor_data tensor_alloc(tensor_shape shape, float value);

// Copy values into a new tensor. Throws config_error if the element count does not match.
SRES_API tensor_data tensor_from(tensor_shape shape, span<float const> values);
SRES_API tensor_data tensor_from(tensor_shape shape, std::initializer_list<float> values);

// Copy a (possibly strided) view into a new contiguous tensor.
SRES_API tensor_data tensor_copy(tensor_view const& src);

// Shape-checked element access. Throws shape_error if an index is out of range.
SRES_API float at(tensor_view const&, int64_t n, int64_t c, int64_t y, int64_t x);

// Select channels [begin, end) without copying. Throws shape_error for invalid ranges.
SRES_API tensor_view slice_channels(tensor_view const&, int64_t begin, int64_t end);

//
// Elementwise operations
//
// All operations return a freshly allocated tensor and never modify their inputs.
// Overloads taking `tensor_data&&` treat the argument as exclusively owned and reuse
// its buffer for the result. The returned values are identical.

// Concatenate along the channel axis, in argument order.
// Throws shape_error if batch, height or width differ, or if `src` is empty.
SRES_API tensor_data concat_channels(span<tensor_view const> src);
SRES_API tensor_data concat_channels(std::initializer_list<tensor_view> src);

// Elementwise sum. Throws shape_error if shapes are not identical (no broadcasting).
SRES_API tensor_data add(tensor_view const& a, tensor_view const& b);
SRES_API tensor_data add(tensor_data&& a, tensor_view const& b);

// Elementwise multiplication with a scalar.
SRES_API tensor_data scale(tensor_view const& a, float k);
SRES_API tensor_data scale(tensor_data&& a, float k);

// `x >= 0 ? x : negative_slope * x`
SRES_API tensor_data leaky_relu(tensor_view const& a, float negative_slope);
SRES_API tensor_data leaky_relu(tensor_data&& a, float negative_slope);

//
// Comparison

// Largest absolute difference between two tensors of identical shape.
SRES_API float max_difference(tensor_view const& a, tensor_view const& b);

// Root-mean-square difference between two tensors of identical shape.
SRES_API float rms_difference(tensor_view const& a, tensor_view const& b);

} // namespace sres
