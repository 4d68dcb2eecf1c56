#include "sres/tensor.hpp"
#include "util/string.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <vector>

namespace sres {

//
// tensor view

tensor_view::tensor_view(tensor_shape shape, float const* data)
    : shape(shape), batch_stride(shape.c * shape.h * shape.w), data(data) {}

tensor_view::tensor_view(tensor_data const& t) : tensor_view(t.shape, t.data.get()) {}

float const* tensor_view::channel(int64_t n, int64_t c) const {
    return data + n * batch_stride + c * shape.h * shape.w;
}

//
// tensor data

tensor_data tensor_alloc(tensor_shape shape) {
    ASSERT(shape.n >= 0 && shape.c >= 0 && shape.h >= 0 && shape.w >= 0);
    return tensor_data{shape, std::unique_ptr<float[]>(new float[n_elements(shape)])};
}

tensor_data tensor_alloc(tensor_shape shape, float value) {
    tensor_data result = tensor_alloc(shape);
    std::fill_n(result.data.get(), n_elements(shape), value);
    return result;
}

tensor_data tensor_from(tensor_shape shape, span<float const> values) {
    if (int64_t(values.size()) != n_elements(shape)) {
        throw error<config_error>(
            "Expected {} values for tensor [{}, {}, {}, {}], got {}", n_elements(shape), shape.n,
            shape.c, shape.h, shape.w, values.size());
    }
    tensor_data result = tensor_alloc(shape);
    std::copy(values.begin(), values.end(), result.data.get());
    return result;
}

tensor_data tensor_from(tensor_shape shape, std::initializer_list<float> values) {
    return tensor_from(shape, span(values.begin(), values.size()));
}

tensor_data tensor_copy(tensor_view const& src) {
    tensor_data result = tensor_alloc(src.shape);
    int64_t plane = src.plane_size();
    for (int64_t n = 0; n < src.shape.n; ++n) {
        std::copy_n(src.channel(n, 0), plane, result.data.get() + n * plane);
    }
    return result;
}

float at(tensor_view const& t, int64_t n, int64_t c, int64_t y, int64_t x) {
    auto [sn, sc, sh, sw] = t.shape;
    if (n < 0 || n >= sn || c < 0 || c >= sc || y < 0 || y >= sh || x < 0 || x >= sw) {
        throw error<shape_error>(
            "Index [{}, {}, {}, {}] out of range for tensor [{}, {}, {}, {}]", n, c, y, x, sn, sc,
            sh, sw);
    }
    return t.channel(n, c)[y * sw + x];
}

tensor_view slice_channels(tensor_view const& t, int64_t begin, int64_t end) {
    if (begin < 0 || end > t.shape.c || begin >= end) {
        throw error<shape_error>(
            "Invalid channel range [{}, {}) for tensor with {} channels", begin, end, t.shape.c);
    }
    tensor_view result = t;
    result.shape.c = end - begin;
    result.data = t.channel(0, begin);
    return result;
}

//
// elementwise operations

void check_same_shape(tensor_view const& a, tensor_view const& b, char const* op) {
    if (a.shape != b.shape) {
        throw error<shape_error>(
            "Shape mismatch in {}: [{}, {}, {}, {}] vs [{}, {}, {}, {}]", op, a.shape.n,
            a.shape.c, a.shape.h, a.shape.w, b.shape.n, b.shape.c, b.shape.h, b.shape.w);
    }
}

tensor_data concat_channels(span<tensor_view const> src) {
    if (src.empty()) {
        throw error<shape_error>("Nothing to concatenate");
    }
    tensor_shape shape = src[0].shape;
    shape.c = 0;
    for (tensor_view const& t : src) {
        if (t.shape.n != shape.n || t.shape.h != shape.h || t.shape.w != shape.w) {
            throw error<shape_error>(
                "Shape mismatch in concat: [{}, _, {}, {}] vs [{}, _, {}, {}]", shape.n, shape.h,
                shape.w, t.shape.n, t.shape.h, t.shape.w);
        }
        shape.c += t.shape.c;
    }

    tensor_data result = tensor_alloc(shape);
    float* dst = result.data.get();
    for (int64_t n = 0; n < shape.n; ++n) {
        for (tensor_view const& t : src) {
            int64_t plane = t.plane_size();
            dst = std::copy_n(t.channel(n, 0), plane, dst);
        }
    }
    return result;
}

tensor_data concat_channels(std::initializer_list<tensor_view> src) {
    return concat_channels(span(src.begin(), src.size()));
}

// Applies `f` to all elements of `a` (and `b`), writing the result to `dst`.
// Views may be strided, `dst` is always contiguous and may alias `a`.
template <typename F>
void for_each_element(tensor_view const& a, float* dst, F&& f) {
    int64_t plane = a.plane_size();
    for (int64_t n = 0; n < a.shape.n; ++n) {
        float const* src = a.channel(n, 0);
        std::transform(src, src + plane, dst + n * plane, f);
    }
}

template <typename F>
void for_each_element(tensor_view const& a, tensor_view const& b, float* dst, F&& f) {
    int64_t plane = a.plane_size();
    for (int64_t n = 0; n < a.shape.n; ++n) {
        float const* src_a = a.channel(n, 0);
        float const* src_b = b.channel(n, 0);
        std::transform(src_a, src_a + plane, src_b, dst + n * plane, f);
    }
}

tensor_data add(tensor_view const& a, tensor_view const& b) {
    check_same_shape(a, b, "add");
    tensor_data result = tensor_alloc(a.shape);
    for_each_element(a, b, result.data.get(), std::plus<float>());
    return result;
}

tensor_data add(tensor_data&& a, tensor_view const& b) {
    check_same_shape(a, b, "add");
    tensor_data result = std::move(a);
    for_each_element(result, b, result.data.get(), std::plus<float>());
    return result;
}

tensor_data scale(tensor_view const& a, float k) {
    tensor_data result = tensor_alloc(a.shape);
    for_each_element(a, result.data.get(), [k](float x) { return x * k; });
    return result;
}

tensor_data scale(tensor_data&& a, float k) {
    tensor_data result = std::move(a);
    for_each_element(result, result.data.get(), [k](float x) { return x * k; });
    return result;
}

tensor_data leaky_relu(tensor_view const& a, float negative_slope) {
    tensor_data result = tensor_alloc(a.shape);
    for_each_element(a, result.data.get(), [=](float x) {
        return x >= 0 ? x : negative_slope * x;
    });
    return result;
}

tensor_data leaky_relu(tensor_data&& a, float negative_slope) {
    tensor_data result = std::move(a);
    for_each_element(result, result.data.get(), [=](float x) {
        return x >= 0 ? x : negative_slope * x;
    });
    return result;
}

//
// comparison

float max_difference(tensor_view const& a, tensor_view const& b) {
    check_same_shape(a, b, "max_difference");
    float result = 0;
    int64_t plane = a.plane_size();
    for (int64_t n = 0; n < a.shape.n; ++n) {
        float const* pa = a.channel(n, 0);
        float const* pb = b.channel(n, 0);
        for (int64_t i = 0; i < plane; ++i) {
            float d = std::abs(pa[i] - pb[i]);
            if (std::isnan(d)) {
                return std::numeric_limits<float>::infinity();
            }
            result = std::max(result, d);
        }
    }
    return result;
}

float rms_difference(tensor_view const& a, tensor_view const& b) {
    check_same_shape(a, b, "rms_difference");
    int64_t count = n_elements(a.shape);
    if (count == 0) {
        return 0;
    }
    double sum = 0;
    int64_t plane = a.plane_size();
    for (int64_t n = 0; n < a.shape.n; ++n) {
        float const* pa = a.channel(n, 0);
        float const* pb = b.channel(n, 0);
        for (int64_t i = 0; i < plane; ++i) {
            double d = double(pa[i]) - double(pb[i]);
            sum += d * d;
        }
    }
    return float(std::sqrt(sum / double(count)));
}

} // namespace sres
