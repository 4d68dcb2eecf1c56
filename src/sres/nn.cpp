#include "sres/nn.hpp"
#include "util/math.hpp"
#include "util/string.hpp"

#include <algorithm>

namespace sres {

//
// conv_2d weights

conv_2d_weights conv_2d_init(conv_params const& p, tensor_data weight, std::vector<float> bias) {
    if (p.in_channels <= 0 || p.out_channels <= 0) {
        throw error<config_error>(
            "Invalid channel count for convolution: {} -> {}", p.in_channels, p.out_channels);
    }
    if (p.kernel_size <= 0 || p.kernel_size % 2 == 0) {
        throw error<config_error>("Convolution kernel size must be odd, got {}", p.kernel_size);
    }
    if (p.stride < 1 || p.padding < 0) {
        throw error<config_error>(
            "Invalid convolution stride {} or padding {}", p.stride, p.padding);
    }
    auto expected = tensor_shape{p.out_channels, p.in_channels, p.kernel_size, p.kernel_size};
    if (weight.shape != expected || !weight.data) {
        throw error<config_error>(
            "Convolution weight has shape [{}, {}, {}, {}], expected [{}, {}, {}, {}]",
            weight.shape.n, weight.shape.c, weight.shape.h, weight.shape.w, expected.n,
            expected.c, expected.h, expected.w);
    }
    if (int64_t(bias.size()) != p.out_channels) {
        throw error<config_error>(
            "Convolution bias has {} values, expected {}", bias.size(), p.out_channels);
    }
    return conv_2d_weights{p, std::move(weight), std::move(bias)};
}

tensor_shape conv_2d_output_shape(conv_params const& p, tensor_shape in) {
    int64_t h = in.h + 2 * p.padding - p.kernel_size;
    int64_t w = in.w + 2 * p.padding - p.kernel_size;
    if ((in.h > 0 && h < 0) || (in.w > 0 && w < 0)) {
        throw error<shape_error>(
            "Input {}x{} is smaller than the convolution kernel {}x{}", in.w, in.h,
            p.kernel_size, p.kernel_size);
    }
    // empty spatial dimensions stay empty
    int64_t out_h = in.h == 0 ? 0 : h / p.stride + 1;
    int64_t out_w = in.w == 0 ? 0 : w / p.stride + 1;
    return {in.n, p.out_channels, out_h, out_w};
}

//
// conv_2d forward (host)

tensor_data conv_2d(conv_2d_weights const& conv, tensor_view const& x) {
    conv_params const& p = conv.params;
    if (x.shape.c != p.in_channels) {
        throw error<shape_error>(
            "Convolution expects {} input channels, got {}", p.in_channels, x.shape.c);
    }
    tensor_shape out = conv_2d_output_shape(p, x.shape);
    tensor_data result = tensor_alloc(out);

    int64_t const k = p.kernel_size;
    int64_t const s = p.stride;
    int64_t const h = x.shape.h;
    int64_t const w = x.shape.w;
    float const* weight = conv.weight.data.get();

    for (int64_t n = 0; n < out.n; ++n) {
        for (int64_t oc = 0; oc < out.c; ++oc) {
            float* dst = result.data.get() + (n * out.c + oc) * out.h * out.w;
            std::fill_n(dst, out.h * out.w, conv.bias[oc]);

            for (int64_t ic = 0; ic < p.in_channels; ++ic) {
                float const* src = x.channel(n, ic);
                float const* kernel = weight + (oc * p.in_channels + ic) * k * k;

                for (int64_t ky = 0; ky < k; ++ky) {
                    int64_t off_y = ky - p.padding;
                    int64_t y_begin = first_inside(off_y, s);
                    int64_t y_end = end_inside(off_y, s, h, out.h);

                    for (int64_t kx = 0; kx < k; ++kx) {
                        int64_t off_x = kx - p.padding;
                        int64_t x_begin = first_inside(off_x, s);
                        int64_t x_end = end_inside(off_x, s, w, out.w);
                        float wk = kernel[ky * k + kx];

                        for (int64_t oy = y_begin; oy < y_end; ++oy) {
                            float const* row = src + (oy * s + off_y) * w;
                            float* dst_row = dst + oy * out.w;
                            for (int64_t ox = x_begin; ox < x_end; ++ox) {
                                dst_row[ox] += wk * row[ox * s + off_x];
                            }
                        }
                    }
                }
            }
        }
    }
    return result;
}

//
// conv_2d graph

void collect_weights(std::vector<named_tensor>& out, tensor_name prefix, conv_2d_weights const& c) {
    auto const& p = c.params;
    out.push_back(named_tensor{
        join(prefix, "weight"),
        extent(c.weight.shape),
        c.weight.as_f32()});
    out.push_back(named_tensor{
        join(prefix, "bias"),
        i64x4{p.out_channels, 1, 1, 1},
        span<float const>(c.bias)});
}

tensor conv_2d(model_ref const& m, tensor x, int stride, int pad) {
    tensor weight = m.weights("weight");
    x = ggml_conv_2d(m, weight, x, stride, stride, pad, pad, 1, 1);
    if (tensor bias = m.find("bias")) {
        bias = ggml_reshape_4d(m, bias, 1, 1, bias->ne[0], 1);
        x = ggml_add_inplace(m, x, bias);
    }
    return x;
}

} // namespace sres
