#pragma once

#include "sres/ml.hpp"
#include "sres/tensor.hpp"
#include "sres/util.hpp"

#include <vector>

// Common neural network building blocks

namespace sres {

//
// 2D convolution

struct conv_params {
    int in_channels = 0;
    int out_channels = 0;
    int kernel_size = 3;
    int stride = 1;
    int padding = 1;

    // Convolution with stride 1 where output width and height equal the input.
    static constexpr conv_params same(int in_channels, int out_channels, int kernel_size) {
        return {in_channels, out_channels, kernel_size, 1, (kernel_size - 1) / 2};
    }

    constexpr bool operator==(conv_params const&) const = default;
};

// Learned convolution parameters. Immutable after construction.
struct conv_2d_weights {
    conv_params params;
    tensor_data weight; // out_channels x in_channels x kernel_size x kernel_size
    std::vector<float> bias;
};

// Checks weight and bias against the declared parameters, throws config_error on mismatch.
SRES_API conv_2d_weights conv_2d_init(
    conv_params const&, tensor_data weight, std::vector<float> bias);

// Zero-padded cross-correlation plus bias, no activation.
// Throws shape_error if the input channel count does not match `in_channels`.
SRES_API tensor_data conv_2d(conv_2d_weights const&, tensor_view const& x);

SRES_API tensor_shape conv_2d_output_shape(conv_params const&, tensor_shape input);

// Appends `<prefix>.weight` and `<prefix>.bias` for upload to a backend.
SRES_API void collect_weights(
    std::vector<named_tensor>& out, tensor_name prefix, conv_2d_weights const&);

// Graph version: uses `weight` and `bias` tensors found under the model_ref prefix.
// Operates on WHCN tensors (ggml layout of NCHW data).
SRES_API tensor conv_2d(model_ref const&, tensor x, int stride = 1, int pad = 0);

} // namespace sres
