#pragma once

#include "sres/ml.hpp"
#include "sres/nn.hpp"
#include "sres/tensor.hpp"
#include "sres/util.hpp"

#include <array>
#include <functional>
#include <vector>

namespace sres {

//
// Attention gate - shape preserving transform applied at the end of a distillation block
//
// * provided by the caller, the block does not know its internals
// * `attention_graph` is the equivalent for building compute graphs

using attention_gate = std::function<tensor_data(tensor_view const&)>;
using attention_graph = tensor (*)(model_ref const&, tensor);

// Returns a gate which passes its input through unchanged.
SRES_API attention_gate identity_attention();

//
// RDB - residual dense block
//
// Five 3x3 convolutions, each one sees the block input concatenated with all previous
// outputs. The last output is scaled and added to the block input.

struct rdb_params {
    int channels = 64;
    int growth_channels = 32;

    constexpr bool operator==(rdb_params const&) const = default;
};

// Residual scale used by RDB and RRDB.
constexpr float rdb_residual_scale = 0.2f;
constexpr float rdb_negative_slope = 0.2f;

struct rdb_weights {
    rdb_params params;
    std::array<conv_2d_weights, 5> conv;
};

// Parameters of convolution `i` (0-4) of a residual dense block.
SRES_API conv_params rdb_conv_params(rdb_params const&, int i);

// Throws config_error if any convolution does not match the block configuration.
SRES_API rdb_weights rdb_init(rdb_params const&, std::array<conv_2d_weights, 5> conv);

// Throws shape_error if the input does not have `channels` channels.
SRES_API tensor_data rdb_forward(rdb_weights const&, tensor_view const& x);

//
// RRDB - residual in residual dense block
//
// Three RDB in sequence, wrapped in another scaled residual connection.

struct rrdb_weights {
    std::array<rdb_weights, 3> rdb;

    rdb_params const& params() const { return rdb[0].params; }
};

// Throws config_error if the blocks do not share the same configuration.
SRES_API rrdb_weights rrdb_init(std::array<rdb_weights, 3> rdb);

SRES_API tensor_data rrdb_forward(rrdb_weights const&, tensor_view const& x);

//
// RFDB - residual feature distillation block
//
// Three stages which each split off a distilled 1x1 branch and refine the remaining
// features with a residual 3x3 convolution. Distilled features are fused with a 1x1
// convolution and passed through the attention gate.

struct rfdb_params {
    int channels = 64;

    constexpr int distilled_channels() const { return channels / 2; }
    constexpr int remaining_channels() const { return channels; }

    // Channel count of the concatenation which feeds the fusion convolution.
    constexpr int fused_channels() const { return 4 * distilled_channels(); }
};

constexpr float rfdb_negative_slope = 0.05f;

struct rfdb_weights {
    rfdb_params params;
    std::array<conv_2d_weights, 3> distilled; // 1x1, channels -> distilled
    std::array<conv_2d_weights, 3> remaining; // 3x3, channels -> channels
    conv_2d_weights reduce;                   // 3x3, channels -> distilled
    conv_2d_weights fuse;                     // 1x1, 4 * distilled -> channels
    attention_gate attention;
};

SRES_API conv_params rfdb_distilled_params(rfdb_params const&);
SRES_API conv_params rfdb_remaining_params(rfdb_params const&);
SRES_API conv_params rfdb_reduce_params(rfdb_params const&);
SRES_API conv_params rfdb_fuse_params(rfdb_params const&);

// Throws config_error if a convolution does not match, or `attention` is empty.
SRES_API rfdb_weights rfdb_init(
    rfdb_params const&,
    std::array<conv_2d_weights, 3> distilled,
    std::array<conv_2d_weights, 3> remaining,
    conv_2d_weights reduce,
    conv_2d_weights fuse,
    attention_gate attention = identity_attention());

// Throws shape_error if the input has the wrong channel count or the gate changes the shape.
SRES_API tensor_data rfdb_forward(rfdb_weights const&, tensor_view const& x);

//
// Compute graphs
//
// Weight names follow the module layout of the reference PyTorch blocks:
// * RDB:  conv_1 .. conv_5
// * RRDB: rdb_1 .. rdb_3, each containing RDB weights
// * RFDB: conv_{1,2,3}_distilled, conv_{1,2,3}_remaining, conv_4, conv_5

SRES_API void collect_weights(std::vector<named_tensor>&, tensor_name prefix, rdb_weights const&);
SRES_API void collect_weights(std::vector<named_tensor>&, tensor_name prefix, rrdb_weights const&);
SRES_API void collect_weights(std::vector<named_tensor>&, tensor_name prefix, rfdb_weights const&);

// Reads the configuration from the shape of the first convolution's weights.
SRES_API rdb_params rdb_detect_params(model_ref const&);
SRES_API rfdb_params rfdb_detect_params(model_ref const&);

SRES_API tensor rdb(model_ref const&, tensor x);
SRES_API tensor rrdb(model_ref const&, tensor x);
SRES_API tensor rfdb(model_ref const&, tensor x, attention_graph attention = nullptr);

// Uploads the weights, builds and runs a graph for a single input. Blocks until done.
// Input validation is the same as for the host functions.
SRES_API tensor_data rdb_compute(backend_device const&, rdb_weights const&, tensor_view const& x);
SRES_API tensor_data rrdb_compute(backend_device const&, rrdb_weights const&, tensor_view const& x);
SRES_API tensor_data rfdb_compute(
    backend_device const&,
    rfdb_weights const&,
    tensor_view const& x,
    attention_graph attention = nullptr);

} // namespace sres
