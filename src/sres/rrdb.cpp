#include "sres/blocks.hpp"
#include "graph.hpp"
#include "util/string.hpp"

namespace sres {

//
// RDB

conv_params rdb_conv_params(rdb_params const& p, int i) {
    ASSERT(i >= 0 && i < 5);
    int in_channels = p.channels + i * p.growth_channels;
    int out_channels = i < 4 ? p.growth_channels : p.channels;
    return conv_params::same(in_channels, out_channels, 3);
}

rdb_weights rdb_init(rdb_params const& p, std::array<conv_2d_weights, 5> conv) {
    if (p.channels <= 0 || p.growth_channels <= 0) {
        throw error<config_error>(
            "Invalid RDB configuration: {} channels, {} growth channels", p.channels,
            p.growth_channels);
    }
    for (int i = 0; i < 5; ++i) {
        conv_params expected = rdb_conv_params(p, i);
        conv_params const& actual = conv[i].params;
        if (actual != expected) {
            throw error<config_error>(
                "RDB conv_{} is {} -> {} (kernel {}, padding {}), expected {} -> {} (kernel 3)",
                i + 1, actual.in_channels, actual.out_channels, actual.kernel_size,
                actual.padding, expected.in_channels, expected.out_channels);
        }
    }
    return rdb_weights{p, std::move(conv)};
}

tensor_data rdb_forward(rdb_weights const& w, tensor_view const& x) {
    check_input_channels("RDB", w.params.channels, x);
    float const slope = rdb_negative_slope;

    tensor_data x1 = leaky_relu(conv_2d(w.conv[0], x), slope);
    tensor_data c1 = concat_channels({x, x1});
    tensor_data x2 = leaky_relu(conv_2d(w.conv[1], c1), slope);
    tensor_data c2 = concat_channels({c1, x2});
    tensor_data x3 = leaky_relu(conv_2d(w.conv[2], c2), slope);
    tensor_data c3 = concat_channels({c2, x3});
    tensor_data x4 = leaky_relu(conv_2d(w.conv[3], c3), slope);
    tensor_data c4 = concat_channels({c3, x4});
    tensor_data x5 = conv_2d(w.conv[4], c4);
    return add(scale(std::move(x5), rdb_residual_scale), x);
}

//
// RRDB

rrdb_weights rrdb_init(std::array<rdb_weights, 3> rdb) {
    for (int i = 1; i < 3; ++i) {
        if (rdb[i].params != rdb[0].params) {
            throw error<config_error>(
                "RRDB rdb_{} has {}/{} channels, rdb_1 has {}/{}", i + 1, rdb[i].params.channels,
                rdb[i].params.growth_channels, rdb[0].params.channels,
                rdb[0].params.growth_channels);
        }
    }
    return rrdb_weights{std::move(rdb)};
}

tensor_data rrdb_forward(rrdb_weights const& w, tensor_view const& x) {
    check_input_channels("RRDB", w.params().channels, x);

    tensor_data out = rdb_forward(w.rdb[0], x);
    out = rdb_forward(w.rdb[1], out);
    out = rdb_forward(w.rdb[2], out);
    return add(scale(std::move(out), rdb_residual_scale), x);
}

//
// Compute graph

char const* const rdb_conv_names[] = {"conv_1", "conv_2", "conv_3", "conv_4", "conv_5"};
char const* const rrdb_names[] = {"rdb_1", "rdb_2", "rdb_3"};

void collect_weights(std::vector<named_tensor>& out, tensor_name prefix, rdb_weights const& w) {
    for (int i = 0; i < 5; ++i) {
        collect_weights(out, join(prefix, rdb_conv_names[i]), w.conv[i]);
    }
}

void collect_weights(std::vector<named_tensor>& out, tensor_name prefix, rrdb_weights const& w) {
    for (int i = 0; i < 3; ++i) {
        collect_weights(out, join(prefix, rrdb_names[i]), w.rdb[i]);
    }
}

rdb_params rdb_detect_params(model_ref const& m) {
    tensor weight = m["conv_1"].weights("weight"); // [3, 3, channels, growth]
    rdb_params p;
    p.channels = int(weight->ne[2]);
    p.growth_channels = int(weight->ne[3]);
    if (weight->ne[0] != 3 || weight->ne[1] != 3) {
        throw error<config_error>(
            "Unsupported RDB kernel size {}x{}", weight->ne[0], weight->ne[1]);
    }
    return p;
}

tensor conv_block(model_ref const& m, tensor x) {
    x = conv_2d(m, x, 1, 1);
    x = ggml_leaky_relu(m, x, rdb_negative_slope, true);
    return x;
}

tensor rdb(model_ref const& m, tensor x) {
    tensor x1 = conv_block(m["conv_1"], x);
    tensor c1 = concat(m, {x, x1}, 2);
    tensor x2 = conv_block(m["conv_2"], c1);
    tensor c2 = concat(m, {c1, x2}, 2);
    tensor x3 = conv_block(m["conv_3"], c2);
    tensor c3 = concat(m, {c2, x3}, 2);
    tensor x4 = conv_block(m["conv_4"], c3);
    tensor c4 = concat(m, {c3, x4}, 2);
    tensor x5 = conv_2d(m["conv_5"], c4, 1, 1);
    x5 = ggml_scale_inplace(m, x5, rdb_residual_scale);
    x = ggml_add(m, x, x5);
    return named(m, x);
}

tensor rrdb(model_ref const& m, tensor x) {
    tensor x_in = x;
    x = rdb(m["rdb_1"], x);
    x = rdb(m["rdb_2"], x);
    x = rdb(m["rdb_3"], x);
    x = ggml_scale_inplace(m, x, rdb_residual_scale);
    x = ggml_add(m, x, x_in);
    return named(m, x);
}

tensor_data rdb_compute(backend_device const& b, rdb_weights const& w, tensor_view const& x) {
    check_input_channels("RDB", w.params.channels, x);

    std::vector<named_tensor> weights;
    collect_weights(weights, {}, w);
    return compute_block(b, weights, x, [](model_ref const& m, tensor input) {
        return rdb(m, input);
    });
}

tensor_data rrdb_compute(backend_device const& b, rrdb_weights const& w, tensor_view const& x) {
    check_input_channels("RRDB", w.params().channels, x);

    std::vector<named_tensor> weights;
    collect_weights(weights, {}, w);
    return compute_block(b, weights, x, [](model_ref const& m, tensor input) {
        return rrdb(m, input);
    });
}

} // namespace sres
