#include "sres/blocks.hpp"
#include "graph.hpp"
#include "util/string.hpp"

namespace sres {

attention_gate identity_attention() {
    return [](tensor_view const& x) { return tensor_copy(x); };
}

//
// RFDB

conv_params rfdb_distilled_params(rfdb_params const& p) {
    return conv_params::same(p.remaining_channels(), p.distilled_channels(), 1);
}

conv_params rfdb_remaining_params(rfdb_params const& p) {
    return conv_params::same(p.remaining_channels(), p.remaining_channels(), 3);
}

conv_params rfdb_reduce_params(rfdb_params const& p) {
    return conv_params::same(p.remaining_channels(), p.distilled_channels(), 3);
}

conv_params rfdb_fuse_params(rfdb_params const& p) {
    return conv_params::same(p.fused_channels(), p.channels, 1);
}

void check_conv(char const* name, conv_2d_weights const& conv, conv_params const& expected) {
    conv_params const& actual = conv.params;
    if (actual != expected) {
        throw error<config_error>(
            "RFDB {} is {} -> {} (kernel {}), expected {} -> {} (kernel {})", name,
            actual.in_channels, actual.out_channels, actual.kernel_size, expected.in_channels,
            expected.out_channels, expected.kernel_size);
    }
}

char const* const rfdb_distilled_names[] = {
    "conv_1_distilled", "conv_2_distilled", "conv_3_distilled"};
char const* const rfdb_remaining_names[] = {
    "conv_1_remaining", "conv_2_remaining", "conv_3_remaining"};

rfdb_weights rfdb_init(
    rfdb_params const& p,
    std::array<conv_2d_weights, 3> distilled,
    std::array<conv_2d_weights, 3> remaining,
    conv_2d_weights reduce,
    conv_2d_weights fuse,
    attention_gate attention) {

    if (p.distilled_channels() < 1) {
        throw error<config_error>("RFDB needs at least 2 channels, got {}", p.channels);
    }
    for (int i = 0; i < 3; ++i) {
        check_conv(rfdb_distilled_names[i], distilled[i], rfdb_distilled_params(p));
        check_conv(rfdb_remaining_names[i], remaining[i], rfdb_remaining_params(p));
    }
    check_conv("conv_4", reduce, rfdb_reduce_params(p));
    check_conv("conv_5", fuse, rfdb_fuse_params(p));
    if (!attention) {
        throw error<config_error>("RFDB requires an attention gate");
    }
    return rfdb_weights{
        p,
        std::move(distilled),
        std::move(remaining),
        std::move(reduce),
        std::move(fuse),
        std::move(attention)};
}

void check_attention(rfdb_weights const& w) {
    if (!w.attention) {
        throw error<config_error>("RFDB requires an attention gate");
    }
}

tensor_data apply_attention(rfdb_weights const& w, tensor_data const& fused) {
    tensor_data result = w.attention(fused);
    if (result.shape != fused.shape) {
        throw error<shape_error>(
            "Attention gate changed shape from [{}, {}, {}, {}] to [{}, {}, {}, {}]",
            fused.shape.n, fused.shape.c, fused.shape.h, fused.shape.w, result.shape.n,
            result.shape.c, result.shape.h, result.shape.w);
    }
    return result;
}

tensor_data rfdb_forward(rfdb_weights const& w, tensor_view const& x) {
    check_input_channels("RFDB", w.params.channels, x);
    check_attention(w);
    float const slope = rfdb_negative_slope;

    tensor_data d1 = leaky_relu(conv_2d(w.distilled[0], x), slope);
    tensor_data r1 = leaky_relu(add(conv_2d(w.remaining[0], x), x), slope);

    tensor_data d2 = leaky_relu(conv_2d(w.distilled[1], r1), slope);
    tensor_data r2 = leaky_relu(add(conv_2d(w.remaining[1], r1), r1), slope);

    tensor_data d3 = leaky_relu(conv_2d(w.distilled[2], r2), slope);
    tensor_data r3 = leaky_relu(add(conv_2d(w.remaining[2], r2), r2), slope);

    tensor_data r4 = leaky_relu(conv_2d(w.reduce, r3), slope);

    tensor_data out = concat_channels({d1, d2, d3, r4});
    ASSERT(out.shape.c == w.params.fused_channels());
    out = conv_2d(w.fuse, out);
    return apply_attention(w, out);
}

//
// Compute graph

void collect_weights(std::vector<named_tensor>& out, tensor_name prefix, rfdb_weights const& w) {
    for (int i = 0; i < 3; ++i) {
        collect_weights(out, join(prefix, rfdb_distilled_names[i]), w.distilled[i]);
        collect_weights(out, join(prefix, rfdb_remaining_names[i]), w.remaining[i]);
    }
    collect_weights(out, join(prefix, "conv_4"), w.reduce);
    collect_weights(out, join(prefix, "conv_5"), w.fuse);
}

rfdb_params rfdb_detect_params(model_ref const& m) {
    tensor weight = m["conv_1_remaining"].weights("weight"); // [3, 3, channels, channels]
    if (weight->ne[2] != weight->ne[3]) {
        throw error<config_error>(
            "RFDB conv_1_remaining must keep the channel count, got {} -> {}", weight->ne[2],
            weight->ne[3]);
    }
    rfdb_params p;
    p.channels = int(weight->ne[3]);
    return p;
}

tensor distill(model_ref const& m, tensor x) {
    x = conv_2d(m, x, 1, 0);
    return ggml_leaky_relu(m, x, rfdb_negative_slope, true);
}

tensor refine(model_ref const& m, tensor x) {
    tensor out = conv_2d(m, x, 1, 1);
    out = ggml_add(m, out, x);
    return ggml_leaky_relu(m, out, rfdb_negative_slope, true);
}

tensor rfdb(model_ref const& m, tensor x, attention_graph attention) {
    tensor d1 = distill(m["conv_1_distilled"], x);
    tensor r1 = refine(m["conv_1_remaining"], x);

    tensor d2 = distill(m["conv_2_distilled"], r1);
    tensor r2 = refine(m["conv_2_remaining"], r1);

    tensor d3 = distill(m["conv_3_distilled"], r2);
    tensor r3 = refine(m["conv_3_remaining"], r2);

    tensor r4 = conv_2d(m["conv_4"], r3, 1, 1);
    r4 = ggml_leaky_relu(m, r4, rfdb_negative_slope, true);

    x = concat(m, {d1, d2, d3, r4}, 2);
    x = conv_2d(m["conv_5"], x, 1, 0);
    if (attention) {
        x = attention(m, x);
    }
    return named(m, x);
}

tensor_data rfdb_compute(
    backend_device const& b, rfdb_weights const& w, tensor_view const& x, attention_graph gate) {

    check_input_channels("RFDB", w.params.channels, x);
    if (!gate) {
        check_attention(w);
    }

    std::vector<named_tensor> weights;
    collect_weights(weights, {}, w);
    tensor_data result = compute_block(b, weights, x, [gate](model_ref const& m, tensor input) {
        return rfdb(m, input, gate);
    });
    // without a graph gate the host gate runs on the read back output
    return gate ? std::move(result) : apply_attention(w, result);
}

} // namespace sres
