#pragma once

#include "sres/ml.hpp"
#include "sres/tensor.hpp"
#include "util/string.hpp"

#include <span>
#include <vector>

namespace sres {

inline void check_input_channels(char const* block, int64_t expected, tensor_view const& x) {
    if (x.shape.c != expected) {
        throw error<shape_error>(
            "{} expects {} input channels, got {}", block, expected, x.shape.c);
    }
}

// Uploads `weights`, builds a graph with `build(model_ref, input)`, runs it for `x` and
// returns the output. Weights and graph are released afterwards.
template <typename Build>
tensor_data compute_block(
    backend_device const& backend,
    std::span<named_tensor const> weights,
    tensor_view const& x,
    Build&& build) {

    model_weights model = model_upload(backend, weights);
    compute_graph graph = compute_graph_init();
    model_ref m(model, graph);

    tensor input = compute_graph_input(m, x.shape);
    tensor output = compute_graph_output(m, build(m, input));

    compute_graph_allocate(graph, backend);
    transfer_to_backend(input, x);
    compute(graph, backend);
    return transfer_from_backend(output);
}

} // namespace sres
