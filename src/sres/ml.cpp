#include "sres/ml.hpp"
#include "util/string.hpp"

#include <ggml-cpu.h>

#include <algorithm>
#include <array>
#include <thread>
#include <vector>

namespace sres {

//
// backend

backend_device backend_init() {
    backend_device b{ggml_backend_ptr(ggml_backend_cpu_init())};
    if (!b.handle) {
        throw error("Failed to initialize CPU backend");
    }
    int nthreads = std::max(1, (int)std::thread::hardware_concurrency() - 2);
    backend_set_n_threads(b, nthreads);
    return b;
}

void backend_set_n_threads(backend_device& b, int n_threads) {
    ASSERT(n_threads > 0);
    ggml_backend_cpu_set_n_threads(b.handle.get(), n_threads);
}

//
// model_weights

model_weights model_init(size_t n_tensors) {
    ggml_init_params params{};
    params.mem_size = n_tensors * ggml_tensor_overhead();
    params.no_alloc = true;
    ggml_context_ptr ctx(ggml_init(params));
    if (!ctx) {
        throw error("Failed to create weights context for {} tensors", n_tensors);
    }
    return model_weights{std::move(ctx), {}};
}

bool model_allocate(model_weights& m, backend_device const& b) {
    ggml_backend_buffer_ptr buffer(ggml_backend_alloc_ctx_tensors(m.context.get(), b));
    if (!buffer) {
        return false; // context contains nothing to allocate
    }
    m.weights_buffer = std::move(buffer);
    return true;
}

model_weights model_upload(backend_device const& b, span<named_tensor const> weights) {
    model_weights m = model_init(weights.size());

    std::vector<tensor> created;
    created.reserve(weights.size());
    for (named_tensor const& w : weights) {
        auto [ne0, ne1, ne2, ne3] = w.ne.v;
        if (ne0 * ne1 * ne2 * ne3 != int64_t(w.data.size())) {
            throw error(
                "Weight {} has {} values, expected {}", w.name.c_str(), w.data.size(),
                ne0 * ne1 * ne2 * ne3);
        }
        tensor t = ggml_new_tensor_4d(m, GGML_TYPE_F32, ne0, ne1, ne2, ne3);
        ggml_set_name(t, w.name.c_str());
        created.push_back(t);
    }
    if (!weights.empty() && !model_allocate(m, b)) {
        throw error("Failed to allocate backend buffer for {} weights", weights.size());
    }
    for (size_t i = 0; i < weights.size(); ++i) {
        transfer_to_backend(created[i], weights[i].data);
    }
    return m;
}

//
// compute_graph

compute_graph compute_graph_init(size_t size) {
    ggml_init_params graph_ctx_params{};
    graph_ctx_params.mem_size =
        size * ggml_tensor_overhead() + ggml_graph_overhead_custom(size, false);
    graph_ctx_params.no_alloc = true;
    ggml_context* ctx = ggml_init(graph_ctx_params);
    ggml_context_ptr ctx_ptr(ctx);
    ggml_cgraph* graph = ggml_new_graph_custom(ctx, size, false);
    return compute_graph{std::move(ctx_ptr), graph, nullptr};
}

void compute_graph_allocate(compute_graph& g, backend_device const& backend) {
    if (!g.allocr) {
        g.allocr.reset(ggml_gallocr_new(ggml_backend_get_default_buffer_type(backend)));
    }
    if (!ggml_gallocr_alloc_graph(g.allocr.get(), g.graph)) {
        throw error("Failed to allocate buffer for graph");
    }
}

void compute(compute_graph const& g, backend_device const& b) {
    if (ggml_backend_graph_compute(b, g.graph) != GGML_STATUS_SUCCESS) {
        throw error("Graph computation failed");
    }
}

//
// model_ref

model_ref::model_ref(model_weights& m)
    : weights_context(m.context.get()), graph_context(m.context.get()), graph(nullptr) {}

model_ref::model_ref(model_weights& m, compute_graph& g)
    : weights_context(m.context.get()), graph_context(g.context.get()), graph(g.graph) {}

model_ref::model_ref(
    ggml_context* weights_context,
    ggml_context* graph_context,
    ggml_cgraph* graph,
    tensor_name prefix)
    : weights_context(weights_context),
      graph_context(graph_context ? graph_context : weights_context),
      graph(graph),
      prefix(prefix) {}

tensor model_ref::find(char const* name) const {
    auto full_name = tensor_name();
    if (prefix) {
        name = format(full_name, "{}.{}", prefix.c_str(), name);
    }
    return ggml_get_tensor(weights_context, name);
}

tensor model_ref::weights(char const* name) const {
    if (tensor result = find(name)) {
        return result;
    }
    if (prefix) {
        throw error("tensor not found: {}.{}", prefix.view(), name);
    }
    throw error("tensor not found: {}", name);
}

model_ref model_ref::with_prefix(tensor_name new_prefix) const {
    return model_ref{weights_context, graph_context, graph, new_prefix};
}

model_ref model_ref::operator[](char const* sub_module) const {
    return with_prefix(join(prefix, sub_module));
}

tensor_name join(tensor_name const& prefix, char const* name) {
    if (prefix) {
        return format<tensor_name>("{}.{}", prefix.view(), name);
    }
    return tensor_name(name);
}

tensor named(model_ref const& m, tensor tensor) {
    ggml_set_name(tensor, m.prefix.c_str());
    return tensor;
}

//
// tensor creation and data handling

tensor compute_graph_input(model_ref const& m, tensor_shape shape, tensor_name name) {
    auto [w, h, c, n] = extent(shape).v;
    tensor x = ggml_new_tensor_4d(m, GGML_TYPE_F32, w, h, c, n);
    ggml_set_name(x, name.c_str());
    ggml_set_input(x);
    return x;
}

tensor compute_graph_output(model_ref const& m, tensor x, tensor_name name) {
    ggml_set_name(x, name.c_str());
    ggml_set_output(x);
    ggml_build_forward_expand(m.graph, x);
    return x;
}

void transfer_to_backend(tensor x, tensor_view const& data) {
    ASSERT(shape_of(x) == data.shape);
    if (data.is_contiguous()) {
        transfer_to_backend(x, span(data.data, size_t(n_elements(data.shape))));
        return;
    }
    size_t plane_bytes = data.plane_size() * sizeof(float);
    for (int64_t n = 0; n < data.shape.n; ++n) {
        ggml_backend_tensor_set(x, data.channel(n, 0), n * plane_bytes, plane_bytes);
    }
}

void transfer_to_backend(tensor x, span<float const> data) {
    ASSERT(ggml_nbytes(x) == data.size_bytes());
    ggml_backend_tensor_set(x, data.data(), 0, ggml_nbytes(x));
}

tensor_data transfer_from_backend(tensor x) {
    ASSERT(x->type == GGML_TYPE_F32);
    tensor_data result = tensor_alloc(shape_of(x));
    ggml_backend_tensor_get(x, result.data.get(), 0, ggml_nbytes(x));
    return result;
}

//
// tensor operations

tensor concat(model_ref const& m, std::initializer_list<tensor> src, int dim) {
    ASSERT(src.size() > 0);
    auto it = src.begin();
    tensor x = *it;
    for (++it; it != src.end(); ++it) {
        x = ggml_concat(m, x, *it, dim);
    }
    return x;
}

} // namespace sres
