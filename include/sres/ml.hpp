#pragma once

#include "sres/tensor.hpp"
#include "sres/util.hpp"

#include <ggml-alloc.h>
#include <ggml-backend.h>
#include <ggml-cpp.h>
#include <ggml.h>

#include <array>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <span>
#include <vector>

namespace sres {
using tensor_name = fixed_string<GGML_MAX_NAME>;
using tensor = ggml_tensor*;

//
// Backend device
//
// * only the ggml CPU backend is used, device selection is left to the caller's runtime

struct backend_device {
    ggml_backend_ptr handle;

    operator ggml_backend_t() const { return handle.get(); }
};

// Initializes the CPU backend with `hardware_concurrency - 2` threads (at least 1).
SRES_API backend_device backend_init();

SRES_API void backend_set_n_threads(backend_device&, int n_threads);

//
// Model weights
//
// * stores block weights in a ggml context
// * allocates and transfers tensor data to backend buffers

struct model_weights {
    ggml_context_ptr context;
    ggml_backend_buffer_ptr weights_buffer;

    operator ggml_context*() const { return context.get(); }
};

// Creates a GGML context with storage for a fixed number of tensors.
// Does not allocate any backend buffers.
SRES_API model_weights model_init(size_t n_tensors);

// Allocates backend buffers for the model weights. Does not transfer data.
// Returns false and does nothing if there are no tensors to allocate.
SRES_API bool model_allocate(model_weights&, backend_device const&);

// Host data for a named weight tensor, waiting to be uploaded to a backend.
struct named_tensor {
    tensor_name name;
    i64x4 ne; // ggml extent: innermost dimension first
    span<float const> data;
};

// Creates weight tensors for all entries, allocates a backend buffer and copies the data.
SRES_API model_weights model_upload(backend_device const&, span<named_tensor const> weights);

//
// Compute graph - wrapper for ggml_cgraph and its associated backend memory

struct compute_graph {
    ggml_context_ptr context;
    ggml_cgraph* graph = nullptr;
    ggml_gallocr_ptr allocr;

    explicit operator bool() const { return context && graph; }
};

// Initializes a compute graph and associated backend allocator.
SRES_API compute_graph compute_graph_init(size_t size = GGML_DEFAULT_GRAPH_SIZE);

// Allocates memory for inputs, outputs and computations on the backend.
SRES_API void compute_graph_allocate(compute_graph&, backend_device const&);

// Runs inference. Blocks until done.
SRES_API void compute(compute_graph const&, backend_device const&);

//
// Model ref - represents a block and its weights while building a graph
//
// * allows access to the weights by name, with an optional name prefix
//   to support nested blocks (eg. "rdb_2.conv_3.weight")
// * pass anywhere ggml_context* is expected while building the graph

struct SRES_API model_ref {
    ggml_context* weights_context = nullptr;
    ggml_context* graph_context = nullptr;
    ggml_cgraph* graph = nullptr;
    tensor_name prefix;

    model_ref() = default;
    model_ref(model_weights& m);
    model_ref(model_weights& m, compute_graph& g);

    explicit model_ref(
        ggml_context* weights_context,
        ggml_context* graph_context = nullptr,
        ggml_cgraph* graph = nullptr,
        tensor_name prefix = {});

    // Find weights tensor by name, prepends the current prefix.
    tensor find(char const* name) const;    // returns null if not found
    tensor weights(char const* name) const; // throws if not found

    model_ref with_prefix(tensor_name new_prefix) const;

    // Returns a model_ref with prefix set to <current prefix>.<sub_module>
    model_ref operator[](char const* sub_module) const;

    operator ggml_context*() const { return graph_context; }
};

// Returns `<prefix>.<name>`, or `name` if the prefix is empty.
SRES_API tensor_name join(tensor_name const& prefix, char const* name);

// Sets the name of a tensor to the current model prefix.
SRES_API tensor named(model_ref const&, tensor);

// Creates a new tensor as part of the model graph where input data can be stored.
SRES_API tensor compute_graph_input(model_ref const&, tensor_shape, tensor_name = "input");

// Marks a tensor as an output of the compute graph.
SRES_API tensor compute_graph_output(model_ref const&, tensor, tensor_name = "output");

// Returns the shape of a 4D tensor created from or compatible with tensor_shape.
inline tensor_shape shape_of(tensor t) {
    return {t->ne[3], t->ne[2], t->ne[1], t->ne[0]};
}

//
// Tensor data transfer to backend device

// Copies data to the tensor's backend buffer (which should already be allocated).
// The view is copied batch by batch if it is not contiguous.
SRES_API void transfer_to_backend(tensor x, tensor_view const& data);
SRES_API void transfer_to_backend(tensor x, span<float const> data);

// Copies tensor data from the backend buffer to main memory.
SRES_API tensor_data transfer_from_backend(tensor x);

//
// Tensor operations

// Concatenate tensors along a dimension (2 = channels for WHCN tensors).
SRES_API tensor concat(model_ref const&, std::initializer_list<tensor> src, int dim);

} // namespace sres
