#include "testing.hpp"

#include <random>

namespace sres {

//
// Fixtures

tensor_data random_tensor(tensor_shape shape, uint32_t seed, float scale) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-scale, scale);
    tensor_data result = tensor_alloc(shape);
    for (float& v : result.as_f32()) {
        v = dist(rng);
    }
    return result;
}

conv_2d_weights random_conv(conv_params const& p, uint32_t seed, float scale) {
    auto shape = tensor_shape{p.out_channels, p.in_channels, p.kernel_size, p.kernel_size};
    tensor_data weight = random_tensor(shape, seed, scale);
    tensor_data bias = random_tensor({1, p.out_channels, 1, 1}, seed + 1000, scale);
    auto b = bias.as_f32();
    return conv_2d_init(p, std::move(weight), std::vector<float>(b.begin(), b.end()));
}

conv_2d_weights center_conv(conv_params const& p, float center, float bias) {
    int k = p.kernel_size;
    auto shape = tensor_shape{p.out_channels, p.in_channels, k, k};
    tensor_data weight = tensor_alloc(shape, 0.0f);
    for (int64_t i = 0; i < int64_t(p.out_channels) * p.in_channels; ++i) {
        weight.data[i * k * k + (k / 2) * k + k / 2] = center;
    }
    return conv_2d_init(p, std::move(weight), std::vector<float>(p.out_channels, bias));
}

} // namespace sres
