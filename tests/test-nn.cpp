#include "testing.hpp"
#include "sres/nn.hpp"

#include <array>
#include <numeric>

namespace sres {

tensor_data iota_tensor(tensor_shape shape, float start = 1.0f) {
    tensor_data t = tensor_alloc(shape);
    std::iota(t.data.get(), t.data.get() + n_elements(shape), start);
    return t;
}

conv_2d_weights ones_conv(conv_params const& p, float bias = 0.0f) {
    auto shape = tensor_shape{p.out_channels, p.in_channels, p.kernel_size, p.kernel_size};
    return conv_2d_init(p, tensor_alloc(shape, 1.0f), std::vector<float>(p.out_channels, bias));
}

SRES_TEST(conv_2d_box_filter) {
    conv_2d_weights conv = ones_conv(conv_params::same(1, 1, 3));
    tensor_data x = iota_tensor({1, 1, 3, 3}); // 1..9

    tensor_data result = conv_2d(conv, x);
    auto expected = tensor_from(
        {1, 1, 3, 3}, {
                          12, 21, 16, //
                          27, 45, 33, //
                          24, 39, 28  //
                      });
    CHECK_TENSORS_EQUAL(result, expected);
}

SRES_TEST(conv_2d_bias) {
    conv_2d_weights conv = ones_conv(conv_params::same(1, 2, 1), 0.5f);
    tensor_data x = tensor_from({1, 1, 1, 3}, {1, 2, 3});
    tensor_data result = conv_2d(conv, x);
    CHECK(result.shape == tensor_shape{1, 2, 1, 3});
    CHECK_TENSORS_EQUAL(result, tensor_from({1, 2, 1, 3}, {1.5f, 2.5f, 3.5f, 1.5f, 2.5f, 3.5f}));
}

SRES_TEST(conv_2d_sums_input_channels) {
    auto p = conv_params::same(2, 1, 1);
    auto weight = tensor_from({1, 2, 1, 1}, {2, -1});
    conv_2d_weights conv = conv_2d_init(p, std::move(weight), {0.25f});

    tensor_data x = tensor_from({1, 2, 1, 2}, {1, 2, 10, 20});
    tensor_data result = conv_2d(conv, x);
    CHECK_TENSORS_EQUAL(result, tensor_from({1, 1, 1, 2}, {-7.75f, -15.75f}));
}

SRES_TEST(conv_2d_zero_padding) {
    // Kernel which only sees the left neighbor
    auto p = conv_params::same(1, 1, 3);
    auto weight = tensor_from({1, 1, 3, 3}, {0, 0, 0, 1, 0, 0, 0, 0, 0});
    conv_2d_weights conv = conv_2d_init(p, std::move(weight), {0});

    tensor_data x = tensor_from({1, 1, 2, 3}, {1, 2, 3, 4, 5, 6});
    tensor_data result = conv_2d(conv, x);
    CHECK_TENSORS_EQUAL(result, tensor_from({1, 1, 2, 3}, {0, 1, 2, 0, 4, 5}));
}

SRES_TEST(conv_2d_batch) {
    conv_2d_weights conv = ones_conv(conv_params::same(1, 1, 3));
    tensor_data x = concat_channels({iota_tensor({1, 1, 3, 3}), tensor_alloc({1, 1, 3, 3}, 1.0f)});
    tensor_data batch = tensor_from({2, 1, 3, 3}, x.as_f32());

    tensor_data result = conv_2d(conv, batch);
    CHECK(result.shape == tensor_shape{2, 1, 3, 3});
    CHECK_EQUAL(at(result, 0, 0, 1, 1), 45.0f);
    CHECK_EQUAL(at(result, 1, 0, 0, 0), 4.0f);
    CHECK_EQUAL(at(result, 1, 0, 1, 1), 9.0f);
    CHECK_EQUAL(at(result, 1, 0, 2, 1), 6.0f);
}

SRES_TEST(conv_2d_stride) {
    auto p = conv_params{1, 1, 3, 2, 1};
    conv_2d_weights conv = ones_conv(p);
    tensor_data x = tensor_alloc({1, 1, 4, 4}, 1.0f);

    tensor_data result = conv_2d(conv, x);
    CHECK(result.shape == tensor_shape{1, 1, 2, 2});
    CHECK_TENSORS_EQUAL(result, tensor_from({1, 1, 2, 2}, {4, 6, 6, 9}));
}

SRES_TEST(conv_2d_output_shape) {
    CHECK(conv_2d_output_shape(conv_params::same(3, 8, 3), {1, 3, 17, 9}) ==
          tensor_shape{1, 8, 17, 9});
    CHECK(conv_2d_output_shape(conv_params::same(3, 8, 1), {2, 3, 5, 5}) ==
          tensor_shape{2, 8, 5, 5});
    CHECK(conv_2d_output_shape(conv_params{3, 8, 3, 1, 0}, {1, 3, 5, 6}) ==
          tensor_shape{1, 8, 3, 4});
    CHECK_THROWS(conv_2d_output_shape(conv_params{3, 8, 5, 1, 0}, {1, 3, 4, 4}), shape_error);
}

SRES_TEST(conv_2d_empty_input) {
    auto p = conv_params::same(2, 3, 3);
    CHECK(conv_2d_output_shape(p, {1, 2, 0, 4}) == tensor_shape{1, 3, 0, 4});
    CHECK(conv_2d_output_shape(p, {1, 2, 3, 0}) == tensor_shape{1, 3, 3, 0});
    CHECK(conv_2d_output_shape(conv_params{2, 3, 3, 2, 0}, {2, 2, 0, 0}) ==
          tensor_shape{2, 3, 0, 0});

    conv_2d_weights conv = ones_conv(p, 1.0f);
    tensor_data result = conv_2d(conv, tensor_alloc({1, 2, 0, 4}));
    CHECK(result.shape == tensor_shape{1, 3, 0, 4});
}

SRES_TEST(conv_2d_input_channel_mismatch) {
    conv_2d_weights conv = ones_conv(conv_params::same(3, 4, 3));
    tensor_data x = tensor_alloc({1, 2, 4, 4}, 0.0f);
    CHECK_THROWS(conv_2d(conv, x), shape_error);
}

SRES_TEST(conv_2d_init_validation) {
    auto p = conv_params::same(2, 4, 3);
    auto good_weight = [&] { return tensor_alloc({4, 2, 3, 3}, 0.0f); };
    auto good_bias = [] { return std::vector<float>(4, 0.0f); };

    conv_2d_weights ok = conv_2d_init(p, good_weight(), good_bias());
    CHECK(ok.params == p);

    CHECK_THROWS(conv_2d_init(p, tensor_alloc({4, 2, 1, 1}, 0.0f), good_bias()), config_error);
    CHECK_THROWS(conv_2d_init(p, tensor_alloc({2, 4, 3, 3}, 0.0f), good_bias()), config_error);
    CHECK_THROWS(conv_2d_init(p, good_weight(), std::vector<float>(3)), config_error);
    CHECK_THROWS(conv_2d_init(conv_params{2, 4, 2, 1, 0}, good_weight(), good_bias()),
                 config_error);
    CHECK_THROWS(conv_2d_init(conv_params{2, 4, 3, 0, 1}, good_weight(), good_bias()),
                 config_error);
    CHECK_THROWS(conv_2d_init(conv_params{0, 4, 3, 1, 1}, good_weight(), good_bias()),
                 config_error);
}

SRES_TEST(conv_2d_leaves_input_unchanged) {
    conv_2d_weights conv = random_conv(conv_params::same(3, 3, 3), 7);
    tensor_data x = random_tensor({1, 3, 5, 5}, 42);
    tensor_data x_copy = tensor_copy(x);

    tensor_data a = conv_2d(conv, x);
    tensor_data b = conv_2d(conv, x);
    CHECK_TENSORS_EQUAL(x, x_copy);
    CHECK_TENSORS_EQUAL(a, b);
}

SRES_TEST(conv_2d_strided_view_input) {
    conv_2d_weights conv = random_conv(conv_params::same(2, 3, 3), 3);
    tensor_data x = random_tensor({2, 4, 6, 5}, 11);
    tensor_view view = slice_channels(x, 1, 3);

    tensor_data expected = conv_2d(conv, tensor_copy(view));
    tensor_data result = conv_2d(conv, view);
    CHECK_TENSORS_EQUAL(result, expected);
}

} // namespace sres
