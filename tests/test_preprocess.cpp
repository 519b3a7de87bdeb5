#include "test_utils.h"
#include <cmath>

using namespace cifar10;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-4;
}

static void test_reshape_to_channel_last() {
    std::vector<int> flat(CIFAR_IMAGE_SIZE);
    for (int j = 0; j < CIFAR_IMAGE_SIZE; j++) flat[j] = j;

    ImageTensor<int> image = to_image_tensor<int>(flat);
    CHECK(image.N == 1);
    CHECK(image.H == 32 && image.W == 32 && image.C == 3);
    for (int r = 0; r < 32; r++) {
        for (int c = 0; c < 32; c++) {
            for (int ch = 0; ch < 3; ch++) {
                CHECK(image.at(0, r, c, ch) == ch * 1024 + r * 32 + c);
            }
        }
    }

    std::vector<int> ragged(CIFAR_IMAGE_SIZE + 1, 0);
    CHECK_THROWS(PreconditionError, to_image_tensor<int>(ragged));
}

static ImageTensor<float> constant_image(float r, float g, float b) {
    ImageTensor<float> t(2, 32, 32, 3);
    for (size_t i = 0; i < t.data.size(); i += 3) {
        t.data[i] = r;
        t.data[i + 1] = g;
        t.data[i + 2] = b;
    }
    return t;
}

static void test_normalizes_each_channel() {
    ImageTensor<float> images = constant_image(125.3f + 63.0f, 123.0f, 113.9f - 2 * 66.7f);
    ImageTensor<float>& out = preprocess(images);
    CHECK(&out == &images);
    CHECK(near(images.at(1, 5, 7, 0), 1.0));
    CHECK(near(images.at(1, 5, 7, 1), 0.0));
    CHECK(near(images.at(0, 31, 0, 2), -2.0));
}

static void test_twice_is_not_idempotent() {
    ImageTensor<float> once = constant_image(200.0f, 50.0f, 10.0f);
    ImageTensor<float> twice = once;
    preprocess(once);
    preprocess(preprocess(twice));
    CHECK(once.data != twice.data);
    CHECK(near(twice.at(0, 0, 0, 0), (once.at(0, 0, 0, 0) - 125.3) / 63.0));
}

static void test_copy_variant_leaves_input() {
    ImageTensor<double> images(1, 32, 32, 3);
    for (double& v : images.data) v = 128.0;
    ImageTensor<double> original = images;

    ImageTensor<double> normalized = preprocessed(images);
    CHECK(images.data == original.data);
    CHECK(near(normalized.at(0, 0, 0, 0), (128.0 - 125.3) / 63.0));
    CHECK(near(normalized.at(0, 0, 0, 2), (128.0 - 113.9) / 66.7));
}

static void test_custom_stats() {
    NormalizationStats unit = {{{0.5, 0.5, 0.5}}, {{0.25, 0.25, 0.25}}};
    ImageTensor<float> images = constant_image(1.0f, 0.5f, 0.0f);
    preprocess(images, unit);
    CHECK(near(images.at(0, 0, 0, 0), 2.0));
    CHECK(near(images.at(0, 0, 0, 1), 0.0));
    CHECK(near(images.at(0, 0, 0, 2), -2.0));

    NormalizationStats broken = {{{0.0, 0.0, 0.0}}, {{1.0, 0.0, 1.0}}};
    CHECK_THROWS(PreconditionError, preprocess(images, broken));
}

static void test_loaded_split_normalizes() {
    TempDir dir;
    write_dataset(dir, 1, 1);
    Cifar10Data<float> data = load(dir.path());
    float raw = data.train.data.at(3, 0, 0, 1);
    preprocess(data.train.data);
    CHECK(near(data.train.data.at(3, 0, 0, 1), (raw - CIFAR_CHANNEL_MEAN[1]) / CIFAR_CHANNEL_STD[1]));
}

int main() {
    run_test("reshape to channel last", test_reshape_to_channel_last);
    run_test("normalizes each channel", test_normalizes_each_channel);
    run_test("twice is not idempotent", test_twice_is_not_idempotent);
    run_test("copy variant leaves input", test_copy_variant_leaves_input);
    run_test("custom stats", test_custom_stats);
    run_test("loaded split normalizes", test_loaded_split_normalizes);
    return finish_tests();
}
