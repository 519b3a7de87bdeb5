#pragma once
#include <vector>
#include <string>
#include <array>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <iostream>
#include <type_traits>
#include "config.h"
#include "tensor.hpp"

namespace cifar10 {

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

// Bad argument or directory layout, raised before any batch is read.
class PreconditionError : public std::invalid_argument {
public:
    explicit PreconditionError(const std::string& what) : std::invalid_argument(what) {}
};

class Cifar10Error : public std::runtime_error {
public:
    explicit Cifar10Error(const std::string& what) : std::runtime_error(what) {}
};

class FileNotFoundError : public Cifar10Error {
public:
    explicit FileNotFoundError(const std::string& path)
        : Cifar10Error("No such file: " + path), path_(path) {}
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class IoError : public Cifar10Error {
public:
    explicit IoError(const std::string& what) : Cifar10Error(what) {}
};

class DeserializationError : public Cifar10Error {
public:
    explicit DeserializationError(const std::string& what) : Cifar10Error(what) {}
};

// ---------------------------------------------------------------------------
// Data model
// ---------------------------------------------------------------------------

enum class BatchFormat {
    Python,   // pickled dicts: data_batch_1 .. data_batch_5, test_batch
    Binary    // 3073-byte records: data_batch_1.bin .. test_batch.bin
};

// Element type of the pixel values a batch file stores
enum class PixelType { UInt8, Int8, Int16, Int32, Int64, Float32, Float64 };

inline size_t pixel_type_size(PixelType type) {
    switch (type) {
        case PixelType::UInt8:
        case PixelType::Int8: return 1;
        case PixelType::Int16: return 2;
        case PixelType::Int32:
        case PixelType::Float32: return 4;
        case PixelType::Int64:
        case PixelType::Float64: return 8;
    }
    return 1;
}

// Flat pixel values of one element type, in host byte order
struct PixelBuffer {
    PixelType type = PixelType::UInt8;
    std::vector<uint8_t> bytes;

    size_t size() const { return bytes.size() / pixel_type_size(type); }
    bool empty() const { return bytes.empty(); }
};

// One batch file as stored on disk: channel-first rows of 3072 values.
struct RawBatch {
    PixelBuffer data;
    std::vector<int> labels;
    int num_samples = 0;
};

struct LabelSet {
    bool one_hot = true;
    std::vector<int> indices;   // used when !one_hot
    OneHotMatrix matrix;        // used when one_hot

    size_t size() const {
        return one_hot ? static_cast<size_t>(matrix.rows) : indices.size();
    }

    int label_at(size_t i) const {
        return one_hot ? matrix.hot_index(static_cast<int>(i)) : indices[i];
    }
};

template <typename T>
struct DatasetSplit {
    ImageTensor<T> data;
    LabelSet labels;

    int num_samples() const { return data.N; }
};

template <typename T>
struct Cifar10Data {
    DatasetSplit<T> train;
    DatasetSplit<T> valid;
    DatasetSplit<T> test;
};

struct LoadOptions {
    double valid_ratio = 0.0;   // fraction of the training batches held out
    bool one_hot = true;
    bool shuffle = false;
    BatchFormat format = BatchFormat::Python;
    int num_classes = CIFAR_NUM_CLASSES;   // 0 infers the width per batch instead
    unsigned seed = 0;                     // 0 seeds from std::random_device
    bool verbose = false;
};

struct NormalizationStats {
    std::array<double, CIFAR_IMAGE_CHANNELS> mean;
    std::array<double, CIFAR_IMAGE_CHANNELS> stddev;
};

constexpr NormalizationStats CIFAR10_STATS = {CIFAR_CHANNEL_MEAN, CIFAR_CHANNEL_STD};

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

// Integer labels in [0, num_classes) to an N x num_classes matrix.
// num_classes < 0 infers max(labels) + 1. Note that load() passes a fixed
// width of LoadOptions::num_classes (10) unless that option is set to 0.
OneHotMatrix one_hotify(const std::vector<int>& labels, int num_classes = -1);

// Reads one batch file. A ".bin" suffix selects the binary record layout,
// anything else is decoded as a pickled dict with "data" and "labels".
// Pickled data may be a numeric ndarray (u1, i1, i2, i4, i8, f4, f8) or a
// list of numbers; the values keep their stored type.
RawBatch read_batch(const std::string& path);

// Class names from batches.meta (Python) or batches.meta.txt (Binary).
std::vector<std::string> read_label_names(const std::string& data_dir,
                                          BatchFormat format = BatchFormat::Python);

namespace detail {

// Training batches stacked in file order 1..5. Batches of different pixel
// types are widened to Float64.
struct TrainingRows {
    PixelBuffer rows;
    LabelSet labels;
    size_t num_samples = 0;
};

void check_options(const std::string& data_dir, const LoadOptions& options);
std::string train_batch_path(const std::string& data_dir, int index, BatchFormat format);
std::string test_batch_path(const std::string& data_dir, BatchFormat format);
size_t count_train_batches(const std::string& data_dir, BatchFormat format);

TrainingRows read_training_rows(const std::string& data_dir, const LoadOptions& options);
LabelSet encode_labels(const std::vector<int>& labels, bool one_hot, int num_classes);
LabelSet take_labels(const LabelSet& labels, const std::vector<size_t>& order,
                     size_t begin, size_t end);
std::vector<size_t> sample_order(size_t n, bool shuffle, unsigned seed);
size_t split_index(size_t n, double valid_ratio);

double pixel_value(const PixelBuffer& pixels, size_t i);

template <typename Src, typename T>
void write_typed_image(const uint8_t* bytes, T* hwc) {
    std::vector<Src> chw(CIFAR_IMAGE_SIZE);
    std::memcpy(chw.data(), bytes, CIFAR_IMAGE_SIZE * sizeof(Src));
    write_channel_last(chw.data(), hwc);
}

// Image `index` of pixels, cast to T and reordered to (32, 32, 3)
template <typename T>
void write_image(const PixelBuffer& pixels, size_t index, T* hwc) {
    const uint8_t* bytes = pixels.bytes.data() + index * CIFAR_IMAGE_SIZE * pixel_type_size(pixels.type);
    switch (pixels.type) {
        case PixelType::UInt8: write_channel_last(bytes, hwc); break;
        case PixelType::Int8: write_typed_image<int8_t>(bytes, hwc); break;
        case PixelType::Int16: write_typed_image<int16_t>(bytes, hwc); break;
        case PixelType::Int32: write_typed_image<int32_t>(bytes, hwc); break;
        case PixelType::Int64: write_typed_image<int64_t>(bytes, hwc); break;
        case PixelType::Float32: write_typed_image<float>(bytes, hwc); break;
        case PixelType::Float64: write_typed_image<double>(bytes, hwc); break;
    }
}

template <typename T>
ImageTensor<T> take_images(const PixelBuffer& rows, const std::vector<size_t>& order,
                           size_t begin, size_t end) {
    ImageTensor<T> out(static_cast<int>(end - begin), CIFAR_IMAGE_HEIGHT,
                       CIFAR_IMAGE_WIDTH, CIFAR_IMAGE_CHANNELS);
    for (size_t i = begin; i < end; i++) {
        write_image(rows, order[i], out.data.data() + (i - begin) * CIFAR_IMAGE_SIZE);
    }
    return out;
}

} // namespace detail

// Flat channel-first rows (length multiple of 3072) to an (N, 32, 32, 3) tensor.
template <typename T, typename Src>
ImageTensor<T> to_image_tensor(const std::vector<Src>& flat) {
    if (flat.size() % CIFAR_IMAGE_SIZE != 0) {
        throw PreconditionError("Flat image data is not a multiple of " +
                                std::to_string(CIFAR_IMAGE_SIZE) + " values");
    }
    int n = static_cast<int>(flat.size() / CIFAR_IMAGE_SIZE);
    ImageTensor<T> out(n, CIFAR_IMAGE_HEIGHT, CIFAR_IMAGE_WIDTH, CIFAR_IMAGE_CHANNELS);
    for (int i = 0; i < n; i++) {
        write_channel_last(flat.data() + static_cast<size_t>(i) * CIFAR_IMAGE_SIZE,
                           out.data.data() + static_cast<size_t>(i) * CIFAR_IMAGE_SIZE);
    }
    return out;
}

// Batch pixels of any stored type to an (N, 32, 32, 3) tensor of T.
template <typename T>
ImageTensor<T> to_image_tensor(const PixelBuffer& pixels) {
    if (pixels.size() % CIFAR_IMAGE_SIZE != 0) {
        throw PreconditionError("Flat image data is not a multiple of " +
                                std::to_string(CIFAR_IMAGE_SIZE) + " values");
    }
    int n = static_cast<int>(pixels.size() / CIFAR_IMAGE_SIZE);
    ImageTensor<T> out(n, CIFAR_IMAGE_HEIGHT, CIFAR_IMAGE_WIDTH, CIFAR_IMAGE_CHANNELS);
    for (int i = 0; i < n; i++) {
        detail::write_image(pixels, static_cast<size_t>(i),
                            out.data.data() + static_cast<size_t>(i) * CIFAR_IMAGE_SIZE);
    }
    return out;
}

// Loads the five training batches and the test batch from data_dir.
// T is the element type of the returned image tensors. One-hot labels are
// options.num_classes (10) wide by default rather than inferred from each
// batch; set num_classes to 0 for per-batch inference.
template <typename T = float>
Cifar10Data<T> load(const std::string& data_dir, const LoadOptions& options = LoadOptions()) {
    detail::check_options(data_dir, options);

    detail::TrainingRows training = detail::read_training_rows(data_dir, options);
    size_t n = training.num_samples;
    std::vector<size_t> order = detail::sample_order(n, options.shuffle, options.seed);
    size_t m = detail::split_index(n, options.valid_ratio);

    Cifar10Data<T> result;
    result.train.data = detail::take_images<T>(training.rows, order, 0, m);
    result.train.labels = detail::take_labels(training.labels, order, 0, m);
    result.valid.data = detail::take_images<T>(training.rows, order, m, n);
    result.valid.labels = detail::take_labels(training.labels, order, m, n);

    RawBatch test = read_batch(detail::test_batch_path(data_dir, options.format));
    result.test.data = to_image_tensor<T>(test.data);
    result.test.labels = detail::encode_labels(test.labels, options.one_hot, options.num_classes);

    if (options.verbose) {
        std::cout << "[cifar10] Loaded " << n << " training images (" << m << " train, "
                  << (n - m) << " valid), " << test.num_samples << " test images from "
                  << data_dir << "\n";
    }
    return result;
}

// Normalizes every channel in place: x = (x - mean[c]) / std[c].
// Returns the same tensor; a second call normalizes again.
template <typename T>
ImageTensor<T>& preprocess(ImageTensor<T>& images, const NormalizationStats& stats = CIFAR10_STATS) {
    static_assert(std::is_floating_point<T>::value,
                  "preprocess needs a floating-point image tensor");
    if (images.C != CIFAR_IMAGE_CHANNELS) {
        throw PreconditionError("preprocess expects " + std::to_string(CIFAR_IMAGE_CHANNELS) +
                                " channels, got " + std::to_string(images.C));
    }
    for (int c = 0; c < CIFAR_IMAGE_CHANNELS; c++) {
        if (stats.stddev[c] == 0.0) {
            throw PreconditionError("Channel " + std::to_string(c) + " has a zero std");
        }
    }

    for (size_t i = 0; i < images.data.size(); i++) {
        int c = static_cast<int>(i % CIFAR_IMAGE_CHANNELS);
        images.data[i] = static_cast<T>((images.data[i] - stats.mean[c]) / stats.stddev[c]);
    }
    return images;
}

// Copying variant of preprocess; the input is left untouched.
template <typename T>
ImageTensor<T> preprocessed(const ImageTensor<T>& images, const NormalizationStats& stats = CIFAR10_STATS) {
    ImageTensor<T> copy = images;
    preprocess(copy, stats);
    return copy;
}

} // namespace cifar10
