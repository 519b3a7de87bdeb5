#include "cifar10_loader.h"

#include <fstream>
#include <iostream>
#include <algorithm>
#include <numeric>
#include <random>
#include <cerrno>
#include <cstring>
#include <cmath>

#include <glob.h>
#include <sys/stat.h>

namespace cifar10 {
namespace detail {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

// Owns the result of ::glob for the lifetime of the lookup
struct GlobResult {
    glob_t g;

    GlobResult() { std::memset(&g, 0, sizeof(g)); }
    ~GlobResult() { globfree(&g); }

    GlobResult(const GlobResult&) = delete;
    GlobResult& operator=(const GlobResult&) = delete;
};

bool host_is_little_endian() {
    uint16_t one = 1;
    uint8_t first = 0;
    std::memcpy(&first, &one, 1);
    return first == 1;
}

template <typename V>
void put_value(PixelBuffer& out, size_t i, V v) {
    std::memcpy(out.bytes.data() + i * sizeof(V), &v, sizeof(V));
}

int to_label(double v, const std::string& path) {
    if (!(v >= 0.0 && v <= 255.0) || v != std::floor(v)) {
        throw DeserializationError(path + ": labels must be integers in [0, 255]");
    }
    return static_cast<int>(v);
}

int to_label(const pickle::Value& v, const std::string& path) {
    if (v.kind != pickle::Kind::Int || v.integer < 0 || v.integer > 255) {
        throw DeserializationError(path + ": labels must be integers in [0, 255]");
    }
    return static_cast<int>(v.integer);
}

// Python numbers stored as bytes when every value fits, else int64 or float64
PixelBuffer sequence_pixels(const pickle::Value& seq, const std::string& path) {
    bool all_bytes = true;
    bool all_ints = true;
    for (const auto& item : seq.items) {
        if (item->kind == pickle::Kind::Int) {
            if (item->integer < 0 || item->integer > 255) all_bytes = false;
        } else if (item->kind == pickle::Kind::Float) {
            all_bytes = false;
            all_ints = false;
        } else if (item->kind != pickle::Kind::Bool) {
            throw DeserializationError(path + ": data values must be numbers, got " +
                                       pickle::kind_name(item->kind));
        }
    }

    PixelBuffer out;
    out.type = all_bytes ? PixelType::UInt8 : (all_ints ? PixelType::Int64 : PixelType::Float64);
    out.bytes.resize(seq.items.size() * pixel_type_size(out.type));
    for (size_t i = 0; i < seq.items.size(); i++) {
        const pickle::Value& item = *seq.items[i];
        int64_t whole = item.kind == pickle::Kind::Bool ? (item.boolean ? 1 : 0) : item.integer;
        switch (out.type) {
            case PixelType::UInt8: put_value(out, i, static_cast<uint8_t>(whole)); break;
            case PixelType::Int64: put_value(out, i, whole); break;
            default:
                put_value(out, i, item.kind == pickle::Kind::Float ? item.real : static_cast<double>(whole));
                break;
        }
    }
    return out;
}

// NumPy type string such as "u1", "<f4" or ">i2"
bool parse_dtype(std::string code, char order, PixelType& type, bool& swap) {
    if (!code.empty() && std::strchr("<>|=", code[0])) {
        order = code[0];
        code.erase(0, 1);
    }
    if (code == "u1") type = PixelType::UInt8;
    else if (code == "i1") type = PixelType::Int8;
    else if (code == "i2") type = PixelType::Int16;
    else if (code == "i4") type = PixelType::Int32;
    else if (code == "i8") type = PixelType::Int64;
    else if (code == "f4") type = PixelType::Float32;
    else if (code == "f8") type = PixelType::Float64;
    else return false;

    bool little = host_is_little_endian();
    swap = pixel_type_size(type) > 1 && ((order == '>' && little) || (order == '<' && !little));
    return true;
}

} // namespace

std::vector<uint8_t> read_file_bytes(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            throw FileNotFoundError(path);
        }
        throw IoError("Cannot access " + path + ": " + std::strerror(errno));
    }
    if (S_ISDIR(st.st_mode)) {
        throw IoError("Is a directory: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot open " + path + ": " + std::strerror(errno));
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(st.st_size));
    if (!bytes.empty() && !file.read(reinterpret_cast<char*>(bytes.data()), bytes.size())) {
        throw IoError("Failed to read " + path);
    }
    return bytes;
}

bool has_binary_suffix(const std::string& path) {
    return ends_with(path, CIFAR_BINARY_SUFFIX);
}

RawBatch parse_binary_batch(const std::vector<uint8_t>& bytes, const std::string& path) {
    if (bytes.size() % CIFAR_RECORD_SIZE != 0) {
        throw DeserializationError(path + ": size " + std::to_string(bytes.size()) +
                                   " is not a multiple of the " +
                                   std::to_string(CIFAR_RECORD_SIZE) + "-byte record");
    }

    RawBatch batch;
    batch.num_samples = static_cast<int>(bytes.size() / CIFAR_RECORD_SIZE);
    batch.data.type = PixelType::UInt8;
    batch.data.bytes.resize(static_cast<size_t>(batch.num_samples) * CIFAR_IMAGE_SIZE);
    batch.labels.resize(batch.num_samples);

    for (int i = 0; i < batch.num_samples; i++) {
        const uint8_t* record = bytes.data() + static_cast<size_t>(i) * CIFAR_RECORD_SIZE;
        batch.labels[i] = record[0];
        std::copy(record + 1, record + CIFAR_RECORD_SIZE,
                  batch.data.bytes.begin() + static_cast<size_t>(i) * CIFAR_IMAGE_SIZE);
    }
    return batch;
}

bool ndarray_pixels(const pickle::Value& value, PixelBuffer& out,
                    std::vector<int64_t>& shape, const std::string& path) {
    if (!ends_with(value.callable_name(), "multiarray._reconstruct")) {
        return false;
    }

    // __setstate__ tuple: ([version,] shape, dtype, is_fortran, raw)
    const pickle::Value* state = value.state.get();
    if (!state || state->kind != pickle::Kind::Tuple ||
        (state->items.size() != 4 && state->items.size() != 5)) {
        throw DeserializationError(path + ": ndarray has no usable state");
    }
    size_t base = state->items.size() == 5 ? 1 : 0;
    const pickle::Value& dims = *state->items[base];
    const pickle::Value& dtype = *state->items[base + 1];
    const pickle::Value& fortran = *state->items[base + 2];
    const pickle::Value& raw = *state->items[base + 3];

    if (!dims.is_sequence()) {
        throw DeserializationError(path + ": ndarray shape is not a tuple");
    }
    shape.clear();
    int64_t count = 1;
    for (const auto& d : dims.items) {
        if (d->kind != pickle::Kind::Int || d->integer < 0 || d->integer > (int64_t(1) << 40)) {
            throw DeserializationError(path + ": bad ndarray dimension");
        }
        shape.push_back(d->integer);
        count *= d->integer;
        if (count > (int64_t(1) << 40)) {
            throw DeserializationError(path + ": ndarray is too large");
        }
    }

    // numpy.dtype('f4', False, True) with BUILD state (3, '<', ...)
    std::string type_code;
    if (ends_with(dtype.callable_name(), "dtype") && dtype.args && !dtype.args->items.empty() &&
        dtype.args->items[0]->is_text()) {
        type_code = dtype.args->items[0]->text;
    }
    char order = '|';
    if (dtype.state && dtype.state->kind == pickle::Kind::Tuple && dtype.state->items.size() > 1 &&
        dtype.state->items[1]->is_text() && dtype.state->items[1]->text.size() == 1) {
        order = dtype.state->items[1]->text[0];
    }
    PixelType type = PixelType::UInt8;
    bool swap = false;
    if (!parse_dtype(type_code, order, type, swap)) {
        throw DeserializationError(path + ": unsupported ndarray dtype '" + type_code + "'");
    }
    if (fortran.kind == pickle::Kind::Bool && fortran.boolean && shape.size() > 1) {
        throw DeserializationError(path + ": Fortran-ordered ndarrays are not supported");
    }
    if (!raw.is_text()) {
        throw DeserializationError(path + ": ndarray payload is a " + pickle::kind_name(raw.kind));
    }
    size_t width = pixel_type_size(type);
    if (static_cast<uint64_t>(raw.text.size()) != static_cast<uint64_t>(count) * width) {
        throw DeserializationError(path + ": ndarray payload holds " + std::to_string(raw.text.size()) +
                                   " bytes, shape needs " + std::to_string(count * width));
    }

    out.type = type;
    out.bytes.assign(raw.text.begin(), raw.text.end());
    if (swap) {
        for (size_t i = 0; i < out.bytes.size(); i += width) {
            std::reverse(out.bytes.begin() + i, out.bytes.begin() + i + width);
        }
    }
    return true;
}

RawBatch parse_pickled_batch(const pickle::Value& root, const std::string& path) {
    if (root.kind != pickle::Kind::Dict) {
        throw DeserializationError(path + ": expected a pickled dict, got " +
                                   pickle::kind_name(root.kind));
    }
    const pickle::Value* data = pickle::dict_get(root, "data");
    const pickle::Value* labels = pickle::dict_get(root, "labels");
    if (!data || !labels) {
        throw DeserializationError(path + ": batch dict needs 'data' and 'labels' keys");
    }

    RawBatch batch;
    std::vector<int64_t> shape;
    if (ndarray_pixels(*data, batch.data, shape, path)) {
        bool rows_ok = (shape.size() == 2 && shape[1] == CIFAR_IMAGE_SIZE) ||
                       (shape.size() == 1 && shape[0] % CIFAR_IMAGE_SIZE == 0);
        if (!rows_ok) {
            throw DeserializationError(path + ": data rows must hold " +
                                       std::to_string(CIFAR_IMAGE_SIZE) + " values");
        }
    } else if (data->is_sequence()) {
        batch.data = sequence_pixels(*data, path);
        if (batch.data.size() % CIFAR_IMAGE_SIZE != 0) {
            throw DeserializationError(path + ": data length is not a multiple of " +
                                       std::to_string(CIFAR_IMAGE_SIZE));
        }
    } else {
        throw DeserializationError(path + ": unsupported 'data' value of type " +
                                   pickle::kind_name(data->kind));
    }
    batch.num_samples = static_cast<int>(batch.data.size() / CIFAR_IMAGE_SIZE);

    PixelBuffer label_values;
    if (ndarray_pixels(*labels, label_values, shape, path)) {
        batch.labels.reserve(label_values.size());
        for (size_t i = 0; i < label_values.size(); i++) {
            batch.labels.push_back(to_label(pixel_value(label_values, i), path));
        }
    } else if (labels->is_sequence()) {
        batch.labels.reserve(labels->items.size());
        for (const auto& item : labels->items) {
            batch.labels.push_back(to_label(*item, path));
        }
    } else {
        throw DeserializationError(path + ": unsupported 'labels' value of type " +
                                   pickle::kind_name(labels->kind));
    }

    if (static_cast<int>(batch.labels.size()) != batch.num_samples) {
        throw DeserializationError(path + ": " + std::to_string(batch.num_samples) + " images but " +
                                   std::to_string(batch.labels.size()) + " labels");
    }
    return batch;
}

std::string train_batch_path(const std::string& data_dir, int index, BatchFormat format) {
    std::string name = CIFAR_TRAIN_BATCH_PREFIX + std::to_string(index);
    if (format == BatchFormat::Binary) name += CIFAR_BINARY_SUFFIX;
    return join_path(data_dir, name);
}

std::string test_batch_path(const std::string& data_dir, BatchFormat format) {
    std::string name = CIFAR_TEST_BATCH_NAME;
    if (format == BatchFormat::Binary) name += CIFAR_BINARY_SUFFIX;
    return join_path(data_dir, name);
}

size_t count_train_batches(const std::string& data_dir, BatchFormat format) {
    std::string pattern = join_path(data_dir, std::string(CIFAR_TRAIN_BATCH_PREFIX) + "*");
    if (format == BatchFormat::Binary) pattern += CIFAR_BINARY_SUFFIX;

    GlobResult result;
    int rc = ::glob(pattern.c_str(), 0, nullptr, &result.g);
    if (rc == GLOB_NOMATCH) return 0;
    if (rc != 0) {
        throw IoError("Cannot list " + pattern);
    }
    return result.g.gl_pathc;
}

void check_options(const std::string& data_dir, const LoadOptions& options) {
    if (!(options.valid_ratio >= 0.0 && options.valid_ratio < 1.0)) {
        throw PreconditionError("valid_ratio must be in [0, 1), got " +
                                std::to_string(options.valid_ratio));
    }
    if (options.num_classes < 0) {
        throw PreconditionError("num_classes must be >= 0, got " +
                                std::to_string(options.num_classes));
    }

    struct stat st;
    if (::stat(data_dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        throw PreconditionError("Not a directory: " + data_dir);
    }

    // Only the count is checked here; the files read are data_batch_1..5.
    size_t found = count_train_batches(data_dir, options.format);
    if (found != static_cast<size_t>(CIFAR_NUM_TRAIN_BATCHES)) {
        throw PreconditionError("Could not find files! Expected " +
                                std::to_string(CIFAR_NUM_TRAIN_BATCHES) + " training batches in " +
                                data_dir + ", found " + std::to_string(found));
    }
}

LabelSet encode_labels(const std::vector<int>& labels, bool one_hot, int num_classes) {
    LabelSet out;
    out.one_hot = one_hot;
    if (one_hot) {
        out.matrix = one_hotify(labels, num_classes > 0 ? num_classes : -1);
    } else {
        out.indices = labels;
    }
    return out;
}

TrainingRows read_training_rows(const std::string& data_dir, const LoadOptions& options) {
    std::vector<RawBatch> batches;
    batches.reserve(CIFAR_NUM_TRAIN_BATCHES);
    size_t total = 0;
    for (int i = 1; i <= CIFAR_NUM_TRAIN_BATCHES; i++) {
        batches.push_back(read_batch(train_batch_path(data_dir, i, options.format)));
        total += batches.back().num_samples;
    }

    PixelType common = batches.front().data.type;
    for (const RawBatch& batch : batches) {
        if (batch.data.type != common) common = PixelType::Float64;
    }

    TrainingRows out;
    out.num_samples = total;
    out.rows.type = common;
    out.rows.bytes.resize(total * CIFAR_IMAGE_SIZE * pixel_type_size(common));
    out.labels.one_hot = options.one_hot;
    if (!options.one_hot) out.labels.indices.resize(total);

    size_t offset = 0;
    bool width_known = false;
    for (int i = 0; i < CIFAR_NUM_TRAIN_BATCHES; i++) {
        RawBatch& batch = batches[i];
        size_t first = offset * CIFAR_IMAGE_SIZE;
        if (batch.data.type == common) {
            std::copy(batch.data.bytes.begin(), batch.data.bytes.end(),
                      out.rows.bytes.begin() + first * pixel_type_size(common));
        } else {
            for (size_t j = 0; j < batch.data.size(); j++) {
                put_value(out.rows, first + j, pixel_value(batch.data, j));
            }
        }

        LabelSet encoded = encode_labels(batch.labels, options.one_hot, options.num_classes);
        if (options.one_hot) {
            if (!width_known) {
                out.labels.matrix = OneHotMatrix(static_cast<int>(total), encoded.matrix.cols);
                width_known = true;
            } else if (encoded.matrix.cols != out.labels.matrix.cols) {
                throw DeserializationError(train_batch_path(data_dir, i + 1, options.format) +
                                           ": one-hot width " + std::to_string(encoded.matrix.cols) +
                                           " differs from " + std::to_string(out.labels.matrix.cols));
            }
            std::copy(encoded.matrix.data.begin(), encoded.matrix.data.end(),
                      out.labels.matrix.data.begin() + offset * out.labels.matrix.cols);
        } else {
            std::copy(encoded.indices.begin(), encoded.indices.end(),
                      out.labels.indices.begin() + offset);
        }

        offset += batch.num_samples;
        std::vector<uint8_t>().swap(batch.data.bytes);
    }
    return out;
}

double pixel_value(const PixelBuffer& pixels, size_t i) {
    const uint8_t* p = pixels.bytes.data() + i * pixel_type_size(pixels.type);
    switch (pixels.type) {
        case PixelType::UInt8: return *p;
        case PixelType::Int8: { int8_t v; std::memcpy(&v, p, 1); return v; }
        case PixelType::Int16: { int16_t v; std::memcpy(&v, p, 2); return v; }
        case PixelType::Int32: { int32_t v; std::memcpy(&v, p, 4); return v; }
        case PixelType::Int64: { int64_t v; std::memcpy(&v, p, 8); return static_cast<double>(v); }
        case PixelType::Float32: { float v; std::memcpy(&v, p, 4); return v; }
        case PixelType::Float64: { double v; std::memcpy(&v, p, 8); return v; }
    }
    return 0.0;
}

LabelSet take_labels(const LabelSet& labels, const std::vector<size_t>& order,
                     size_t begin, size_t end) {
    LabelSet out;
    out.one_hot = labels.one_hot;
    if (labels.one_hot) {
        int cols = labels.matrix.cols;
        out.matrix = OneHotMatrix(static_cast<int>(end - begin), cols);
        for (size_t i = begin; i < end; i++) {
            auto src = labels.matrix.data.begin() + order[i] * cols;
            std::copy(src, src + cols, out.matrix.data.begin() + (i - begin) * cols);
        }
    } else {
        out.indices.reserve(end - begin);
        for (size_t i = begin; i < end; i++) {
            out.indices.push_back(labels.indices[order[i]]);
        }
    }
    return out;
}

std::vector<size_t> sample_order(size_t n, bool shuffle, unsigned seed) {
    std::vector<size_t> idx(n);
    std::iota(idx.begin(), idx.end(), size_t(0));
    if (shuffle) {
        std::random_device rd;
        std::mt19937 g(seed != 0 ? seed : rd());
        std::shuffle(idx.begin(), idx.end(), g);
    }
    return idx;
}

size_t split_index(size_t n, double valid_ratio) {
    return static_cast<size_t>((1.0 - valid_ratio) * static_cast<double>(n));
}

} // namespace detail

RawBatch read_batch(const std::string& path) {
    std::vector<uint8_t> bytes = detail::read_file_bytes(path);
    if (detail::has_binary_suffix(path)) {
        return detail::parse_binary_batch(bytes, path);
    }

    pickle::ValuePtr root;
    try {
        root = pickle::loads(bytes);
    } catch (const DeserializationError& e) {
        throw DeserializationError(path + ": " + e.what());
    }
    return detail::parse_pickled_batch(*root, path);
}

std::vector<std::string> read_label_names(const std::string& data_dir, BatchFormat format) {
    std::vector<std::string> names;

    if (format == BatchFormat::Binary) {
        std::string path = detail::join_path(data_dir, CIFAR_META_TEXT);
        std::vector<uint8_t> bytes = detail::read_file_bytes(path);
        std::string line;
        for (size_t i = 0; i <= bytes.size(); i++) {
            if (i == bytes.size() || bytes[i] == '\n') {
                size_t first = line.find_first_not_of(" \t\r");
                if (first != std::string::npos) {
                    size_t last = line.find_last_not_of(" \t\r");
                    names.push_back(line.substr(first, last - first + 1));
                }
                line.clear();
            } else {
                line += static_cast<char>(bytes[i]);
            }
        }
        return names;
    }

    std::string path = detail::join_path(data_dir, CIFAR_META_PICKLE);
    std::vector<uint8_t> bytes = detail::read_file_bytes(path);
    pickle::ValuePtr root;
    try {
        root = pickle::loads(bytes);
    } catch (const DeserializationError& e) {
        throw DeserializationError(path + ": " + e.what());
    }

    const pickle::Value* list = pickle::dict_get(*root, "label_names");
    if (!list || !list->is_sequence()) {
        throw DeserializationError(path + ": missing 'label_names' list");
    }
    for (const auto& item : list->items) {
        if (!item->is_text()) {
            throw DeserializationError(path + ": label names must be strings");
        }
        names.push_back(item->text);
    }
    return names;
}

} // namespace cifar10
