#ifndef CIFAR10_LOADER_H
#define CIFAR10_LOADER_H

#include <vector>
#include <string>
#include <cstdint>

#include "cifar10.hpp"
#include "pickle_reader.h"

namespace cifar10 {
namespace detail {

// Whole file contents. Throws FileNotFoundError or IoError.
std::vector<uint8_t> read_file_bytes(const std::string& path);

bool has_binary_suffix(const std::string& path);

// <label byte><3072 pixel bytes> records
RawBatch parse_binary_batch(const std::vector<uint8_t>& bytes, const std::string& path);

// Pickled dict with "data" (numeric ndarray or number list) and "labels"
RawBatch parse_pickled_batch(const pickle::Value& root, const std::string& path);

// Values of a numeric NumPy ndarray reconstructed by pickle, swapped to
// host byte order. Returns false when value is not an ndarray at all.
bool ndarray_pixels(const pickle::Value& value, PixelBuffer& out,
                    std::vector<int64_t>& shape, const std::string& path);

} // namespace detail
} // namespace cifar10

#endif // CIFAR10_LOADER_H
