#pragma once

#include <array>

constexpr int CIFAR_IMAGE_WIDTH  = 32;
constexpr int CIFAR_IMAGE_HEIGHT = 32;
constexpr int CIFAR_IMAGE_CHANNELS = 3;
constexpr int CIFAR_CHANNEL_SIZE = CIFAR_IMAGE_HEIGHT * CIFAR_IMAGE_WIDTH;
constexpr int CIFAR_IMAGE_SIZE = CIFAR_IMAGE_CHANNELS * CIFAR_CHANNEL_SIZE;

// Binary release: 1 label byte followed by the image bytes
constexpr int CIFAR_RECORD_SIZE = 1 + CIFAR_IMAGE_SIZE;

constexpr int CIFAR_NUM_TRAIN = 50000;
constexpr int CIFAR_NUM_TEST  = 10000;
constexpr int CIFAR_NUM_CLASSES = 10;
constexpr int CIFAR_NUM_TRAIN_BATCHES = 5;

constexpr const char* CIFAR_TRAIN_BATCH_PREFIX = "data_batch_";
constexpr const char* CIFAR_TEST_BATCH_NAME = "test_batch";
constexpr const char* CIFAR_BINARY_SUFFIX = ".bin";
constexpr const char* CIFAR_META_PICKLE = "batches.meta";
constexpr const char* CIFAR_META_TEXT = "batches.meta.txt";

// Per-channel statistics of the training set (RGB, 0..255 scale)
constexpr std::array<double, 3> CIFAR_CHANNEL_MEAN = {{125.3, 123.0, 113.9}};
constexpr std::array<double, 3> CIFAR_CHANNEL_STD  = {{63.0, 62.1, 66.7}};
