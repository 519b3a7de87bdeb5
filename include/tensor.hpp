#pragma once
#include <vector>
#include <cstddef>
#include "config.h"

namespace cifar10 {

// Batch of images in (N, H, W, C) order
template <typename T>
struct ImageTensor {
    int N, H, W, C;
    std::vector<T> data;

    ImageTensor() : N(0), H(0), W(0), C(0) {}
    ImageTensor(int N, int H, int W, int C)
        : N(N), H(H), W(W), C(C), data(static_cast<size_t>(N) * H * W * C, T(0)) {}

    inline T& at(int n, int h, int w, int c) {
        return data[((static_cast<size_t>(n) * H + h) * W + w) * C + c];
    }

    inline const T& at(int n, int h, int w, int c) const {
        return data[((static_cast<size_t>(n) * H + h) * W + w) * C + c];
    }

    size_t image_size() const { return static_cast<size_t>(H) * W * C; }
    bool empty() const { return N == 0; }
};

struct OneHotMatrix {
    int rows, cols;
    std::vector<float> data;

    OneHotMatrix() : rows(0), cols(0) {}
    OneHotMatrix(int rows, int cols)
        : rows(rows), cols(cols), data(static_cast<size_t>(rows) * cols, 0.0f) {}

    inline float& at(int r, int c) {
        return data[static_cast<size_t>(r) * cols + c];
    }

    inline const float& at(int r, int c) const {
        return data[static_cast<size_t>(r) * cols + c];
    }

    // Column holding the 1.0 of row r, -1 for an all-zero row
    int hot_index(int r) const {
        for (int c = 0; c < cols; c++) {
            if (at(r, c) != 0.0f) return c;
        }
        return -1;
    }
};

// Reorders a flat (3, 32, 32) image into (32, 32, 3) with a cast to T.
template <typename T, typename Src>
inline void write_channel_last(const Src* chw, T* hwc) {
    for (int c = 0; c < CIFAR_IMAGE_CHANNELS; c++) {
        for (int h = 0; h < CIFAR_IMAGE_HEIGHT; h++) {
            for (int w = 0; w < CIFAR_IMAGE_WIDTH; w++) {
                int src = c * CIFAR_CHANNEL_SIZE + h * CIFAR_IMAGE_WIDTH + w;
                int dst = (h * CIFAR_IMAGE_WIDTH + w) * CIFAR_IMAGE_CHANNELS + c;
                hwc[dst] = static_cast<T>(chw[src]);
            }
        }
    }
}

} // namespace cifar10
