#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <iomanip>
#include "cifar10.hpp"
#include "config.h"

// Mean of every channel over a whole (N, H, W, C) tensor
std::vector<double> channel_means(const cifar10::ImageTensor<float>& images) {
    std::vector<double> sums(images.C, 0.0);
    if (images.data.empty()) return sums;

    for (size_t i = 0; i < images.data.size(); i++) {
        sums[i % images.C] += images.data[i];
    }
    double per_channel = static_cast<double>(images.data.size() / images.C);
    for (double& s : sums) s /= per_channel;
    return sums;
}

void print_split(const std::string& name, const cifar10::DatasetSplit<float>& split,
                 const std::vector<std::string>& class_names) {
    std::cout << name << ": " << split.num_samples() << " images";
    if (split.labels.one_hot) {
        std::cout << ", one-hot labels (" << split.labels.matrix.rows << " x "
                  << split.labels.matrix.cols << ")\n";
    } else {
        std::cout << ", integer labels\n";
    }
    if (split.num_samples() == 0) return;

    std::vector<int> counts;
    for (size_t i = 0; i < split.labels.size(); i++) {
        int label = split.labels.label_at(i);
        if (label < 0) continue;
        if (label >= static_cast<int>(counts.size())) counts.resize(label + 1, 0);
        counts[label]++;
    }
    for (size_t c = 0; c < counts.size(); c++) {
        std::cout << "  " << std::setw(2) << c << " ";
        if (c < class_names.size()) std::cout << std::left << std::setw(12) << class_names[c] << std::right;
        std::cout << counts[c] << "\n";
    }
}

void print_means(const std::string& label, const std::vector<double>& means) {
    std::cout << label << ":";
    for (double m : means) std::cout << " " << std::fixed << std::setprecision(3) << m;
    std::cout << "\n";
    std::cout.unsetf(std::ios::fixed);
}

int main(int argc, char** argv) {
    std::string cifar_dir = "../cifar-10-batches-py";
    cifar10::LoadOptions options;
    options.verbose = true;

    try {
        if (argc > 1) cifar_dir = argv[1];
        if (argc > 2) options.valid_ratio = std::stod(argv[2]);
        if (argc > 3) options.shuffle = std::stoi(argv[3]) != 0;
        if (argc > 4) {
            std::string format = argv[4];
            if (format == "binary") {
                options.format = cifar10::BatchFormat::Binary;
            } else if (format != "python") {
                std::cerr << "Unknown format '" << format << "' (expected python or binary)\n";
                return 1;
            }
        }
        if (argc > 5) options.one_hot = std::stoi(argv[5]) != 0;

        std::cout << "Options:\n";
        std::cout << "  Data directory: " << cifar_dir << "\n";
        std::cout << "  Validation ratio: " << options.valid_ratio << "\n";
        std::cout << "  Shuffle: " << (options.shuffle ? "yes" : "no") << "\n";
        std::cout << "  Format: " << (options.format == cifar10::BatchFormat::Binary ? "binary" : "python") << "\n";
        std::cout << "  One-hot labels: " << (options.one_hot ? "yes" : "no") << "\n\n";

        auto start = std::chrono::high_resolution_clock::now();
        cifar10::Cifar10Data<float> data = cifar10::load<float>(cifar_dir, options);
        auto end = std::chrono::high_resolution_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        std::cout << "Load time: " << ms.count() << " ms\n\n";

        std::vector<std::string> class_names;
        try {
            class_names = cifar10::read_label_names(cifar_dir, options.format);
        } catch (const cifar10::Cifar10Error& e) {
            std::cerr << "Class names unavailable: " << e.what() << "\n";
        }

        print_split("Train", data.train, class_names);
        print_split("Valid", data.valid, class_names);
        print_split("Test", data.test, class_names);

        if (!data.train.data.empty()) {
            std::cout << "\n";
            print_means("Train channel mean (raw)", channel_means(data.train.data));
            cifar10::preprocess(data.train.data);
            print_means("Train channel mean (normalized)", channel_means(data.train.data));
        }
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
