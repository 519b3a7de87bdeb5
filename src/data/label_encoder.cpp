#include "cifar10.hpp"
#include <algorithm>
#include <climits>

namespace cifar10 {

OneHotMatrix one_hotify(const std::vector<int>& labels, int num_classes) {
    if (num_classes < 0) {
        if (labels.empty()) {
            throw PreconditionError("Cannot infer num_classes from an empty label list");
        }
        int max_label = *std::max_element(labels.begin(), labels.end());
        if (max_label == INT_MAX) {
            throw PreconditionError("Label " + std::to_string(max_label) + " is too large to infer num_classes");
        }
        num_classes = max_label + 1;
    }

    OneHotMatrix out(static_cast<int>(labels.size()), num_classes);
    for (size_t i = 0; i < labels.size(); i++) {
        int label = labels[i];
        if (label < 0 || label >= num_classes) {
            throw PreconditionError("Label " + std::to_string(label) + " at index " +
                                    std::to_string(i) + " is outside [0, " +
                                    std::to_string(num_classes) + ")");
        }
        out.at(static_cast<int>(i), label) = 1.0f;
    }
    return out;
}

} // namespace cifar10
