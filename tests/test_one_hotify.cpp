#include "test_utils.h"
#include <climits>

using namespace cifar10;

static void test_rows_have_single_one() {
    std::vector<int> labels = {3, 0, 9, 3, 7};
    OneHotMatrix m = one_hotify(labels, 10);
    CHECK(m.rows == 5);
    CHECK(m.cols == 10);
    for (int r = 0; r < m.rows; r++) {
        float sum = 0.0f;
        for (int c = 0; c < m.cols; c++) {
            float expected = (c == labels[r]) ? 1.0f : 0.0f;
            CHECK(m.at(r, c) == expected);
            sum += m.at(r, c);
        }
        CHECK(sum == 1.0f);
        CHECK(m.hot_index(r) == labels[r]);
    }
}

static void test_infers_width_from_max_label() {
    OneHotMatrix m = one_hotify({1, 4, 2});
    CHECK(m.rows == 3);
    CHECK(m.cols == 5);
    CHECK(m.at(1, 4) == 1.0f);
}

static void test_empty_input() {
    OneHotMatrix m = one_hotify({}, 10);
    CHECK(m.rows == 0);
    CHECK(m.cols == 10);
    CHECK(m.data.empty());
    CHECK_THROWS(PreconditionError, one_hotify({}));
}

static void test_out_of_range_labels() {
    CHECK_THROWS(PreconditionError, one_hotify({0, 10}, 10));
    CHECK_THROWS(PreconditionError, one_hotify({-1, 2}, 3));
    CHECK_THROWS(PreconditionError, one_hotify({1, INT_MAX}));
}

static void test_encode_labels_modes() {
    std::vector<int> labels = {2, 1};
    LabelSet ints = detail::encode_labels(labels, false, 10);
    CHECK(!ints.one_hot);
    CHECK(ints.size() == 2);
    CHECK(ints.label_at(0) == 2 && ints.label_at(1) == 1);

    LabelSet hot = detail::encode_labels(labels, true, 10);
    CHECK(hot.one_hot);
    CHECK(hot.matrix.cols == 10);
    CHECK(hot.label_at(0) == 2 && hot.label_at(1) == 1);

    LabelSet inferred = detail::encode_labels(labels, true, 0);
    CHECK(inferred.matrix.cols == 3);
}

int main() {
    run_test("rows have a single one", test_rows_have_single_one);
    run_test("infers width from max label", test_infers_width_from_max_label);
    run_test("empty input", test_empty_input);
    run_test("out of range labels", test_out_of_range_labels);
    run_test("encode_labels modes", test_encode_labels_modes);
    return finish_tests();
}
