#include "test_utils.h"
#include "data/pickle_reader.h"

using namespace cifar10;

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Keeps embedded NUL bytes of a literal
template <size_t N>
static std::vector<uint8_t> bytes_of(const char (&s)[N]) {
    return std::vector<uint8_t>(s, s + N - 1);
}

static void test_protocol0_dict() {
    // pickle.dumps({'a': [1, 2], 'b': 'x'}, protocol=0) under Python 2
    std::string text = "(dp0\nS'a'\np1\n(lp2\nI1\naI2\nasS'b'\np3\nS'x'\np4\ns.";
    pickle::ValuePtr root = pickle::loads(bytes_of(text));
    CHECK(root->kind == pickle::Kind::Dict);
    const pickle::Value* a = pickle::dict_get(*root, "a");
    CHECK(a && a->kind == pickle::Kind::List);
    CHECK(a && a->items.size() == 2 && a->items[0]->integer == 1 && a->items[1]->integer == 2);
    const pickle::Value* b = pickle::dict_get(*root, "b");
    CHECK(b && b->is_text() && b->text == "x");
    CHECK(pickle::dict_get(*root, "missing") == nullptr);
}

static void test_protocol2_scalars() {
    PickleWriter w;
    w.proto(2);
    w.op('(');
    w.integer(7);
    w.integer(1000);
    w.integer(-5);
    w.op('N');
    w.op(0x88);
    w.op(0x8a);   // LONG1 with 2 bytes: -2
    w.le(2, 1);
    w.le(0xfffe, 2);
    w.unicode("caf\xc3\xa9");
    w.op('t');
    w.stop();

    pickle::ValuePtr v = pickle::loads(w.bytes);
    CHECK(v->kind == pickle::Kind::Tuple);
    CHECK(v->items.size() == 7);
    if (v->items.size() != 7) return;
    CHECK(v->items[0]->integer == 7);
    CHECK(v->items[1]->integer == 1000);
    CHECK(v->items[2]->integer == -5);
    CHECK(v->items[3]->kind == pickle::Kind::None);
    CHECK(v->items[4]->kind == pickle::Kind::Bool && v->items[4]->boolean);
    CHECK(v->items[5]->integer == -2);
    CHECK(v->items[6]->text == "caf\xc3\xa9");
}

static void test_memo_shares_objects() {
    // The same list referenced twice through BINPUT / BINGET
    PickleWriter w;
    w.proto(2);
    w.op(']');
    w.op('q');
    w.le(1, 1);
    w.op('h');
    w.le(1, 1);
    w.op(0x86);
    w.stop();

    pickle::ValuePtr v = pickle::loads(w.bytes);
    CHECK(v->kind == pickle::Kind::Tuple);
    CHECK(v->items.size() == 2 && v->items[0] == v->items[1]);
}

static void test_ndarray_reconstruct() {
    std::vector<uint8_t> data(2 * CIFAR_IMAGE_SIZE, 9);
    PickleWriter w;
    w.proto(2);
    write_uint8_ndarray(w, data, 2, CIFAR_IMAGE_SIZE, false);
    w.stop();

    pickle::ValuePtr v = pickle::loads(w.bytes);
    CHECK(v->kind == pickle::Kind::Object);
    CHECK(v->callable_name() == "numpy.core.multiarray._reconstruct");
    CHECK(v->state && v->state->kind == pickle::Kind::Tuple && v->state->items.size() == 5);
    if (!v->state || v->state->items.size() != 5) return;
    const pickle::Value& shape = *v->state->items[1];
    CHECK(shape.items.size() == 2 && shape.items[0]->integer == 2 &&
          shape.items[1]->integer == CIFAR_IMAGE_SIZE);
    CHECK(v->state->items[2]->callable_name() == "numpy.dtype");
    CHECK(v->state->items[4]->text.size() == data.size());
}

static void test_codecs_encode_bytes() {
    // Python 3 protocol 2 writes b'\xffab' as _codecs.encode('\xffab', 'latin1')
    PickleWriter w;
    w.proto(2);
    w.global("_codecs", "encode");
    w.unicode("\xc3\xbf" "ab");
    w.unicode("latin1");
    w.op(0x86);
    w.op('R');
    w.stop();

    pickle::ValuePtr v = pickle::loads(w.bytes);
    CHECK(v->kind == pickle::Kind::Bytes);
    CHECK(v->text == std::string("\xff" "ab"));
}

static void test_protocol4_frame_and_stack_global() {
    PickleWriter w;
    w.proto(4);
    w.op(0x95);   // FRAME
    w.le(0, 8);
    w.op(0x8c);   // SHORT_BINUNICODE
    w.le(5, 1);
    w.raw("numpy");
    w.op(0x94);   // MEMOIZE
    w.op(0x8c);
    w.le(5, 1);
    w.raw("dtype");
    w.op(0x94);
    w.op(0x93);   // STACK_GLOBAL
    w.stop();

    pickle::ValuePtr v = pickle::loads(w.bytes);
    CHECK(v->kind == pickle::Kind::Global);
    CHECK(v->text == "numpy.dtype");
}

static void test_malformed_streams() {
    CHECK_THROWS(DeserializationError, pickle::loads({}));
    CHECK_THROWS(DeserializationError, pickle::loads(bytes_of("\x80\x02}")));   // no STOP
    CHECK_THROWS(DeserializationError, pickle::loads(bytes_of("\x80\x02" "a.")));   // APPEND on empty stack
    CHECK_THROWS(DeserializationError, pickle::loads(bytes_of("\x80\x02h\x05.")));   // unknown memo key
    CHECK_THROWS(DeserializationError, pickle::loads(bytes_of("\x80\x09N.")));   // protocol 9
    CHECK_THROWS(DeserializationError, pickle::loads(bytes_of("\x80\x02\xff.")));   // bad opcode
    CHECK_THROWS(DeserializationError, pickle::loads(bytes_of("\x80\x02X\x10\x00\x00\x00" "ab.")));   // short string
}

static void test_dict_built_from_itself() {
    pickle::ValuePtr v = pickle::loads(bytes_of("\x80\x02}(K\0K\0K\1K\1K\2K\2u2b."));
    CHECK(v->kind == pickle::Kind::Dict);
    CHECK(v->entries.size() == 6);
    for (const auto& entry : v->entries) {
        CHECK(entry.first && entry.second);
    }
    CHECK(pickle::dict_get(*v, "data") == nullptr);
}

static void test_deep_nesting_is_released() {
    std::vector<uint8_t> stream = {0x80, 0x02};
    stream.insert(stream.end(), 2000000, '(');
    stream.insert(stream.end(), 2000000, 'l');
    stream.push_back('.');

    pickle::ValuePtr v = pickle::loads(stream);
    CHECK(v->kind == pickle::Kind::List);
    CHECK(v->items.size() == 1);
    v.reset();
}

int main() {
    run_test("protocol 0 dict", test_protocol0_dict);
    run_test("protocol 2 scalars", test_protocol2_scalars);
    run_test("memo shares objects", test_memo_shares_objects);
    run_test("ndarray reconstruct", test_ndarray_reconstruct);
    run_test("_codecs.encode bytes", test_codecs_encode_bytes);
    run_test("protocol 4 frame and STACK_GLOBAL", test_protocol4_frame_and_stack_global);
    run_test("malformed streams", test_malformed_streams);
    run_test("dict built from itself", test_dict_built_from_itself);
    run_test("deep nesting is released", test_deep_nesting_is_released);
    return finish_tests();
}
