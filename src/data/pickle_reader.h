#ifndef PICKLE_READER_H
#define PICKLE_READER_H

#include <vector>
#include <string>
#include <memory>
#include <utility>
#include <cstdint>

// Decoder for the subset of the Python pickle format (protocols 0-4) that
// the CIFAR-10 python batches and NumPy ndarrays are written with.
namespace cifar10 {
namespace pickle {

enum class Kind {
    None,
    Bool,
    Int,
    Float,
    String,   // unicode text (UTF-8) or a Python 2 str
    Bytes,
    List,
    Tuple,
    Dict,
    Global,   // "module.name" reference
    Object    // result of calling a Global (REDUCE / NEWOBJ), plus BUILD state
};

struct Value;
using ValuePtr = std::shared_ptr<Value>;

struct Value {
    Value() = default;
    ~Value();

    Value(const Value&) = delete;
    Value& operator=(const Value&) = delete;

    Kind kind = Kind::None;
    bool boolean = false;
    int64_t integer = 0;
    double real = 0.0;
    std::string text;                                    // String, Bytes, Global
    std::vector<ValuePtr> items;                         // List, Tuple
    std::vector<std::pair<ValuePtr, ValuePtr>> entries;  // Dict, in insertion order

    ValuePtr callable;   // Object
    ValuePtr args;       // Object
    ValuePtr state;      // Object, set by BUILD

    bool is_text() const { return kind == Kind::String || kind == Kind::Bytes; }
    bool is_sequence() const { return kind == Kind::List || kind == Kind::Tuple; }

    // Name of the called Global for an Object, empty otherwise
    std::string callable_name() const;

    // Moves every child reference into out, leaving this value childless
    void release_children(std::vector<ValuePtr>& out);
};

ValuePtr make_value(Kind kind);

// Decodes one pickle stream. Throws DeserializationError on malformed input.
ValuePtr loads(const std::vector<uint8_t>& buffer);

// Looks up a str or bytes key in a Dict, nullptr when absent.
const Value* dict_get(const Value& dict, const std::string& key);

const char* kind_name(Kind kind);

} // namespace pickle
} // namespace cifar10

#endif // PICKLE_READER_H
