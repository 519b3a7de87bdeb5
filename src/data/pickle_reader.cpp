#include "pickle_reader.h"
#include "cifar10.hpp"
#include <unordered_map>
#include <cstring>
#include <cstdio>

namespace cifar10 {
namespace pickle {

namespace {

constexpr uint8_t OP_MARK = '(';
constexpr uint8_t OP_STOP = '.';
constexpr uint8_t OP_POP = '0';
constexpr uint8_t OP_POP_MARK = '1';
constexpr uint8_t OP_DUP = '2';
constexpr uint8_t OP_FLOAT = 'F';
constexpr uint8_t OP_INT = 'I';
constexpr uint8_t OP_BININT = 'J';
constexpr uint8_t OP_BININT1 = 'K';
constexpr uint8_t OP_LONG = 'L';
constexpr uint8_t OP_BININT2 = 'M';
constexpr uint8_t OP_NONE = 'N';
constexpr uint8_t OP_REDUCE = 'R';
constexpr uint8_t OP_STRING = 'S';
constexpr uint8_t OP_BINSTRING = 'T';
constexpr uint8_t OP_SHORT_BINSTRING = 'U';
constexpr uint8_t OP_UNICODE = 'V';
constexpr uint8_t OP_BINUNICODE = 'X';
constexpr uint8_t OP_APPEND = 'a';
constexpr uint8_t OP_BUILD = 'b';
constexpr uint8_t OP_GLOBAL = 'c';
constexpr uint8_t OP_DICT = 'd';
constexpr uint8_t OP_EMPTY_DICT = '}';
constexpr uint8_t OP_APPENDS = 'e';
constexpr uint8_t OP_GET = 'g';
constexpr uint8_t OP_BINGET = 'h';
constexpr uint8_t OP_LONG_BINGET = 'j';
constexpr uint8_t OP_LIST = 'l';
constexpr uint8_t OP_EMPTY_LIST = ']';
constexpr uint8_t OP_PUT = 'p';
constexpr uint8_t OP_BINPUT = 'q';
constexpr uint8_t OP_LONG_BINPUT = 'r';
constexpr uint8_t OP_SETITEM = 's';
constexpr uint8_t OP_TUPLE = 't';
constexpr uint8_t OP_EMPTY_TUPLE = ')';
constexpr uint8_t OP_SETITEMS = 'u';
constexpr uint8_t OP_BINFLOAT = 'G';

// Protocol 2
constexpr uint8_t OP_PROTO = 0x80;
constexpr uint8_t OP_NEWOBJ = 0x81;
constexpr uint8_t OP_TUPLE1 = 0x85;
constexpr uint8_t OP_TUPLE2 = 0x86;
constexpr uint8_t OP_TUPLE3 = 0x87;
constexpr uint8_t OP_NEWTRUE = 0x88;
constexpr uint8_t OP_NEWFALSE = 0x89;
constexpr uint8_t OP_LONG1 = 0x8a;
constexpr uint8_t OP_LONG4 = 0x8b;

// Protocol 3
constexpr uint8_t OP_BINBYTES = 'B';
constexpr uint8_t OP_SHORT_BINBYTES = 'C';

// Protocol 4
constexpr uint8_t OP_SHORT_BINUNICODE = 0x8c;
constexpr uint8_t OP_BINUNICODE8 = 0x8d;
constexpr uint8_t OP_BINBYTES8 = 0x8e;
constexpr uint8_t OP_STACK_GLOBAL = 0x93;
constexpr uint8_t OP_MEMOIZE = 0x94;
constexpr uint8_t OP_FRAME = 0x95;

constexpr int HIGHEST_PROTOCOL = 5;

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

ValuePtr make_int(int64_t v) {
    ValuePtr out = make_value(Kind::Int);
    out->integer = v;
    return out;
}

ValuePtr make_bool(bool v) {
    ValuePtr out = make_value(Kind::Bool);
    out->boolean = v;
    return out;
}

ValuePtr make_text(Kind kind, std::string text) {
    ValuePtr out = make_value(kind);
    out->text = std::move(text);
    return out;
}

class Unpickler {
public:
    explicit Unpickler(const std::vector<uint8_t>& buffer) : buf_(buffer), pos_(0) {}

    ValuePtr load();

private:
    const std::vector<uint8_t>& buf_;
    size_t pos_;
    std::vector<ValuePtr> stack_;
    std::vector<size_t> marks_;
    std::unordered_map<uint64_t, ValuePtr> memo_;

    [[noreturn]] void fail(const std::string& msg) const {
        throw DeserializationError("pickle: " + msg + " (offset " + std::to_string(pos_) + ")");
    }

    uint8_t read_u8() {
        if (pos_ >= buf_.size()) fail("truncated stream");
        return buf_[pos_++];
    }

    uint64_t read_le(int nbytes) {
        if (buf_.size() - pos_ < static_cast<size_t>(nbytes)) fail("truncated stream");
        uint64_t v = 0;
        for (int i = 0; i < nbytes; i++) {
            v |= static_cast<uint64_t>(buf_[pos_ + i]) << (8 * i);
        }
        pos_ += nbytes;
        return v;
    }

    std::string read_bytes(uint64_t n) {
        if (n > buf_.size() - pos_) fail("truncated stream");
        std::string out(reinterpret_cast<const char*>(buf_.data() + pos_), static_cast<size_t>(n));
        pos_ += static_cast<size_t>(n);
        return out;
    }

    std::string read_line() {
        size_t start = pos_;
        while (pos_ < buf_.size() && buf_[pos_] != '\n') pos_++;
        if (pos_ >= buf_.size()) fail("unterminated text argument");
        std::string line(reinterpret_cast<const char*>(buf_.data() + start), pos_ - start);
        pos_++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return line;
    }

    void push(ValuePtr v) { stack_.push_back(std::move(v)); }

    ValuePtr pop() {
        if (stack_.empty() || (!marks_.empty() && marks_.back() == stack_.size())) {
            fail("stack underflow");
        }
        ValuePtr v = stack_.back();
        stack_.pop_back();
        return v;
    }

    const ValuePtr& top() const {
        if (stack_.empty()) fail("stack underflow");
        return stack_.back();
    }

    std::vector<ValuePtr> pop_mark() {
        if (marks_.empty()) fail("missing MARK");
        size_t mark = marks_.back();
        marks_.pop_back();
        std::vector<ValuePtr> items(stack_.begin() + mark, stack_.end());
        stack_.resize(mark);
        return items;
    }

    int64_t parse_int(std::string text) {
        if (!text.empty() && text.back() == 'L') text.pop_back();
        if (text.empty()) fail("empty integer literal");
        size_t used = 0;
        int64_t v = 0;
        try {
            v = std::stoll(text, &used, 10);
        } catch (const std::exception&) {
            fail("bad integer literal '" + text + "'");
        }
        if (used != text.size()) fail("bad integer literal '" + text + "'");
        return v;
    }

    int64_t read_long(uint64_t nbytes) {
        if (nbytes > 8) fail("integer wider than 64 bits");
        if (nbytes == 0) return 0;
        uint64_t v = read_le(static_cast<int>(nbytes));
        if (nbytes < 8 && ((v >> (8 * nbytes - 1)) & 1)) {
            v |= ~uint64_t(0) << (8 * nbytes);
        }
        return static_cast<int64_t>(v);
    }

    uint64_t memo_index(const std::string& text) {
        int64_t idx = parse_int(text);
        if (idx < 0) fail("negative memo index");
        return static_cast<uint64_t>(idx);
    }

    void memo_put(uint64_t idx) { memo_[idx] = top(); }

    void memo_get(uint64_t idx) {
        auto it = memo_.find(idx);
        if (it == memo_.end()) fail("memo key " + std::to_string(idx) + " not found");
        push(it->second);
    }

    std::string unquote(const std::string& line);
    std::string raw_unicode_escape(const std::string& line);
    std::string latin1_bytes(const std::string& utf8);
    ValuePtr call(const ValuePtr& callable, const ValuePtr& args);
    void build(const ValuePtr& obj, const ValuePtr& state);
    void append_items(const ValuePtr& list, const std::vector<ValuePtr>& items);
    void set_items(const ValuePtr& dict, const std::vector<ValuePtr>& items);
};

// Python 2 repr() of a str: quoted with backslash escapes
std::string Unpickler::unquote(const std::string& line) {
    if (line.size() < 2 || (line.front() != '\'' && line.front() != '"') ||
        line.back() != line.front()) {
        fail("STRING argument is not quoted");
    }
    std::string out;
    for (size_t i = 1; i + 1 < line.size(); i++) {
        char ch = line[i];
        if (ch != '\\' || i + 2 >= line.size()) {
            out += ch;
            continue;
        }
        char esc = line[++i];
        switch (esc) {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case '\\': out += '\\'; break;
            case '\'': out += '\''; break;
            case '"': out += '"'; break;
            case 'x': {
                if (i + 3 >= line.size()) fail("bad \\x escape");
                int hi = hex_digit(line[i + 1]);
                int lo = hex_digit(line[i + 2]);
                if (hi < 0 || lo < 0) fail("bad \\x escape");
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                break;
            }
            default:
                out += '\\';
                out += esc;
                break;
        }
    }
    return out;
}

// Protocol 0 unicode: latin-1 text with \uXXXX and \UXXXXXXXX escapes
std::string Unpickler::raw_unicode_escape(const std::string& line) {
    std::string out;
    for (size_t i = 0; i < line.size(); i++) {
        unsigned char ch = static_cast<unsigned char>(line[i]);
        if (ch == '\\' && i + 1 < line.size() && (line[i + 1] == 'u' || line[i + 1] == 'U')) {
            size_t digits = line[i + 1] == 'u' ? 4 : 8;
            if (i + 1 + digits >= line.size()) fail("bad unicode escape");
            uint32_t cp = 0;
            for (size_t k = 0; k < digits; k++) {
                int d = hex_digit(line[i + 2 + k]);
                if (d < 0) fail("bad unicode escape");
                cp = cp * 16 + static_cast<uint32_t>(d);
            }
            append_utf8(out, cp);
            i += 1 + digits;
        } else {
            append_utf8(out, ch);
        }
    }
    return out;
}

// Inverse of str.encode('utf-8') for text that only holds code points < 256
std::string Unpickler::latin1_bytes(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());
    for (size_t i = 0; i < utf8.size(); i++) {
        unsigned char ch = static_cast<unsigned char>(utf8[i]);
        if (ch < 0x80) {
            out += static_cast<char>(ch);
        } else if ((ch & 0xE0) == 0xC0 && i + 1 < utf8.size()) {
            uint32_t cp = ((ch & 0x1Fu) << 6) | (static_cast<unsigned char>(utf8[i + 1]) & 0x3Fu);
            if (cp > 0xFF) fail("latin-1 payload holds a code point above 0xFF");
            out += static_cast<char>(cp);
            i++;
        } else {
            fail("latin-1 payload holds a code point above 0xFF");
        }
    }
    return out;
}

ValuePtr Unpickler::call(const ValuePtr& callable, const ValuePtr& args) {
    if (callable->kind != Kind::Global) {
        fail(std::string("cannot call a ") + kind_name(callable->kind));
    }
    if (args->kind != Kind::Tuple) {
        fail(std::string("call arguments must be a tuple, got ") + kind_name(args->kind));
    }
    const std::string& name = callable->text;

    // Python 3 writes bytes under protocol 2 as _codecs.encode(text, 'latin1')
    if (name == "_codecs.encode") {
        if (args->items.size() != 2 || args->items[0]->kind != Kind::String ||
            args->items[1]->kind != Kind::String) {
            fail("unexpected _codecs.encode arguments");
        }
        const std::string& encoding = args->items[1]->text;
        if (encoding != "latin1" && encoding != "latin-1") {
            fail("unsupported encoding '" + encoding + "'");
        }
        return make_text(Kind::Bytes, latin1_bytes(args->items[0]->text));
    }
    if ((name == "__builtin__.bytes" || name == "builtins.bytes") && args->items.empty()) {
        return make_text(Kind::Bytes, std::string());
    }

    ValuePtr obj = make_value(Kind::Object);
    obj->callable = callable;
    obj->args = args;
    return obj;
}

void Unpickler::build(const ValuePtr& obj, const ValuePtr& state) {
    if (obj->kind == Kind::Object) {
        obj->state = state;
    } else if (obj->kind == Kind::Dict && state->kind == Kind::Dict) {
        // state may be obj itself
        std::vector<std::pair<ValuePtr, ValuePtr>> added = state->entries;
        obj->entries.insert(obj->entries.end(), added.begin(), added.end());
    } else {
        fail(std::string("BUILD on a ") + kind_name(obj->kind));
    }
}

void Unpickler::append_items(const ValuePtr& list, const std::vector<ValuePtr>& items) {
    if (list->kind != Kind::List) fail(std::string("APPEND to a ") + kind_name(list->kind));
    list->items.insert(list->items.end(), items.begin(), items.end());
}

void Unpickler::set_items(const ValuePtr& dict, const std::vector<ValuePtr>& items) {
    if (dict->kind != Kind::Dict) fail(std::string("SETITEM on a ") + kind_name(dict->kind));
    if (items.size() % 2 != 0) fail("odd number of items for SETITEMS");
    for (size_t i = 0; i < items.size(); i += 2) {
        dict->entries.emplace_back(items[i], items[i + 1]);
    }
}

ValuePtr Unpickler::load() {
    while (true) {
        uint8_t op = read_u8();
        switch (op) {
            case OP_PROTO: {
                uint8_t proto = read_u8();
                if (proto > HIGHEST_PROTOCOL) fail("unsupported protocol " + std::to_string(proto));
                break;
            }
            case OP_FRAME:
                read_le(8);
                break;
            case OP_STOP:
                return pop();

            case OP_MARK:
                marks_.push_back(stack_.size());
                break;
            case OP_POP:
                if (!stack_.empty() && (marks_.empty() || marks_.back() < stack_.size())) {
                    stack_.pop_back();
                } else {
                    pop_mark();
                }
                break;
            case OP_POP_MARK:
                pop_mark();
                break;
            case OP_DUP:
                push(top());
                break;

            case OP_NONE:
                push(make_value(Kind::None));
                break;
            case OP_NEWTRUE:
                push(make_bool(true));
                break;
            case OP_NEWFALSE:
                push(make_bool(false));
                break;
            case OP_INT: {
                std::string line = read_line();
                if (line == "00") push(make_bool(false));
                else if (line == "01") push(make_bool(true));
                else push(make_int(parse_int(line)));
                break;
            }
            case OP_LONG:
                push(make_int(parse_int(read_line())));
                break;
            case OP_BININT:
                push(make_int(static_cast<int32_t>(read_le(4))));
                break;
            case OP_BININT1:
                push(make_int(read_u8()));
                break;
            case OP_BININT2:
                push(make_int(static_cast<int64_t>(read_le(2))));
                break;
            case OP_LONG1:
                push(make_int(read_long(read_u8())));
                break;
            case OP_LONG4: {
                int32_t n = static_cast<int32_t>(read_le(4));
                if (n < 0) fail("negative LONG4 length");
                push(make_int(read_long(static_cast<uint64_t>(n))));
                break;
            }
            case OP_FLOAT: {
                std::string line = read_line();
                ValuePtr v = make_value(Kind::Float);
                try {
                    v->real = std::stod(line);
                } catch (const std::exception&) {
                    fail("bad float literal '" + line + "'");
                }
                push(v);
                break;
            }
            case OP_BINFLOAT: {
                if (buf_.size() - pos_ < 8) fail("truncated stream");
                uint64_t bits = 0;
                for (int i = 0; i < 8; i++) bits = (bits << 8) | buf_[pos_ + i];
                pos_ += 8;
                ValuePtr v = make_value(Kind::Float);
                std::memcpy(&v->real, &bits, sizeof(double));
                push(v);
                break;
            }

            case OP_STRING:
                push(make_text(Kind::String, unquote(read_line())));
                break;
            case OP_BINSTRING: {
                int32_t n = static_cast<int32_t>(read_le(4));
                if (n < 0) fail("negative BINSTRING length");
                push(make_text(Kind::String, read_bytes(static_cast<uint64_t>(n))));
                break;
            }
            case OP_SHORT_BINSTRING:
                push(make_text(Kind::String, read_bytes(read_u8())));
                break;
            case OP_UNICODE:
                push(make_text(Kind::String, raw_unicode_escape(read_line())));
                break;
            case OP_BINUNICODE:
                push(make_text(Kind::String, read_bytes(read_le(4))));
                break;
            case OP_SHORT_BINUNICODE:
                push(make_text(Kind::String, read_bytes(read_u8())));
                break;
            case OP_BINUNICODE8:
                push(make_text(Kind::String, read_bytes(read_le(8))));
                break;
            case OP_BINBYTES:
                push(make_text(Kind::Bytes, read_bytes(read_le(4))));
                break;
            case OP_SHORT_BINBYTES:
                push(make_text(Kind::Bytes, read_bytes(read_u8())));
                break;
            case OP_BINBYTES8:
                push(make_text(Kind::Bytes, read_bytes(read_le(8))));
                break;

            case OP_EMPTY_DICT:
                push(make_value(Kind::Dict));
                break;
            case OP_EMPTY_LIST:
                push(make_value(Kind::List));
                break;
            case OP_EMPTY_TUPLE:
                push(make_value(Kind::Tuple));
                break;
            case OP_LIST: {
                ValuePtr v = make_value(Kind::List);
                v->items = pop_mark();
                push(v);
                break;
            }
            case OP_TUPLE: {
                ValuePtr v = make_value(Kind::Tuple);
                v->items = pop_mark();
                push(v);
                break;
            }
            case OP_TUPLE1:
            case OP_TUPLE2:
            case OP_TUPLE3: {
                size_t n = static_cast<size_t>(op - OP_TUPLE1 + 1);
                ValuePtr v = make_value(Kind::Tuple);
                v->items.resize(n);
                for (size_t i = n; i > 0; i--) v->items[i - 1] = pop();
                push(v);
                break;
            }
            case OP_DICT: {
                ValuePtr v = make_value(Kind::Dict);
                set_items(v, pop_mark());
                push(v);
                break;
            }

            case OP_APPEND: {
                ValuePtr item = pop();
                append_items(top(), {item});
                break;
            }
            case OP_APPENDS: {
                std::vector<ValuePtr> items = pop_mark();
                append_items(top(), items);
                break;
            }
            case OP_SETITEM: {
                ValuePtr value = pop();
                ValuePtr key = pop();
                set_items(top(), {key, value});
                break;
            }
            case OP_SETITEMS: {
                std::vector<ValuePtr> items = pop_mark();
                set_items(top(), items);
                break;
            }

            case OP_GET:
                memo_get(memo_index(read_line()));
                break;
            case OP_BINGET:
                memo_get(read_u8());
                break;
            case OP_LONG_BINGET:
                memo_get(read_le(4));
                break;
            case OP_PUT:
                memo_put(memo_index(read_line()));
                break;
            case OP_BINPUT:
                memo_put(read_u8());
                break;
            case OP_LONG_BINPUT:
                memo_put(read_le(4));
                break;
            case OP_MEMOIZE:
                memo_put(memo_.size());
                break;

            case OP_GLOBAL: {
                std::string module = read_line();
                std::string name = read_line();
                push(make_text(Kind::Global, module + "." + name));
                break;
            }
            case OP_STACK_GLOBAL: {
                ValuePtr name = pop();
                ValuePtr module = pop();
                if (module->kind != Kind::String || name->kind != Kind::String) {
                    fail("STACK_GLOBAL needs two strings");
                }
                push(make_text(Kind::Global, module->text + "." + name->text));
                break;
            }
            case OP_REDUCE:
            case OP_NEWOBJ: {
                ValuePtr args = pop();
                ValuePtr callable = pop();
                push(call(callable, args));
                break;
            }
            case OP_BUILD: {
                ValuePtr state = pop();
                build(top(), state);
                break;
            }

            default: {
                char hex[8];
                std::snprintf(hex, sizeof(hex), "0x%02x", op);
                pos_--;
                fail(std::string("unsupported opcode ") + hex);
            }
        }
    }
}

} // namespace

// Nested containers are released from a worklist so that a deeply nested
// stream cannot exhaust the call stack on destruction.
Value::~Value() {
    std::vector<ValuePtr> pending;
    release_children(pending);
    while (!pending.empty()) {
        ValuePtr v = std::move(pending.back());
        pending.pop_back();
        if (v && v.use_count() == 1) v->release_children(pending);
    }
}

void Value::release_children(std::vector<ValuePtr>& out) {
    for (ValuePtr& item : items) out.push_back(std::move(item));
    items.clear();
    for (auto& entry : entries) {
        out.push_back(std::move(entry.first));
        out.push_back(std::move(entry.second));
    }
    entries.clear();
    if (callable) out.push_back(std::move(callable));
    if (args) out.push_back(std::move(args));
    if (state) out.push_back(std::move(state));
}

std::string Value::callable_name() const {
    if (kind != Kind::Object || !callable || callable->kind != Kind::Global) return std::string();
    return callable->text;
}

ValuePtr make_value(Kind kind) {
    ValuePtr v = std::make_shared<Value>();
    v->kind = kind;
    return v;
}

ValuePtr loads(const std::vector<uint8_t>& buffer) {
    Unpickler unpickler(buffer);
    return unpickler.load();
}

const Value* dict_get(const Value& dict, const std::string& key) {
    if (dict.kind != Kind::Dict) return nullptr;
    for (const auto& entry : dict.entries) {
        if (entry.first->is_text() && entry.first->text == key) {
            return entry.second.get();
        }
    }
    return nullptr;
}

const char* kind_name(Kind kind) {
    switch (kind) {
        case Kind::None: return "None";
        case Kind::Bool: return "bool";
        case Kind::Int: return "int";
        case Kind::Float: return "float";
        case Kind::String: return "str";
        case Kind::Bytes: return "bytes";
        case Kind::List: return "list";
        case Kind::Tuple: return "tuple";
        case Kind::Dict: return "dict";
        case Kind::Global: return "global";
        case Kind::Object: return "object";
    }
    return "unknown";
}

} // namespace pickle
} // namespace cifar10
