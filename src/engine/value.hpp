#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace sandlot {

class Value;
struct ListObject;
struct TupleObject;
class DictObject;
struct OpaqueObject;

// Object covers everything the host cannot take apart: sets, functions,
// ranges, self-referencing containers. It carries the type name and a
// bounded repr.
enum class ValueKind {
    None, Bool, Int, Float, Str,
    List, Tuple, Dict,
    Object
};

class Value {
public:
    Value() = default;

    static Value none() { return Value(); }
    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value number(double d);
    static Value string(std::string s);
    static Value list(std::vector<Value> items = {});
    static Value tuple(std::vector<Value> items = {});
    static Value dict();
    static Value object(std::string type_name, std::string text);

    ValueKind kind() const;
    const char* type_name() const;

    bool is_none() const { return kind() == ValueKind::None; }
    bool is_bool() const { return kind() == ValueKind::Bool; }
    bool is_int() const { return kind() == ValueKind::Int; }
    bool is_float() const { return kind() == ValueKind::Float; }
    bool is_str() const { return kind() == ValueKind::Str; }
    bool is_list() const { return kind() == ValueKind::List; }
    bool is_tuple() const { return kind() == ValueKind::Tuple; }
    bool is_dict() const { return kind() == ValueKind::Dict; }
    bool is_object() const { return kind() == ValueKind::Object; }
    bool is_sequence() const { return is_list() || is_tuple(); }
    // int or bool (bool is an integer subtype)
    bool is_integral() const { return is_int() || is_bool(); }
    bool is_numeric() const { return is_int() || is_bool() || is_float(); }

    bool as_bool() const;
    int64_t as_int() const;      // int or bool
    double as_float() const;     // any numeric
    const std::string& as_str() const;
    std::vector<Value>& items() const;  // list or tuple elements
    DictObject& as_dict() const;
    const OpaqueObject& as_object() const;

    // Address of the shared container for lists, tuples and dicts, else nullptr.
    const void* identity() const;

    std::string str() const;
    std::string repr() const;

private:
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string,
                                 std::shared_ptr<ListObject>,
                                 std::shared_ptr<TupleObject>,
                                 std::shared_ptr<DictObject>,
                                 std::shared_ptr<OpaqueObject>>;
    Storage data_;
};

// Keyword arguments of a call, in call order.
using KwArgs = std::vector<std::pair<std::string, Value>>;

struct ListObject {
    std::vector<Value> items;
};

struct TupleObject {
    std::vector<Value> items;
};

struct OpaqueObject {
    std::string type_name;
    std::string text;
};

struct ValueHash {
    size_t operator()(const Value& v) const;
};

struct ValueEqual {
    bool operator()(const Value& a, const Value& b) const;
};

// Insertion-ordered mapping with hashed lookup.
class DictObject {
public:
    const Value* find(const Value& key) const;
    Value* find(const Value& key);
    void set(const Value& key, Value value);
    size_t size() const { return entries_.size(); }
    const std::vector<std::pair<Value, Value>>& entries() const { return entries_; }

private:
    std::vector<std::pair<Value, Value>> entries_;
    std::unordered_map<Value, size_t, ValueHash, ValueEqual> index_;
};

// Python equality semantics (1 == 1.0 == True, element-wise containers).
bool values_equal(const Value& a, const Value& b);

// Shortest text that round-trips the double, Python repr style ("0.1", "3.0", "1e+16").
std::string format_float(double d);

// Strings are measured by code point.
size_t utf8_length(const std::string& s);

// Conversion to JSON. Dict keys become their str() text. Throws
// std::invalid_argument for values JSON cannot represent: objects, tuple
// keys, containers that contain themselves, nesting deeper than 256.
nlohmann::ordered_json to_json(const Value& v);

Value from_json(const nlohmann::ordered_json& j);
Value from_json(const nlohmann::json& j);

} // namespace sandlot
