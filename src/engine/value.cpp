#include "value.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <unordered_set>

namespace sandlot {

// ── Construction ─────────────────────────────────────────────────

Value Value::boolean(bool b) {
    Value v;
    v.data_ = b;
    return v;
}

Value Value::integer(int64_t i) {
    Value v;
    v.data_ = i;
    return v;
}

Value Value::number(double d) {
    Value v;
    v.data_ = d;
    return v;
}

Value Value::string(std::string s) {
    Value v;
    v.data_ = std::move(s);
    return v;
}

Value Value::list(std::vector<Value> items) {
    Value v;
    auto obj = std::make_shared<ListObject>();
    obj->items = std::move(items);
    v.data_ = std::move(obj);
    return v;
}

Value Value::tuple(std::vector<Value> items) {
    Value v;
    auto obj = std::make_shared<TupleObject>();
    obj->items = std::move(items);
    v.data_ = std::move(obj);
    return v;
}

Value Value::dict() {
    Value v;
    v.data_ = std::make_shared<DictObject>();
    return v;
}

Value Value::object(std::string type_name, std::string text) {
    Value v;
    v.data_ = std::make_shared<OpaqueObject>(OpaqueObject{std::move(type_name), std::move(text)});
    return v;
}

// ── Accessors ────────────────────────────────────────────────────

ValueKind Value::kind() const {
    switch (data_.index()) {
        case 0: return ValueKind::None;
        case 1: return ValueKind::Bool;
        case 2: return ValueKind::Int;
        case 3: return ValueKind::Float;
        case 4: return ValueKind::Str;
        case 5: return ValueKind::List;
        case 6: return ValueKind::Tuple;
        case 7: return ValueKind::Dict;
        default: return ValueKind::Object;
    }
}

const char* Value::type_name() const {
    switch (kind()) {
        case ValueKind::None: return "NoneType";
        case ValueKind::Bool: return "bool";
        case ValueKind::Int: return "int";
        case ValueKind::Float: return "float";
        case ValueKind::Str: return "str";
        case ValueKind::List: return "list";
        case ValueKind::Tuple: return "tuple";
        case ValueKind::Dict: return "dict";
        case ValueKind::Object: return as_object().type_name.c_str();
    }
    return "object";
}

bool Value::as_bool() const { return std::get<bool>(data_); }

int64_t Value::as_int() const {
    if (auto* b = std::get_if<bool>(&data_)) return *b ? 1 : 0;
    return std::get<int64_t>(data_);
}

double Value::as_float() const {
    if (auto* d = std::get_if<double>(&data_)) return *d;
    return static_cast<double>(as_int());
}

const std::string& Value::as_str() const { return std::get<std::string>(data_); }

std::vector<Value>& Value::items() const {
    if (auto* l = std::get_if<std::shared_ptr<ListObject>>(&data_)) return (*l)->items;
    return std::get<std::shared_ptr<TupleObject>>(data_)->items;
}

DictObject& Value::as_dict() const { return *std::get<std::shared_ptr<DictObject>>(data_); }

const OpaqueObject& Value::as_object() const { return *std::get<std::shared_ptr<OpaqueObject>>(data_); }

const void* Value::identity() const {
    switch (kind()) {
        case ValueKind::List: return std::get<std::shared_ptr<ListObject>>(data_).get();
        case ValueKind::Tuple: return std::get<std::shared_ptr<TupleObject>>(data_).get();
        case ValueKind::Dict: return std::get<std::shared_ptr<DictObject>>(data_).get();
        default: return nullptr;
    }
}

// ── Text rendering ───────────────────────────────────────────────

static constexpr int MAX_RENDER_DEPTH = 64;

static std::string quote_string(const std::string& s) {
    bool has_single = s.find('\'') != std::string::npos;
    bool has_double = s.find('"') != std::string::npos;
    char quote = (has_single && !has_double) ? '"' : '\'';

    std::string out(1, quote);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c == static_cast<unsigned char>(quote)) {
                    out += '\\';
                    out += static_cast<char>(c);
                } else if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += quote;
    return out;
}

namespace {

// Containers on the current rendering path, for "[...]" on self-reference.
class Renderer {
public:
    std::string render(const Value& v, bool as_repr, int depth) {
        if (depth > MAX_RENDER_DEPTH) return "...";
        switch (v.kind()) {
            case ValueKind::None: return "None";
            case ValueKind::Bool: return v.as_bool() ? "True" : "False";
            case ValueKind::Int: return std::to_string(v.as_int());
            case ValueKind::Float: return format_float(v.as_float());
            case ValueKind::Str: return as_repr ? quote_string(v.as_str()) : v.as_str();
            case ValueKind::Object: return v.as_object().text;
            case ValueKind::List:
            case ValueKind::Tuple:
            case ValueKind::Dict:
                break;
        }

        const void* id = v.identity();
        if (!active_.insert(id).second) {
            return v.is_list() ? "[...]" : v.is_dict() ? "{...}" : "(...)";
        }
        std::string out;
        if (v.is_dict()) {
            out = "{";
            bool first = true;
            for (const auto& [key, value] : v.as_dict().entries()) {
                if (!first) out += ", ";
                first = false;
                out += render(key, true, depth + 1) + ": " + render(value, true, depth + 1);
            }
            out += "}";
        } else {
            const auto& items = v.items();
            out = v.is_list() ? "[" : "(";
            for (size_t i = 0; i < items.size(); i++) {
                if (i > 0) out += ", ";
                out += render(items[i], true, depth + 1);
            }
            if (v.is_tuple() && items.size() == 1) out += ",";
            out += v.is_list() ? "]" : ")";
        }
        active_.erase(id);
        return out;
    }

private:
    std::unordered_set<const void*> active_;
};

} // namespace

std::string Value::str() const { return Renderer().render(*this, false, 0); }

std::string Value::repr() const { return Renderer().render(*this, true, 0); }

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    if (d == 0.0) return std::signbit(d) ? "-0.0" : "0.0";

    // Shortest scientific rendering that parses back to the same double
    char buf[64];
    for (int precision = 0; precision <= 17; precision++) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision, d);
        if (std::strtod(buf, nullptr) == d) break;
    }

    std::string sci = buf;
    bool negative = sci[0] == '-';
    if (negative) sci.erase(0, 1);
    size_t e_pos = sci.find('e');
    std::string mantissa = sci.substr(0, e_pos);
    int exponent = std::atoi(sci.c_str() + e_pos + 1);

    std::string digits;
    for (char c : mantissa) {
        if (c != '.') digits += c;
    }
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    std::string out;
    if (exponent >= -4 && exponent < 16) {
        if (exponent >= 0) {
            auto int_len = static_cast<size_t>(exponent) + 1;
            if (digits.size() <= int_len) {
                out = digits + std::string(int_len - digits.size(), '0') + ".0";
            } else {
                out = digits.substr(0, int_len) + "." + digits.substr(int_len);
            }
        } else {
            out = "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
        }
    } else {
        out = digits.substr(0, 1);
        if (digits.size() > 1) out += "." + digits.substr(1);
        char exp_buf[16];
        std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+',
                      std::abs(exponent));
        out += exp_buf;
    }
    return negative ? "-" + out : out;
}

// ── UTF-8 ────────────────────────────────────────────────────────

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) count++;
    }
    return count;
}

// ── Equality and hashing ─────────────────────────────────────────

bool values_equal(const Value& a, const Value& b) {
    if (a.is_numeric() && b.is_numeric()) {
        if (a.is_integral() && b.is_integral()) return a.as_int() == b.as_int();
        return a.as_float() == b.as_float();
    }
    if (a.kind() != b.kind()) return false;
    switch (a.kind()) {
        case ValueKind::None: return true;
        case ValueKind::Str: return a.as_str() == b.as_str();
        case ValueKind::Object:
            return a.as_object().type_name == b.as_object().type_name &&
                   a.as_object().text == b.as_object().text;
        case ValueKind::List:
        case ValueKind::Tuple: {
            if (a.identity() == b.identity()) return true;
            const auto& x = a.items();
            const auto& y = b.items();
            if (x.size() != y.size()) return false;
            for (size_t i = 0; i < x.size(); i++) {
                if (!values_equal(x[i], y[i])) return false;
            }
            return true;
        }
        case ValueKind::Dict: {
            if (a.identity() == b.identity()) return true;
            const auto& x = a.as_dict();
            const auto& y = b.as_dict();
            if (x.size() != y.size()) return false;
            for (const auto& [key, value] : x.entries()) {
                const Value* other = y.find(key);
                if (!other || !values_equal(value, *other)) return false;
            }
            return true;
        }
        default: return false;
    }
}

size_t ValueHash::operator()(const Value& v) const {
    switch (v.kind()) {
        case ValueKind::None: return 0x9e3779b9u;
        case ValueKind::Bool:
        case ValueKind::Int: return std::hash<int64_t>{}(v.as_int());
        case ValueKind::Float: {
            double d = v.as_float();
            double whole = 0.0;
            if (std::modf(d, &whole) == 0.0 && std::fabs(d) < 9.2e18) {
                return std::hash<int64_t>{}(static_cast<int64_t>(d));
            }
            return std::hash<double>{}(d);
        }
        case ValueKind::Str: return std::hash<std::string>{}(v.as_str());
        case ValueKind::Object: return std::hash<std::string>{}(v.as_object().text);
        case ValueKind::Tuple: {
            size_t h = 0x345678u;
            for (const auto& item : v.items()) {
                h = (h ^ (*this)(item)) * 1000003u;
            }
            return h;
        }
        default: return 0;
    }
}

bool ValueEqual::operator()(const Value& a, const Value& b) const {
    return values_equal(a, b);
}

// ── DictObject ───────────────────────────────────────────────────

const Value* DictObject::find(const Value& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

Value* DictObject::find(const Value& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

void DictObject::set(const Value& key, Value value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    entries_.emplace_back(key, std::move(value));
    index_.emplace(key, entries_.size() - 1);
}

// ── JSON conversion ──────────────────────────────────────────────

static constexpr int MAX_JSON_DEPTH = 256;

static std::string json_key(const Value& key) {
    switch (key.kind()) {
        case ValueKind::Str: return key.as_str();
        case ValueKind::None: return "null";
        case ValueKind::Bool: return key.as_bool() ? "true" : "false";
        case ValueKind::Int: return std::to_string(key.as_int());
        case ValueKind::Float: return format_float(key.as_float());
        default:
            throw std::invalid_argument(std::string("keys must be str, int, float, bool or None, not ") +
                                        key.type_name());
    }
}

namespace {

class JsonWriter {
public:
    nlohmann::ordered_json write(const Value& v, int depth) {
        switch (v.kind()) {
            case ValueKind::None: return nullptr;
            case ValueKind::Bool: return v.as_bool();
            case ValueKind::Int: return v.as_int();
            case ValueKind::Float: return v.as_float();
            case ValueKind::Str: return v.as_str();
            case ValueKind::Object:
                throw std::invalid_argument(std::string("Object of type ") + v.type_name() +
                                            " is not JSON serializable");
            case ValueKind::List:
            case ValueKind::Tuple:
            case ValueKind::Dict:
                break;
        }
        if (depth > MAX_JSON_DEPTH) throw std::invalid_argument("nesting too deep to serialise");

        const void* id = v.identity();
        if (!active_.insert(id).second) throw std::invalid_argument("Circular reference detected");

        nlohmann::ordered_json out;
        if (v.is_dict()) {
            out = nlohmann::ordered_json::object();
            for (const auto& [key, value] : v.as_dict().entries()) {
                out[json_key(key)] = write(value, depth + 1);
            }
        } else {
            out = nlohmann::ordered_json::array();
            for (const auto& item : v.items()) out.push_back(write(item, depth + 1));
        }
        active_.erase(id);
        return out;
    }

private:
    std::unordered_set<const void*> active_;
};

} // namespace

nlohmann::ordered_json to_json(const Value& v) { return JsonWriter().write(v, 0); }

template <typename Json>
static Value from_json_impl(const Json& j) {
    if (j.is_null()) return Value::none();
    if (j.is_boolean()) return Value::boolean(j.template get<bool>());
    if (j.is_number_unsigned()) return Value::integer(static_cast<int64_t>(j.template get<uint64_t>()));
    if (j.is_number_integer()) return Value::integer(j.template get<int64_t>());
    if (j.is_number_float()) return Value::number(j.template get<double>());
    if (j.is_string()) return Value::string(j.template get<std::string>());
    if (j.is_array()) {
        std::vector<Value> items;
        items.reserve(j.size());
        for (const auto& item : j) items.push_back(from_json_impl(item));
        return Value::list(std::move(items));
    }
    Value d = Value::dict();
    for (auto it = j.begin(); it != j.end(); ++it) {
        d.as_dict().set(Value::string(it.key()), from_json_impl(it.value()));
    }
    return d;
}

Value from_json(const nlohmann::ordered_json& j) { return from_json_impl(j); }

Value from_json(const nlohmann::json& j) { return from_json_impl(j); }

} // namespace sandlot
