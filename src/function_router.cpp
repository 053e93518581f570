#include "function_router.hpp"
#include "store/sqlite_util.hpp"
#include <cmath>
#include <iostream>
#include <regex>

namespace sandlot {

const char* router_error_kind_to_string(RouterErrorKind kind) {
    switch (kind) {
        case RouterErrorKind::UnknownFunction:   return "UnknownFunction";
        case RouterErrorKind::UnknownTable:      return "UnknownTable";
        case RouterErrorKind::InvalidIdentifier: return "InvalidIdentifier";
        case RouterErrorKind::InvalidOrderBy:    return "InvalidOrderBy";
        case RouterErrorKind::InvalidArgument:   return "InvalidArgument";
        case RouterErrorKind::QueryFailed:       return "QueryFailed";
    }
    return "RouterError";
}

namespace {

struct Signature {
    const char* name;
    std::vector<const char*> params;
    size_t required;
    Value (FunctionRouter::*handler)(const std::vector<Value>&);
};

[[noreturn]] void invalid_argument(const std::string& message) {
    throw RouterError(RouterErrorKind::InvalidArgument, message);
}

// Positional then keyword binding; absent optional parameters are None.
std::vector<Value> bind(const Signature& sig, const std::vector<Value>& args, const KwArgs& kwargs) {
    const std::string fname = sig.name;
    if (args.size() > sig.params.size()) {
        invalid_argument(fname + "() takes " + std::to_string(sig.params.size()) +
                         " positional arguments but " + std::to_string(args.size()) + " were given");
    }
    std::vector<Value> bound(sig.params.size());
    std::vector<bool> set(sig.params.size(), false);
    for (size_t i = 0; i < args.size(); ++i) {
        bound[i] = args[i];
        set[i] = true;
    }
    for (const auto& [key, value] : kwargs) {
        size_t idx = sig.params.size();
        for (size_t i = 0; i < sig.params.size(); ++i) {
            if (key == sig.params[i]) idx = i;
        }
        if (idx == sig.params.size()) {
            invalid_argument(fname + "() got an unexpected keyword argument '" + key + "'");
        }
        if (set[idx]) invalid_argument(fname + "() got multiple values for argument '" + key + "'");
        bound[idx] = value;
        set[idx] = true;
    }
    for (size_t i = 0; i < sig.required; ++i) {
        if (!set[i]) {
            invalid_argument(fname + "() missing required argument: '" + sig.params[i] + "'");
        }
    }
    return bound;
}

const std::vector<Signature>& signatures() {
    static const std::vector<Signature> table = {
        {"fetch", {"table", "columns", "where", "order_by", "limit"}, 1, &FunctionRouter::fetch_handler},
        {"count", {"table", "where"}, 1, &FunctionRouter::count_handler},
        {"describe", {"table"}, 1, &FunctionRouter::describe_handler},
        {"tables", {}, 0, &FunctionRouter::tables_handler},
    };
    return table;
}

bool is_identifier(const std::string& s) {
    static const std::regex pattern("^[A-Za-z_][A-Za-z0-9_]*$");
    return std::regex_match(s, pattern);
}

bool is_order_by(const std::string& s) {
    static const std::regex pattern("^[A-Za-z_][A-Za-z0-9_]*(\\s+(ASC|DESC))?$", std::regex::icase);
    return std::regex_match(s, pattern);
}

std::string escape_literal(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        if (c == '\'') out += '\'';
        out += c;
    }
    return out;
}

// " WHERE a = 'x' AND b IS NULL", or "" for no predicates.
std::string where_clause(const Value& where) {
    if (where.is_none()) return "";
    if (!where.is_dict()) {
        invalid_argument(std::string("where must be a dict, not ") + where.type_name());
    }
    std::vector<std::string> conditions;
    for (const auto& [key, val] : where.as_dict().entries()) {
        if (!key.is_str() || !is_identifier(key.as_str())) {
            throw RouterError(RouterErrorKind::InvalidIdentifier, "Invalid column name: " + key.str());
        }
        const std::string& col = key.as_str();
        switch (val.kind()) {
            case ValueKind::Str:
                conditions.push_back(col + " = '" + escape_literal(val.as_str()) + "'");
                break;
            case ValueKind::Bool:
                conditions.push_back(col + " = " + (val.as_bool() ? "1" : "0"));
                break;
            case ValueKind::Int:
                conditions.push_back(col + " = " + std::to_string(val.as_int()));
                break;
            case ValueKind::Float:
                if (!std::isfinite(val.as_float())) {
                    invalid_argument("where value for " + col + " must be finite");
                }
                conditions.push_back(col + " = " + format_float(val.as_float()));
                break;
            case ValueKind::None:
                conditions.push_back(col + " IS NULL");
                break;
            default:
                invalid_argument("where value for " + col + " must be a str, int, float, bool or None, not " +
                                 val.type_name());
        }
    }
    if (conditions.empty()) return "";
    std::string out = " WHERE ";
    for (size_t i = 0; i < conditions.size(); ++i) {
        if (i > 0) out += " AND ";
        out += conditions[i];
    }
    return out;
}

int64_t coerce_limit(const Value& limit) {
    switch (limit.kind()) {
        case ValueKind::Int:
        case ValueKind::Bool:
            return limit.as_int();
        case ValueKind::Float: {
            double d = limit.as_float();
            if (!std::isfinite(d) || std::fabs(d) >= 9.2e18) invalid_argument("limit must be an integer");
            return static_cast<int64_t>(d);
        }
        case ValueKind::Str: {
            const std::string& s = limit.as_str();
            size_t pos = 0;
            try {
                long long v = std::stoll(s, &pos);
                if (pos == s.size()) return static_cast<int64_t>(v);
            } catch (const std::logic_error&) {
                // invalid_argument or out_of_range, reported below
            }
            invalid_argument("limit must be an integer, got " + limit.repr());
        }
        default:
            invalid_argument(std::string("limit must be an integer, not ") + limit.type_name());
    }
}

Value row_to_dict(const Row& row) {
    Value d = Value::dict();
    for (const auto& [column, value] : row) {
        d.as_dict().set(Value::string(column), value);
    }
    return d;
}

} // namespace

const std::vector<std::string>& FunctionRouter::function_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& sig : signatures()) out.emplace_back(sig.name);
        return out;
    }();
    return names;
}

Value FunctionRouter::dispatch(const std::string& function_name,
                               const std::vector<Value>& args,
                               const KwArgs& kwargs) {
    for (const auto& sig : signatures()) {
        if (function_name == sig.name) {
            auto bound = bind(sig, args, kwargs);
            return (this->*sig.handler)(bound);
        }
    }
    throw RouterError(RouterErrorKind::UnknownFunction, "Unknown external function: " + function_name);
}

std::string FunctionRouter::require_table(const Value& table) {
    if (!table.is_str()) {
        invalid_argument(std::string("table must be a str, not ") + table.type_name());
    }
    auto valid = run_names();
    for (const auto& name : valid) {
        if (name == table.as_str()) return name;
    }
    std::string available;
    for (size_t i = 0; i < valid.size(); ++i) {
        if (i > 0) available += ", ";
        available += valid[i];
    }
    throw RouterError(RouterErrorKind::UnknownTable,
                      "Unknown table: " + table.as_str() + ". Available: " + available);
}

std::vector<std::string> FunctionRouter::run_names() {
    try {
        return store_.table_names();
    } catch (const StoreError& e) {
        throw RouterError(RouterErrorKind::QueryFailed, e.what());
    }
}

std::vector<Row> FunctionRouter::run_query(const std::string& query) {
    try {
        return store_.execute_sql(query);
    } catch (const StoreError& e) {
        throw RouterError(RouterErrorKind::QueryFailed, e.what());
    }
}

Value FunctionRouter::fetch_handler(const std::vector<Value>& bound) {
    std::string table = require_table(bound[0]);
    const Value& columns = bound[1];
    const Value& where = bound[2];
    const Value& order_by = bound[3];
    const Value& limit = bound[4];

    std::string col_expr = "*";
    if (!columns.is_none()) {
        if (!columns.is_sequence()) {
            invalid_argument(std::string("columns must be a list, not ") + columns.type_name());
        }
        std::string joined;
        for (const auto& c : columns.items()) {
            if (!c.is_str()) {
                invalid_argument(std::string("column names must be str, not ") + c.type_name());
            }
            if (!is_identifier(c.as_str())) {
                throw RouterError(RouterErrorKind::InvalidIdentifier, "Invalid column name: " + c.as_str());
            }
            if (!joined.empty()) joined += ", ";
            joined += c.as_str();
        }
        if (!joined.empty()) col_expr = joined;
    }

    std::string query = "SELECT " + col_expr + " FROM " + table + where_clause(where);

    if (!order_by.is_none()) {
        if (!order_by.is_str()) {
            invalid_argument(std::string("order_by must be a str, not ") + order_by.type_name());
        }
        if (!order_by.as_str().empty()) {
            if (!is_order_by(order_by.as_str())) {
                throw RouterError(RouterErrorKind::InvalidOrderBy, "Invalid order_by: " + order_by.as_str());
            }
            query += " ORDER BY " + order_by.as_str();
        }
    }

    if (!limit.is_none()) {
        query += " LIMIT " + std::to_string(coerce_limit(limit));
    }

    std::cerr << "[router] Fetch query: " << query.substr(0, 200) << "\n";

    std::vector<Value> out;
    for (const auto& row : run_query(query)) out.push_back(row_to_dict(row));
    return Value::list(std::move(out));
}

Value FunctionRouter::count_handler(const std::vector<Value>& bound) {
    std::string table = require_table(bound[0]);
    std::string query = "SELECT COUNT(*) AS cnt FROM " + table + where_clause(bound[1]);
    auto rows = run_query(query);
    if (rows.empty() || rows.front().empty()) return Value::integer(0);
    return rows.front().front().second;
}

Value FunctionRouter::describe_handler(const std::vector<Value>& bound) {
    std::string table = require_table(bound[0]);
    std::cerr << "[router] Describing table: " << table << "\n";
    std::vector<ColumnInfo> columns;
    try {
        columns = store_.describe_table(table);
    } catch (const StoreError& e) {
        throw RouterError(RouterErrorKind::QueryFailed, e.what());
    }
    std::vector<Value> out;
    for (const auto& c : columns) {
        Value d = Value::dict();
        d.as_dict().set(Value::string("column_name"), Value::string(c.column_name));
        d.as_dict().set(Value::string("column_type"), Value::string(c.column_type));
        d.as_dict().set(Value::string("nullable"), Value::boolean(c.nullable));
        out.push_back(std::move(d));
    }
    return Value::list(std::move(out));
}

Value FunctionRouter::tables_handler(const std::vector<Value>&) {
    std::vector<Value> out;
    for (auto& name : run_names()) out.push_back(Value::string(std::move(name)));
    return Value::list(std::move(out));
}

} // namespace sandlot
