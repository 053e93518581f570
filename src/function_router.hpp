#pragma once
#include "engine/value.hpp"
#include "store/analytic_store.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace sandlot {

enum class RouterErrorKind {
    UnknownFunction,
    UnknownTable,
    InvalidIdentifier,
    InvalidOrderBy,
    InvalidArgument,
    QueryFailed
};

const char* router_error_kind_to_string(RouterErrorKind kind);

class RouterError : public std::runtime_error {
public:
    RouterError(RouterErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    RouterErrorKind kind() const { return kind_; }

private:
    RouterErrorKind kind_;
};

// Maps the four data primitives a code unit may call (fetch, count,
// describe, tables) onto validated SQL against the analytic store.
// Stateless apart from the store reference; safe to share between bridges
// when the store is.
class FunctionRouter {
public:
    explicit FunctionRouter(AnalyticStore& store) : store_(store) {}

    // Throws RouterError. UnknownFunction for names other than the four
    // primitives.
    Value dispatch(const std::string& function_name,
                   const std::vector<Value>& args,
                   const KwArgs& kwargs);

    // Names code units may call, in registration order.
    static const std::vector<std::string>& function_names();

    // Per-primitive handlers, arguments already bound to the signature
    // (absent optionals are None).
    Value fetch_handler(const std::vector<Value>& bound);
    Value count_handler(const std::vector<Value>& bound);
    Value describe_handler(const std::vector<Value>& bound);
    Value tables_handler(const std::vector<Value>& bound);

private:
    std::string require_table(const Value& table);
    std::vector<std::string> run_names();
    std::vector<Row> run_query(const std::string& query);

    AnalyticStore& store_;
};

} // namespace sandlot
