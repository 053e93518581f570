#include "datasets.hpp"
#include "sqlite_util.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <set>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace sandlot {

// ── Column naming ────────────────────────────────────────────────

// Headers become plain identifiers so code units can name them in fetch().
static std::string column_identifier(const std::string& header, size_t index) {
    std::string out;
    for (char c : trim(header)) {
        out += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
    }
    if (out.empty()) return "column_" + std::to_string(index + 1);
    if (std::isdigit(static_cast<unsigned char>(out[0]))) out = "_" + out;
    return out;
}

static void dedupe_columns(std::vector<ColumnInfo>& columns) {
    std::set<std::string> used;
    for (auto& col : columns) {
        std::string name = col.column_name;
        for (int suffix = 2; used.count(name); ++suffix) {
            name = col.column_name + "_" + std::to_string(suffix);
        }
        col.column_name = name;
        used.insert(name);
    }
}

// ── CSV ──────────────────────────────────────────────────────────

static std::vector<std::vector<std::string>> split_csv_records(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    size_t i = 0;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3; // BOM

    auto end_record = [&]() {
        if (field_started || !record.empty()) {
            record.push_back(field);
            records.push_back(std::move(record));
        }
        record.clear();
        field.clear();
        field_started = false;
    };

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        switch (c) {
            case '"':
                in_quotes = true;
                field_started = true;
                break;
            case ',':
                record.push_back(field);
                field.clear();
                field_started = true;
                break;
            case '\r':
                break;
            case '\n':
                end_record();
                break;
            default:
                field += c;
                field_started = true;
                break;
        }
    }
    if (in_quotes) throw std::runtime_error("CSV: unterminated quoted field");
    end_record();
    return records;
}

static bool parse_int_cell(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

static bool parse_real_cell(const std::string& s, double& out) {
    if (s.empty()) return false;
    if (!std::isdigit(static_cast<unsigned char>(s.back())) && s.back() != '.') return false; // no "inf", "nan"
    if (s.find_first_of("xXpP") != std::string::npos) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (*end != '\0') return false;
    out = v;
    return true;
}

TableData parse_csv(const std::string& text) {
    auto records = split_csv_records(text);
    if (records.empty()) throw std::runtime_error("CSV: missing header row");

    TableData table;
    const auto& header = records.front();
    for (size_t c = 0; c < header.size(); ++c) {
        table.columns.push_back({column_identifier(header[c], c), "TEXT", true});
    }
    dedupe_columns(table.columns);

    const size_t ncols = header.size();
    std::vector<bool> all_int(ncols, true);
    std::vector<bool> all_real(ncols, true);
    for (size_t r = 1; r < records.size(); ++r) {
        const auto& record = records[r];
        if (record.size() != ncols) {
            throw std::runtime_error("CSV: row " + std::to_string(r + 1) + " has " +
                                     std::to_string(record.size()) + " fields, expected " +
                                     std::to_string(ncols));
        }
        for (size_t c = 0; c < ncols; ++c) {
            std::string cell = trim(record[c]);
            if (cell.empty()) continue;
            int64_t i;
            double d;
            if (!parse_int_cell(cell, i)) all_int[c] = false;
            if (!parse_real_cell(cell, d)) all_real[c] = false;
        }
    }
    for (size_t c = 0; c < ncols; ++c) {
        table.columns[c].column_type = all_int[c] ? "INTEGER" : all_real[c] ? "REAL" : "TEXT";
    }

    table.rows.reserve(records.size() - 1);
    for (size_t r = 1; r < records.size(); ++r) {
        std::vector<Value> row;
        row.reserve(ncols);
        for (size_t c = 0; c < ncols; ++c) {
            const std::string& raw = records[r][c];
            std::string cell = trim(raw);
            if (cell.empty()) {
                row.push_back(Value::none());
            } else if (all_int[c]) {
                int64_t i = 0;
                parse_int_cell(cell, i);
                row.push_back(Value::integer(i));
            } else if (all_real[c]) {
                double d = 0;
                parse_real_cell(cell, d);
                row.push_back(Value::number(d));
            } else {
                row.push_back(Value::string(raw));
            }
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

// ── JSON records ─────────────────────────────────────────────────

TableData parse_json_records(const std::string& text) {
    nlohmann::ordered_json doc = nlohmann::ordered_json::parse(text);
    if (!doc.is_array()) throw std::runtime_error("JSON dataset must be an array of objects");

    std::vector<std::string> keys;
    for (const auto& rec : doc) {
        if (!rec.is_object()) throw std::runtime_error("JSON dataset must be an array of objects");
        for (auto it = rec.begin(); it != rec.end(); ++it) {
            if (std::find(keys.begin(), keys.end(), it.key()) == keys.end()) keys.push_back(it.key());
        }
    }

    TableData table;
    std::vector<std::string> kinds(keys.size()); // "", INTEGER, REAL, TEXT
    for (size_t k = 0; k < keys.size(); ++k) {
        table.columns.push_back({column_identifier(keys[k], k), "TEXT", true});
    }
    dedupe_columns(table.columns);

    for (const auto& rec : doc) {
        std::vector<Value> row;
        row.reserve(keys.size());
        for (size_t k = 0; k < keys.size(); ++k) {
            auto it = rec.find(keys[k]);
            if (it == rec.end() || it->is_null()) {
                row.push_back(Value::none());
                continue;
            }
            const auto& v = *it;
            std::string kind;
            if (v.is_boolean()) {
                row.push_back(Value::integer(v.get<bool>() ? 1 : 0));
                kind = "INTEGER";
            } else if (v.is_number_integer()) {
                row.push_back(Value::integer(v.get<int64_t>()));
                kind = "INTEGER";
            } else if (v.is_number()) {
                row.push_back(Value::number(v.get<double>()));
                kind = "REAL";
            } else if (v.is_string()) {
                row.push_back(Value::string(v.get<std::string>()));
                kind = "TEXT";
            } else {
                row.push_back(Value::string(v.dump()));
                kind = "TEXT";
            }
            auto& seen = kinds[k];
            if (seen.empty() || seen == kind) {
                seen = kind;
            } else if ((seen == "INTEGER" && kind == "REAL") || (seen == "REAL" && kind == "INTEGER")) {
                seen = "REAL";
            } else {
                seen = "TEXT";
            }
        }
        table.rows.push_back(std::move(row));
    }
    for (size_t k = 0; k < keys.size(); ++k) {
        table.columns[k].column_type = kinds[k].empty() ? "TEXT" : kinds[k];
    }
    return table;
}

// ── Loading ──────────────────────────────────────────────────────

size_t load_dataset(SqliteAnalyticStore& store, const DatasetConfig& dataset) {
    std::string text = read_file(expand_home(dataset.path));
    TableData table;
    if (dataset.format == "csv") {
        table = parse_csv(text);
    } else if (dataset.format == "json") {
        try {
            table = parse_json_records(text);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("JSON: ") + e.what());
        }
    } else {
        throw std::runtime_error("unsupported dataset format: " + dataset.format);
    }
    store.create_table(dataset.name, table.columns, table.rows);
    std::cerr << "[datasets] Loaded " << dataset.name << ": " << table.rows.size() << " rows\n";
    return table.rows.size();
}

size_t load_datasets(SqliteAnalyticStore& store, const std::vector<DatasetConfig>& datasets) {
    size_t loaded = 0;
    for (const auto& ds : datasets) {
        try {
            load_dataset(store, ds);
            ++loaded;
        } catch (const std::exception& e) {
            std::cerr << "[datasets] Skipping " << ds.name << ": " << e.what() << "\n";
        }
    }
    std::cerr << "[datasets] " << loaded << " of " << datasets.size() << " datasets loaded\n";
    return loaded;
}

std::string build_schema_context(AnalyticStore& store, const std::vector<DatasetConfig>& datasets) {
    std::string out = "## Available Tables\n\n";
    for (const auto& ds : datasets) {
        out += "### " + ds.name + "\n";
        out += ds.description + "\n";
        try {
            auto count = store.execute_sql("SELECT COUNT(*) AS cnt FROM " + quote_identifier(ds.name));
            int64_t rows = count.empty() ? 0 : count.front().front().second.as_int();
            out += "~" + std::to_string(rows) + " rows\n\n";
            auto cols = store.describe_table(ds.name);
            out += "| Column | Type |\n";
            out += "|--------|------|\n";
            for (const auto& c : cols) {
                out += "| " + c.column_name + " | " + c.column_type + " |\n";
            }
        } catch (const std::exception&) {
            out += "(schema unavailable)\n";
        }
        out += "\n";
    }
    return out;
}

} // namespace sandlot
