#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlreplay {

// A statement argument; monostate is SQL NULL
using Value = std::variant<std::monostate, int64_t, uint64_t, double, std::string>;
using Args = std::vector<Value>;

// Materialised result of a query, NULL cells are std::nullopt
struct Rows {
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
};

// Render a value for logging
std::string toDisplayString(const Value& value);

}  // namespace sqlreplay
