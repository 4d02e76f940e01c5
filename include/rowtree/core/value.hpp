#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rowtree {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

struct JoinResult;
struct Group;

using JoinResultPtr = std::shared_ptr<const JoinResult>;
using GroupPtr = std::shared_ptr<const Group>;

/// A single cell. `std::monostate` is the null value.
///
/// Join results and groups are held by shared pointer so that the
/// recursive row -> value -> row structure stays cheap to copy.
using Value = std::variant<std::monostate, std::int64_t, double, bool, std::string, Date,
                           Timestamp, JoinResultPtr, GroupPtr>;

/// Dynamic type of a Value; the enumerators follow the variant order.
enum class ValueKind : std::uint8_t {
    Null,
    Int,
    Double,
    Bool,
    String,
    Date,
    Timestamp,
    JoinResult,
    Group,
};

/// Column name -> value for a single row.
using RowData = std::map<std::string, Value, std::less<>>;

/// Shared, immutable row payload. Frames derived from one another hold the
/// same Row objects; updating a row means putting a new one.
using Row = std::shared_ptr<const RowData>;

/// Per-column pairing produced by an outer join. An empty side was absent
/// from that input.
struct JoinResult {
    std::optional<Value> left;
    std::optional<Value> right;
};

/// Rows sharing a grouping key, in ascending order of the source frame.
struct Group {
    std::vector<Row> rows;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return rows.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return rows.empty(); }
    [[nodiscard]] auto begin() const noexcept { return rows.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return rows.cend(); }
};

[[nodiscard]] inline auto kind_of(const Value& value) noexcept -> ValueKind {
    return static_cast<ValueKind>(value.index());
}

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] auto kind_name(ValueKind kind) noexcept -> std::string_view;

/// Human-readable rendering used in diagnostics.
[[nodiscard]] auto to_string(const Value& value) -> std::string;
[[nodiscard]] auto to_string(const RowData& row) -> std::string;

/// Build a shared row from column/value pairs.
[[nodiscard]] auto make_row(std::initializer_list<RowData::value_type> cells) -> Row;
[[nodiscard]] auto make_row(RowData data) -> Row;

[[nodiscard]] auto make_join_result(std::optional<Value> left, std::optional<Value> right)
    -> JoinResultPtr;

[[nodiscard]] auto make_group(std::vector<Row> rows) -> GroupPtr;

}  // namespace rowtree
