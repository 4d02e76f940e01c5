#include <rowtree/core/value.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cmath>
#include <type_traits>

namespace rowtree {

namespace {

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    auto tod = tp - day;
    hh_mm_ss<nanoseconds> hms{tod};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

auto format_double(double v) -> std::string {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "Inf" : "-Inf";
    }
    return fmt::format("{:g}", v);
}

auto format_join_result(const JoinResult& jr) -> std::string {
    if (jr.left.has_value() && jr.right.has_value()) {
        return fmt::format("JoinResult{{Left: {}, Right: {}}}", to_string(*jr.left),
                           to_string(*jr.right));
    }
    if (jr.left.has_value()) {
        return fmt::format("JoinResult{{Left: {}}}", to_string(*jr.left));
    }
    if (jr.right.has_value()) {
        return fmt::format("JoinResult{{Right: {}}}", to_string(*jr.right));
    }
    return "JoinResult{}";
}

}  // namespace

auto kind_name(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Int:
            return "int";
        case ValueKind::Double:
            return "double";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::String:
            return "string";
        case ValueKind::Date:
            return "date";
        case ValueKind::Timestamp:
            return "timestamp";
        case ValueKind::JoinResult:
            return "join result";
        case ValueKind::Group:
            return "group";
    }
    return "unknown";
}

auto to_string(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else if constexpr (std::is_same_v<T, JoinResultPtr>) {
                return v == nullptr ? "JoinResult{}" : format_join_result(*v);
            } else if constexpr (std::is_same_v<T, GroupPtr>) {
                return fmt::format("Group[{}]", v == nullptr ? 0 : v->size());
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto to_string(const RowData& row) -> std::string {
    std::string out = "{";
    bool first = true;
    for (const auto& [name, value] : row) {
        if (!first) {
            out.append(", ");
        }
        first = false;
        out.append(fmt::format("{}: {}", name, to_string(value)));
    }
    out.push_back('}');
    return out;
}

auto make_row(std::initializer_list<RowData::value_type> cells) -> Row {
    return std::make_shared<const RowData>(cells);
}

auto make_row(RowData data) -> Row {
    return std::make_shared<const RowData>(std::move(data));
}

auto make_join_result(std::optional<Value> left, std::optional<Value> right) -> JoinResultPtr {
    return std::make_shared<const JoinResult>(
        JoinResult{.left = std::move(left), .right = std::move(right)});
}

auto make_group(std::vector<Row> rows) -> GroupPtr {
    return std::make_shared<const Group>(Group{.rows = std::move(rows)});
}

}  // namespace rowtree
