#include <rowtree/index/indexer.hpp>

#include <fmt/format.h>

#include <utility>

namespace rowtree {

ColumnIndexer::ColumnIndexer(std::vector<std::string> columns) : columns_(std::move(columns)) {
    kinds_.reserve(columns_.size());
}

auto ColumnIndexer::index(const RowData& row) -> Result<Key> {
    std::vector<Value> values;
    values.reserve(columns_.size());
    // Kinds seen for the first time in this row; committed only on success.
    std::vector<std::pair<const std::string*, ValueKind>> newly_fixed;

    for (const auto& column : columns_) {
        auto it = row.find(column);
        if (it == row.end()) {
            return make_error(
                ErrorKind::MissingColumn,
                fmt::format("index {} failed; missing \"{}\"", to_string(row), column), column);
        }
        const Value& value = it->second;
        if (!is_null(value)) {
            const ValueKind observed = kind_of(value);
            if (auto fixed = kinds_.find(column); fixed != kinds_.end()) {
                if (fixed->second != observed) {
                    return make_error(
                        ErrorKind::TypeDrift,
                        fmt::format("index {} failed; \"{}\" has type {} but saw {} of type {}",
                                    to_string(row), column, kind_name(fixed->second),
                                    to_string(value), kind_name(observed)),
                        column);
                }
            } else {
                newly_fixed.emplace_back(&column, observed);
            }
        }
        values.push_back(value);
    }

    auto key = make_key(values);
    if (!key) {
        return key;
    }
    for (const auto& [column, kind] : newly_fixed) {
        kinds_.emplace(*column, kind);
    }
    return key;
}

auto ColumnIndexer::clone() const -> IndexerPtr {
    return std::make_shared<ColumnIndexer>(*this);
}

auto ColumnIndexer::fixed_kind(std::string_view column) const -> std::optional<ValueKind> {
    if (auto it = kinds_.find(std::string(column)); it != kinds_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto make_column_indexer(std::vector<std::string> columns) -> std::shared_ptr<ColumnIndexer> {
    return std::make_shared<ColumnIndexer>(std::move(columns));
}

auto make_column_indexer(std::initializer_list<std::string> columns)
    -> std::shared_ptr<ColumnIndexer> {
    return std::make_shared<ColumnIndexer>(std::vector<std::string>(columns));
}

auto make_function_indexer(FunctionIndexer::Fn fn) -> IndexerPtr {
    return std::make_shared<FunctionIndexer>(std::move(fn));
}

}  // namespace rowtree
