#include <rowtree/frame/join.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace rowtree {

auto JoinResultIndexer::index(const RowData& row) -> Result<Key> {
    if (!inner_) {
        return make_error(ErrorKind::NullIndexer, "join result indexer has no inner indexer");
    }
    RowData projection;
    for (const auto& [column, value] : row) {
        const auto* joined = std::get_if<JoinResultPtr>(&value);
        if (joined == nullptr || *joined == nullptr) {
            projection.emplace(column, value);
            continue;
        }
        const JoinResult& jr = **joined;
        if (jr.left.has_value()) {
            projection.emplace(column, *jr.left);
        } else if (jr.right.has_value()) {
            projection.emplace(column, *jr.right);
        } else {
            projection.emplace(column, std::monostate{});
        }
    }
    return inner_->index(projection);
}

auto JoinResultIndexer::clone() const -> IndexerPtr {
    return std::make_shared<JoinResultIndexer>(inner_ ? inner_->clone() : nullptr);
}

auto join(const Frame& left, const Frame& right) -> Result<Frame> {
    if (!left.indexer()) {
        return make_error(ErrorKind::NullIndexer, "cannot join a frame without an indexer");
    }
    Frame joined(std::make_shared<JoinResultIndexer>(left.indexer()->clone()));

    auto left_rows = left.range();
    if (!left_rows) {
        return std::unexpected(std::move(left_rows.error()));
    }
    for (const auto& row : *left_rows) {
        RowData projected;
        for (const auto& [column, value] : *row) {
            projected.emplace(column, make_join_result(value, std::nullopt));
        }
        auto put = joined.put(std::move(projected));
        if (!put) {
            return std::unexpected(std::move(put.error()));
        }
    }

    auto right_rows = right.range();
    if (!right_rows) {
        return std::unexpected(std::move(right_rows.error()));
    }
    for (const auto& row : *right_rows) {
        auto existing = joined.get(*row);
        if (!existing) {
            return std::unexpected(std::move(existing.error()));
        }
        RowData projected = *existing == nullptr ? RowData{} : **existing;

        for (const auto& [column, value] : *row) {
            auto it = projected.find(column);
            if (it == projected.end()) {
                projected.emplace(column, make_join_result(std::nullopt, value));
                continue;
            }
            const auto* pair = std::get_if<JoinResultPtr>(&it->second);
            if (pair == nullptr || *pair == nullptr) {
                return make_error(ErrorKind::StructuralJoinError,
                                  fmt::format("column \"{}\" in {} is not a join result", column,
                                              to_string(it->second)),
                                  column);
            }
            it->second = make_join_result((*pair)->left, value);
        }

        auto put = joined.put(std::move(projected));
        if (!put) {
            return std::unexpected(std::move(put.error()));
        }
    }

    spdlog::debug("join: {} left rows, {} right rows -> {} keys", left.size(), right.size(),
                  joined.size());
    return joined;
}

auto join_result(const RowData& row, std::string_view column) -> Result<JoinResultPtr> {
    auto it = row.find(column);
    if (it == row.end()) {
        return make_error(ErrorKind::StructuralJoinError,
                          fmt::format("joined row has no column \"{}\"", column),
                          std::string(column));
    }
    const auto* pair = std::get_if<JoinResultPtr>(&it->second);
    if (pair == nullptr || *pair == nullptr) {
        return make_error(ErrorKind::StructuralJoinError,
                          fmt::format("column \"{}\" holds {} value {}, not a join result", column,
                                      kind_name(kind_of(it->second)), to_string(it->second)),
                          std::string(column));
    }
    return *pair;
}

}  // namespace rowtree
