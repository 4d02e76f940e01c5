#include <rowtree/frame/frame.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace rowtree {

auto greater_or_equal(RowData probe) -> RangeBounds {
    return RangeBounds{.greater_or_equal = std::move(probe), .less_than = std::nullopt};
}

auto less_than(RowData probe) -> RangeBounds {
    return RangeBounds{.greater_or_equal = std::nullopt, .less_than = std::move(probe)};
}

auto operator&(RangeBounds lhs, RangeBounds rhs) -> RangeBounds {
    if (rhs.greater_or_equal.has_value()) {
        lhs.greater_or_equal = std::move(rhs.greater_or_equal);
    }
    if (rhs.less_than.has_value()) {
        lhs.less_than = std::move(rhs.less_than);
    }
    return lhs;
}

Frame::Frame(IndexerPtr indexer) : indexer_(std::move(indexer)) {}

auto Frame::put(RowData data) -> Result<Row> {
    return put(make_row(std::move(data)));
}

auto Frame::put(Row row) -> Result<Row> {
    if (row == nullptr) {
        return make_error(ErrorKind::NullRow, "cannot put a null row");
    }
    auto key = key_of(*row);
    if (!key) {
        return std::unexpected(std::move(key.error()));
    }
    return insert_keyed(std::move(*key), std::move(row));
}

auto Frame::key_of(const RowData& row) const -> Result<Key> {
    if (!indexer_) {
        return make_error(ErrorKind::NullIndexer, "frame has no indexer");
    }
    return indexer_->index(row);
}

auto Frame::insert_keyed(Key key, Row row) -> Result<Row> {
    auto previous = tree_.insert_or_assign(std::move(key), std::move(row));
    if (!previous) {
        return std::unexpected(std::move(previous.error()));
    }
    return previous->value_or(nullptr);
}

auto Frame::get(const RowData& probe) const -> Result<Row> {
    auto key = key_of(probe);
    if (!key) {
        return std::unexpected(std::move(key.error()));
    }
    auto found = tree_.find(*key);
    if (!found) {
        return std::unexpected(std::move(found.error()));
    }
    if (*found == nullptr) {
        return Row{};
    }
    return **found;
}

auto Frame::pop(const RowData& probe) -> Result<Row> {
    auto key = key_of(probe);
    if (!key) {
        return std::unexpected(std::move(key.error()));
    }
    auto removed = tree_.erase(*key);
    if (!removed) {
        return std::unexpected(std::move(removed.error()));
    }
    return removed->value_or(nullptr);
}

auto Frame::resolve(const RangeBounds& bounds) const -> Result<ResolvedBounds> {
    ResolvedBounds resolved;
    if (bounds.greater_or_equal.has_value()) {
        auto key = key_of(*bounds.greater_or_equal);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        resolved.lower = std::move(*key);
    }
    if (bounds.less_than.has_value()) {
        auto key = key_of(*bounds.less_than);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        resolved.upper = std::move(*key);
    }
    return resolved;
}

auto Frame::range(const RangeBounds& bounds) const -> Result<std::vector<Row>> {
    std::vector<Row> rows;
    auto visited = for_range(bounds, [&rows](const Row& row) -> Result<Visit> {
        rows.push_back(row);
        return Visit::Continue;
    });
    if (!visited) {
        return std::unexpected(std::move(visited.error()));
    }
    return rows;
}

auto Frame::for_range(const RangeBounds& bounds, const RowAction& action) const
    -> Result<std::size_t> {
    auto resolved = resolve(bounds);
    if (!resolved) {
        return std::unexpected(std::move(resolved.error()));
    }
    const Key* lower = resolved->lower ? &*resolved->lower : nullptr;
    const Key* upper = resolved->upper ? &*resolved->upper : nullptr;

    std::size_t visited = 0;
    auto status =
        tree_.ascend(lower, upper, [&](const Key&, const Row& row) -> Result<bool> {
            auto next = action(row);
            if (!next) {
                return std::unexpected(std::move(next.error()));
            }
            if (*next == Visit::Stop) {
                return false;
            }
            ++visited;
            return true;
        });
    if (!status) {
        return std::unexpected(std::move(status.error()));
    }
    return visited;
}

auto Frame::pop_range(const RangeBounds& bounds) -> Result<std::vector<Row>> {
    return pop_range(bounds, [](const Row&) -> Result<Visit> { return Visit::Continue; });
}

auto Frame::pop_range(const RangeBounds& bounds, const RowAction& action)
    -> Result<std::vector<Row>> {
    auto resolved = resolve(bounds);
    if (!resolved) {
        return std::unexpected(std::move(resolved.error()));
    }
    const Key* lower = resolved->lower ? &*resolved->lower : nullptr;
    const Key* upper = resolved->upper ? &*resolved->upper : nullptr;

    // Select first; the tree cannot be modified while it is being walked.
    std::vector<Key> keys;
    std::vector<Row> rows;
    auto status =
        tree_.ascend(lower, upper, [&](const Key& key, const Row& row) -> Result<bool> {
            auto next = action(row);
            if (!next) {
                return std::unexpected(std::move(next.error()));
            }
            if (*next == Visit::Stop) {
                return false;
            }
            keys.push_back(key);
            rows.push_back(row);
            return true;
        });

    for (const auto& key : keys) {
        // Keys come straight from the tree, so they compare cleanly.
        auto removed = tree_.erase(key);
        if (!removed) {
            return std::unexpected(std::move(removed.error()));
        }
    }
    spdlog::debug("pop_range removed {} rows, {} remain", keys.size(), tree_.size());

    if (!status) {
        return std::unexpected(std::move(status.error()));
    }
    return rows;
}

auto Frame::with_indexer(IndexerPtr indexer) const -> Result<Frame> {
    Frame reindexed(std::move(indexer));
    auto status = tree_.ascend(nullptr, nullptr, [&reindexed](const Key&, const Row& row)
                                                     -> Result<bool> {
        auto previous = reindexed.put(row);
        if (!previous) {
            return std::unexpected(std::move(previous.error()));
        }
        return true;
    });
    if (!status) {
        return std::unexpected(std::move(status.error()));
    }
    if (reindexed.size() != size()) {
        spdlog::debug("with_indexer collapsed {} rows into {} keys", size(), reindexed.size());
    }
    return reindexed;
}

}  // namespace rowtree
