#include <rowtree/frame/group.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rowtree {

auto GroupIndexer::index(const RowData& row) -> Result<Key> {
    if (!inner_) {
        return make_error(ErrorKind::NullIndexer, "group indexer has no inner indexer");
    }
    auto it = row.find(kGroupColumn);
    if (it == row.end()) {
        return inner_->index(row);
    }
    const auto* group = std::get_if<GroupPtr>(&it->second);
    if (group == nullptr) {
        return inner_->index(row);
    }
    if (*group == nullptr || (*group)->empty()) {
        return make_error(ErrorKind::EmptyGroup, "cannot index an empty group", kGroupColumn);
    }
    const Row& first = (*group)->rows.front();
    if (first == nullptr) {
        return make_error(ErrorKind::NullRow, "group starts with a null row", kGroupColumn);
    }
    return inner_->index(*first);
}

auto GroupIndexer::clone() const -> IndexerPtr {
    return std::make_shared<GroupIndexer>(inner_ ? inner_->clone() : nullptr);
}

auto group_by(const Frame& source, const IndexerPtr& indexer) -> Result<Frame> {
    if (!indexer) {
        return make_error(ErrorKind::NullIndexer, "group_by needs an indexer");
    }
    auto rows = source.range();
    if (!rows) {
        return std::unexpected(std::move(rows.error()));
    }

    // Accumulate first so each group is appended to in place.
    OrderedTree<Key, std::vector<Row>, KeyCompare> groups;
    for (const auto& row : *rows) {
        auto key = indexer->index(*row);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        auto found = groups.find(*key);
        if (!found) {
            return std::unexpected(std::move(found.error()));
        }
        if (*found != nullptr) {
            (*found)->push_back(row);
            continue;
        }
        auto inserted = groups.insert_or_assign(std::move(*key), std::vector<Row>{row});
        if (!inserted) {
            return std::unexpected(std::move(inserted.error()));
        }
    }

    std::vector<std::pair<const Key*, const std::vector<Row>*>> ordered;
    ordered.reserve(groups.size());
    auto status = groups.ascend(nullptr, nullptr,
                                [&ordered](const Key& key, const std::vector<Row>& members)
                                    -> Result<bool> {
                                    ordered.emplace_back(&key, &members);
                                    return true;
                                });
    if (!status) {
        return std::unexpected(std::move(status.error()));
    }

    // Keys were produced by `indexer`, which is what GroupIndexer delegates to.
    Frame grouped(std::make_shared<GroupIndexer>(indexer));
    for (const auto& [key, members] : ordered) {
        RowData data;
        data.emplace(kGroupColumn, make_group(*members));
        auto put = grouped.insert_keyed(*key, make_row(std::move(data)));
        if (!put) {
            return std::unexpected(std::move(put.error()));
        }
    }

    spdlog::debug("group_by: {} rows -> {} groups", source.size(), grouped.size());
    return grouped;
}

auto group_of(const RowData& row) -> Result<GroupPtr> {
    auto it = row.find(kGroupColumn);
    if (it == row.end()) {
        return make_error(ErrorKind::StructuralGroupError,
                          fmt::format("row {} has no \"{}\" column", to_string(row), kGroupColumn),
                          kGroupColumn);
    }
    const auto* group = std::get_if<GroupPtr>(&it->second);
    if (group == nullptr || *group == nullptr) {
        return make_error(ErrorKind::StructuralGroupError,
                          fmt::format("column \"{}\" holds {} value {}, not a group", kGroupColumn,
                                      kind_name(kind_of(it->second)), to_string(it->second)),
                          kGroupColumn);
    }
    return *group;
}

}  // namespace rowtree
