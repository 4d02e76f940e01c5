#pragma once

#include <rowtree/core/error.hpp>
#include <rowtree/frame/frame.hpp>
#include <rowtree/index/indexer.hpp>

#include <utility>

namespace rowtree {

/// Name of the single synthetic column in a grouped frame.
inline constexpr const char* kGroupColumn = "Group";

/// Indexer of a grouped frame.
///
/// Keys come from the grouping indexer applied to a member row, not to the
/// synthetic column: a probe holding a Group in kGroupColumn is indexed by
/// its first row, any other probe is handed to the grouping indexer as-is.
class GroupIndexer final : public Indexer {
   public:
    explicit GroupIndexer(IndexerPtr inner) : inner_(std::move(inner)) {}

    [[nodiscard]] auto index(const RowData& row) -> Result<Key> override;
    [[nodiscard]] auto clone() const -> IndexerPtr override;

    [[nodiscard]] auto inner() const noexcept -> const IndexerPtr& { return inner_; }

   private:
    IndexerPtr inner_;
};

/// Group the rows of `source` by the key `indexer` derives from each row.
///
/// The result has one row per distinct key; that row's only column,
/// kGroupColumn, holds the source rows sharing the key in ascending source
/// order. Rows are shared with `source`, not copied, and `source` is not
/// modified. A null `indexer` is rejected with NullIndexer.
[[nodiscard]] auto group_by(const Frame& source, const IndexerPtr& indexer) -> Result<Frame>;

/// The Group held by a row of a grouped frame.
[[nodiscard]] auto group_of(const RowData& row) -> Result<GroupPtr>;

}  // namespace rowtree
