#pragma once

#include <rowtree/core/error.hpp>
#include <rowtree/frame/frame.hpp>
#include <rowtree/index/indexer.hpp>

#include <string_view>
#include <utility>

namespace rowtree {

/// Indexes rows whose columns hold JoinResult values by projecting each
/// such column to its left value (or its right value when the left side is
/// absent) and delegating to the wrapped indexer. Plain values are passed
/// through, so probes built for either input work unchanged.
class JoinResultIndexer final : public Indexer {
   public:
    explicit JoinResultIndexer(IndexerPtr inner) : inner_(std::move(inner)) {}

    [[nodiscard]] auto index(const RowData& row) -> Result<Key> override;
    [[nodiscard]] auto clone() const -> IndexerPtr override;

    [[nodiscard]] auto inner() const noexcept -> const IndexerPtr& { return inner_; }

   private:
    IndexerPtr inner_;
};

/// Outer join of two frames over the union of their keys.
///
/// The result holds one row per key of `left` or `right`; every column of
/// every row is a JoinResult whose absent side is empty. The result is
/// keyed by a JoinResultIndexer wrapping a clone of the left frame's
/// indexer, so both inputs must produce comparable keys. Neither input is
/// modified, including the type memory of its indexer.
[[nodiscard]] auto join(const Frame& left, const Frame& right) -> Result<Frame>;

/// The JoinResult stored in `column` of a joined row.
[[nodiscard]] auto join_result(const RowData& row, std::string_view column)
    -> Result<JoinResultPtr>;

}  // namespace rowtree
