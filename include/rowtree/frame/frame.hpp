#pragma once

#include <rowtree/core/error.hpp>
#include <rowtree/core/key.hpp>
#include <rowtree/core/ordered_tree.hpp>
#include <rowtree/core/value.hpp>
#include <rowtree/index/indexer.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace rowtree {

/// Bounds for range scans. Each bound is a probe row that is indexed
/// through the frame's indexer; a missing bound is unbounded on that side.
struct RangeBounds {
    std::optional<RowData> greater_or_equal;
    std::optional<RowData> less_than;
};

/// Lower bound (inclusive).
[[nodiscard]] auto greater_or_equal(RowData probe) -> RangeBounds;

/// Upper bound (exclusive).
[[nodiscard]] auto less_than(RowData probe) -> RangeBounds;

/// Combine two bound sets; bounds set on the right-hand side win.
[[nodiscard]] auto operator&(RangeBounds lhs, RangeBounds rhs) -> RangeBounds;

enum class Visit : std::uint8_t {
    Continue,
    Stop,
};

/// Callback for bulk traversal. Rows are handed out read-only; an error
/// aborts the traversal and is returned to the caller.
using RowAction = std::function<Result<Visit>(const Row&)>;

/// Ordered row store: a balanced tree of Key -> Row, where each key is
/// derived from its row by the frame's indexer.
///
/// Frames are move-only. Rows are shared immutable payloads, so frames
/// derived from one another (with_indexer, group_by) reference the same Row
/// objects while keeping independent trees.
class Frame {
   public:
    /// A null `indexer` is accepted, but every operation that needs a key
    /// then fails with NullIndexer.
    explicit Frame(IndexerPtr indexer);

    Frame(Frame&&) noexcept = default;
    auto operator=(Frame&&) noexcept -> Frame& = default;
    Frame(const Frame&) = delete;
    auto operator=(const Frame&) -> Frame& = delete;
    ~Frame() = default;

    /// Insert `data`, replacing any row under the same key.
    /// Returns the replaced row, or nullptr. The frame is unchanged on error;
    /// a null `row` is rejected with NullRow.
    auto put(RowData data) -> Result<Row>;
    auto put(Row row) -> Result<Row>;

    /// Row stored under the key of `probe`, or nullptr.
    [[nodiscard]] auto get(const RowData& probe) const -> Result<Row>;

    /// Like get(), but removes the entry.
    auto pop(const RowData& probe) -> Result<Row>;

    /// Rows within `bounds` in ascending key order.
    [[nodiscard]] auto range(const RangeBounds& bounds = {}) const -> Result<std::vector<Row>>;

    /// Apply `action` to each row within `bounds` in ascending key order.
    /// Returns the number of rows the action continued on.
    auto for_range(const RangeBounds& bounds, const RowAction& action) const
        -> Result<std::size_t>;

    /// Apply `fn` to each row within `bounds` in ascending key order and
    /// collect what it returns. `fn` yields a Result<T>; the first error
    /// aborts the traversal and is returned instead of the values.
    template <typename Fn>
    auto map_range(const RangeBounds& bounds, Fn&& fn) const
        -> Result<std::vector<typename std::invoke_result_t<Fn&, const Row&>::value_type>> {
        using T = typename std::invoke_result_t<Fn&, const Row&>::value_type;
        std::vector<T> results;
        auto visited = for_range(bounds, [&results, &fn](const Row& row) -> Result<Visit> {
            auto mapped = fn(row);
            if (!mapped) {
                return std::unexpected(std::move(mapped.error()));
            }
            results.push_back(std::move(*mapped));
            return Visit::Continue;
        });
        if (!visited) {
            return std::unexpected(std::move(visited.error()));
        }
        return results;
    }

    /// Remove and return every row within `bounds`.
    auto pop_range(const RangeBounds& bounds = {}) -> Result<std::vector<Row>>;

    /// Remove the rows within `bounds` that `action` continues on, stopping
    /// at the first Visit::Stop. Entries are selected first and deleted
    /// afterwards; when `action` fails the rows selected before the failure
    /// are still removed, and the error is returned.
    auto pop_range(const RangeBounds& bounds, const RowAction& action) -> Result<std::vector<Row>>;

    /// A new frame holding the same rows keyed by `indexer`. Rows that
    /// collide under the new indexer overwrite one another in ascending
    /// order of this frame.
    [[nodiscard]] auto with_indexer(IndexerPtr indexer) const -> Result<Frame>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return tree_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return tree_.empty(); }
    [[nodiscard]] auto indexer() const noexcept -> const IndexerPtr& { return indexer_; }

   private:
    using Tree = OrderedTree<Key, Row, KeyCompare>;

    friend auto group_by(const Frame& source, const IndexerPtr& indexer) -> Result<Frame>;

    struct ResolvedBounds {
        std::optional<Key> lower;
        std::optional<Key> upper;
    };

    [[nodiscard]] auto key_of(const RowData& row) const -> Result<Key>;
    [[nodiscard]] auto resolve(const RangeBounds& bounds) const -> Result<ResolvedBounds>;
    auto insert_keyed(Key key, Row row) -> Result<Row>;

    IndexerPtr indexer_;
    Tree tree_;
};

}  // namespace rowtree
