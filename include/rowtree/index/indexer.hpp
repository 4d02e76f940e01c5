#pragma once

#include <rowtree/core/error.hpp>
#include <rowtree/core/key.hpp>
#include <rowtree/core/value.hpp>

#include <robin_hood.h>

#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rowtree {

class Indexer;
using IndexerPtr = std::shared_ptr<Indexer>;

/// Maps a row (or a partial probe row) to its Key.
///
/// Implementations may keep state between calls; the built-in
/// ColumnIndexer remembers per-column types. Indexers are not thread safe.
class Indexer {
   public:
    Indexer() = default;
    Indexer(const Indexer&) = default;
    Indexer(Indexer&&) = default;
    auto operator=(const Indexer&) -> Indexer& = default;
    auto operator=(Indexer&&) -> Indexer& = default;
    virtual ~Indexer() = default;

    [[nodiscard]] virtual auto index(const RowData& row) -> Result<Key> = 0;

    /// Independent copy, including any type memory gathered so far.
    [[nodiscard]] virtual auto clone() const -> IndexerPtr = 0;
};

/// Projects a fixed, ordered list of columns into a key.
///
/// The first non-null value seen for a column fixes that column's kind for
/// the lifetime of the indexer; later rows presenting another kind fail with
/// TypeDrift. Kinds are only recorded once the whole row indexes cleanly.
class ColumnIndexer final : public Indexer {
   public:
    explicit ColumnIndexer(std::vector<std::string> columns);

    [[nodiscard]] auto index(const RowData& row) -> Result<Key> override;
    [[nodiscard]] auto clone() const -> IndexerPtr override;

    [[nodiscard]] auto columns() const noexcept -> const std::vector<std::string>& {
        return columns_;
    }

    /// Kind fixed for `column`, if any row has fixed it yet.
    [[nodiscard]] auto fixed_kind(std::string_view column) const -> std::optional<ValueKind>;

   private:
    std::vector<std::string> columns_;
    robin_hood::unordered_flat_map<std::string, ValueKind> kinds_;
};

/// Adapts an arbitrary callable into an Indexer.
class FunctionIndexer final : public Indexer {
   public:
    using Fn = std::function<Result<Key>(const RowData&)>;

    explicit FunctionIndexer(Fn fn) : fn_(std::move(fn)) {}

    [[nodiscard]] auto index(const RowData& row) -> Result<Key> override { return fn_(row); }

    /// Copies the callable; state it captures by reference stays shared.
    [[nodiscard]] auto clone() const -> IndexerPtr override {
        return std::make_shared<FunctionIndexer>(fn_);
    }

   private:
    Fn fn_;
};

[[nodiscard]] auto make_column_indexer(std::vector<std::string> columns)
    -> std::shared_ptr<ColumnIndexer>;
[[nodiscard]] auto make_column_indexer(std::initializer_list<std::string> columns)
    -> std::shared_ptr<ColumnIndexer>;

[[nodiscard]] auto make_function_indexer(FunctionIndexer::Fn fn) -> IndexerPtr;

}  // namespace rowtree
