#pragma once

#include <rowtree/core/error.hpp>
#include <rowtree/core/value.hpp>

#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rowtree {

/// Primitive material a scalar key may hold.
using KeyScalar = std::variant<std::int64_t, double, bool, std::string, Date, Timestamp>;

enum class KeyKind : std::uint8_t {
    None,
    Int,
    Double,
    Bool,
    String,
    Date,
    Timestamp,
    Composite,
};

[[nodiscard]] auto key_kind_name(KeyKind kind) noexcept -> std::string_view;

/// Ordered position of a row within a Frame.
///
/// A key is either the "no key" sentinel, a single scalar, or a composite
/// tuple of keys compared lexicographically. Keys built from different
/// scalar alternatives are not comparable; see compare().
class Key {
   public:
    /// The "no key" sentinel.
    Key() = default;

    [[nodiscard]] static auto none() -> Key { return Key{}; }
    [[nodiscard]] static auto scalar(KeyScalar value) -> Key;
    [[nodiscard]] static auto composite(std::vector<Key> parts) -> Key;

    [[nodiscard]] auto kind() const noexcept -> KeyKind;
    [[nodiscard]] auto is_none() const noexcept -> bool { return shape_ == Shape::None; }
    [[nodiscard]] auto is_scalar() const noexcept -> bool { return shape_ == Shape::Scalar; }
    [[nodiscard]] auto is_composite() const noexcept -> bool {
        return shape_ == Shape::Composite;
    }

    /// Only meaningful when is_scalar().
    [[nodiscard]] auto scalar_value() const noexcept -> const KeyScalar& { return scalar_; }

    /// Only meaningful when is_composite().
    [[nodiscard]] auto parts() const noexcept -> const std::vector<Key>& { return parts_; }

   private:
    enum class Shape : std::uint8_t { None, Scalar, Composite };

    Shape shape_ = Shape::None;
    KeyScalar scalar_;
    std::vector<Key> parts_;
};

/// Total order over keys.
///
/// NoKey sorts before everything else. Scalars of the same alternative
/// compare naturally. Composites compare element-wise, and a composite that
/// is a prefix of another sorts first. Comparing a scalar against a scalar of
/// another alternative, or a scalar against a composite, is a
/// KeyTypeMismatch.
[[nodiscard]] auto compare(const Key& lhs, const Key& rhs) -> Result<std::strong_ordering>;

/// Convert a row value to key material. Nulls, NaN, join results and groups
/// are rejected with UnsupportedKeyType.
[[nodiscard]] auto to_key_scalar(const Value& value) -> Result<KeyScalar>;

/// Build a key from projected values: none for zero values, a scalar for
/// one, a composite of scalars otherwise.
[[nodiscard]] auto make_key(std::span<const Value> values) -> Result<Key>;

[[nodiscard]] auto to_string(const Key& key) -> std::string;

/// Comparator adapter for OrderedTree.
struct KeyCompare {
    auto operator()(const Key& lhs, const Key& rhs) const -> Result<std::strong_ordering> {
        return compare(lhs, rhs);
    }
};

}  // namespace rowtree
