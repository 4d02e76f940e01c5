#include <rowtree/core/key.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <utility>

namespace rowtree {

namespace {

auto scalar_kind(const KeyScalar& scalar) noexcept -> KeyKind {
    // KeyKind::None occupies slot 0; scalar alternatives follow in variant order.
    return static_cast<KeyKind>(scalar.index() + 1);
}

auto compare_scalars(const KeyScalar& lhs, const KeyScalar& rhs)
    -> Result<std::strong_ordering> {
    if (lhs.index() != rhs.index()) {
        return make_error(ErrorKind::KeyTypeMismatch,
                          fmt::format("cannot compare {} key with {} key",
                                      key_kind_name(scalar_kind(lhs)),
                                      key_kind_name(scalar_kind(rhs))));
    }
    return std::visit(
        [&rhs](const auto& l) -> std::strong_ordering {
            using T = std::decay_t<decltype(l)>;
            const auto& r = std::get<T>(rhs);
            if constexpr (std::is_same_v<T, double>) {
                // NaN never becomes a key, so < is a total order here.
                if (l < r) {
                    return std::strong_ordering::less;
                }
                if (r < l) {
                    return std::strong_ordering::greater;
                }
                return std::strong_ordering::equal;
            } else {
                return l <=> r;
            }
        },
        lhs);
}

auto format_scalar(const KeyScalar& scalar) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else if constexpr (std::is_same_v<T, Date> || std::is_same_v<T, Timestamp>) {
                return to_string(Value{v});
            } else {
                return fmt::format("{}", v);
            }
        },
        scalar);
}

}  // namespace

auto key_kind_name(KeyKind kind) noexcept -> std::string_view {
    switch (kind) {
        case KeyKind::None:
            return "none";
        case KeyKind::Int:
            return "int";
        case KeyKind::Double:
            return "double";
        case KeyKind::Bool:
            return "bool";
        case KeyKind::String:
            return "string";
        case KeyKind::Date:
            return "date";
        case KeyKind::Timestamp:
            return "timestamp";
        case KeyKind::Composite:
            return "composite";
    }
    return "unknown";
}

auto Key::scalar(KeyScalar value) -> Key {
    Key key;
    key.shape_ = Shape::Scalar;
    key.scalar_ = std::move(value);
    return key;
}

auto Key::composite(std::vector<Key> parts) -> Key {
    Key key;
    key.shape_ = Shape::Composite;
    key.parts_ = std::move(parts);
    return key;
}

auto Key::kind() const noexcept -> KeyKind {
    switch (shape_) {
        case Shape::None:
            return KeyKind::None;
        case Shape::Scalar:
            return scalar_kind(scalar_);
        case Shape::Composite:
            return KeyKind::Composite;
    }
    return KeyKind::None;
}

auto compare(const Key& lhs, const Key& rhs) -> Result<std::strong_ordering> {
    if (lhs.is_none() || rhs.is_none()) {
        if (lhs.is_none() && rhs.is_none()) {
            return std::strong_ordering::equal;
        }
        return lhs.is_none() ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    if (lhs.is_scalar() && rhs.is_scalar()) {
        return compare_scalars(lhs.scalar_value(), rhs.scalar_value());
    }
    if (lhs.is_composite() != rhs.is_composite()) {
        return make_error(ErrorKind::KeyTypeMismatch,
                          fmt::format("cannot compare {} key {} with {} key {}",
                                      key_kind_name(lhs.kind()), to_string(lhs),
                                      key_kind_name(rhs.kind()), to_string(rhs)));
    }

    const auto& left = lhs.parts();
    const auto& right = rhs.parts();
    const std::size_t shared = std::min(left.size(), right.size());
    for (std::size_t i = 0; i < shared; ++i) {
        auto order = compare(left[i], right[i]);
        if (!order) {
            return order;
        }
        if (*order != std::strong_ordering::equal) {
            return *order;
        }
    }
    return left.size() <=> right.size();
}

auto to_key_scalar(const Value& value) -> Result<KeyScalar> {
    return std::visit(
        [&value](const auto& v) -> Result<KeyScalar> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, JoinResultPtr> ||
                          std::is_same_v<T, GroupPtr>) {
                return make_error(ErrorKind::UnsupportedKeyType,
                                  fmt::format("{} value {} cannot be used as a key",
                                              kind_name(kind_of(value)), to_string(value)));
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) {
                    return make_error(ErrorKind::UnsupportedKeyType,
                                      "NaN cannot be used as a key");
                }
                return KeyScalar{v};
            } else {
                return KeyScalar{v};
            }
        },
        value);
}

auto make_key(std::span<const Value> values) -> Result<Key> {
    if (values.empty()) {
        return Key::none();
    }
    std::vector<Key> parts;
    parts.reserve(values.size());
    for (const auto& value : values) {
        auto scalar = to_key_scalar(value);
        if (!scalar) {
            return std::unexpected(std::move(scalar.error()));
        }
        parts.push_back(Key::scalar(std::move(*scalar)));
    }
    if (parts.size() == 1) {
        return std::move(parts.front());
    }
    return Key::composite(std::move(parts));
}

auto to_string(const Key& key) -> std::string {
    if (key.is_none()) {
        return "()";
    }
    if (key.is_scalar()) {
        return format_scalar(key.scalar_value());
    }
    std::string out = "(";
    for (std::size_t i = 0; i < key.parts().size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(to_string(key.parts()[i]));
    }
    out.push_back(')');
    return out;
}

}  // namespace rowtree
