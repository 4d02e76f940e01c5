#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace rowtree {

enum class ErrorKind : std::uint8_t {
    MissingColumn,
    TypeDrift,
    UnsupportedKeyType,
    KeyTypeMismatch,
    StructuralJoinError,
    StructuralGroupError,
    EmptyGroup,
    ActionFailed,
    NullRow,
    NullIndexer,
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) noexcept -> std::string_view;

/// Error returned by every fallible rowtree operation.
///
/// `column` names the offending column when the failure is tied to one
/// (missing column, type drift, structural join/group errors); it is empty
/// otherwise. NullRow and NullIndexer report a null pointer handed to the
/// library where a row or an indexer is required.
struct Error {
    ErrorKind kind = ErrorKind::ActionFailed;
    std::string message;
    std::string column;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto make_error(ErrorKind kind, std::string message, std::string column = {})
    -> std::unexpected<Error>;

/// Convenience for row actions that want to abort a traversal.
[[nodiscard]] auto action_error(std::string message) -> std::unexpected<Error>;

}  // namespace rowtree
