#include <rowtree/core/error.hpp>

#include <fmt/format.h>

#include <utility>

namespace rowtree {

auto error_kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::MissingColumn:
            return "missing column";
        case ErrorKind::TypeDrift:
            return "type drift";
        case ErrorKind::UnsupportedKeyType:
            return "unsupported key type";
        case ErrorKind::KeyTypeMismatch:
            return "key type mismatch";
        case ErrorKind::StructuralJoinError:
            return "structural join error";
        case ErrorKind::StructuralGroupError:
            return "structural group error";
        case ErrorKind::EmptyGroup:
            return "empty group";
        case ErrorKind::ActionFailed:
            return "row action failed";
        case ErrorKind::NullRow:
            return "null row";
        case ErrorKind::NullIndexer:
            return "null indexer";
    }
    return "unknown error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", error_kind_name(kind), message);
}

auto make_error(ErrorKind kind, std::string message, std::string column)
    -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = kind, .message = std::move(message), .column = std::move(column)});
}

auto action_error(std::string message) -> std::unexpected<Error> {
    return make_error(ErrorKind::ActionFailed, std::move(message));
}

}  // namespace rowtree
