#include <tabula/core/error.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace tabula {

auto to_string(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidGroupColumn:
            return "InvalidGroupColumn";
        case ErrorCode::UnknownColumn:
            return "UnknownColumn";
        case ErrorCode::UnknownJoinColumn:
            return "UnknownJoinColumn";
        case ErrorCode::EmptyJoinKey:
            return "EmptyJoinKey";
        case ErrorCode::PartitionLengthMismatch:
            return "PartitionLengthMismatch";
        case ErrorCode::DuplicateColumnName:
            return "DuplicateColumnName";
        case ErrorCode::ColumnLengthMismatch:
            return "ColumnLengthMismatch";
        case ErrorCode::MissingReducer:
            return "MissingReducer";
        case ErrorCode::ReducerFailure:
            return "ReducerFailure";
        case ErrorCode::TypeMismatch:
            return "TypeMismatch";
        case ErrorCode::IndexOutOfRange:
            return "IndexOutOfRange";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::GroupColumnDropped:
            return "GroupColumnDropped";
    }
    return "Unknown";
}

auto Error::format() const -> std::string {
    if (columns.empty()) {
        return fmt::format("{}: {}", to_string(code), message);
    }
    return fmt::format("{}: {} [{}]", to_string(code), message, fmt::join(columns, ", "));
}

auto make_error(ErrorCode code, std::string message, std::vector<std::string> columns) -> Error {
    return Error{.code = code, .message = std::move(message), .columns = std::move(columns)};
}

FrameError::FrameError(Error error) : std::runtime_error(error.format()), error_(std::move(error)) {}

}  // namespace tabula
