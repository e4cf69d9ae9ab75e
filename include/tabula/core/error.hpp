#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

/// Failure categories reported by the engine.
enum class ErrorCode : std::uint8_t {
    InvalidGroupColumn,
    UnknownColumn,
    UnknownJoinColumn,
    EmptyJoinKey,
    PartitionLengthMismatch,
    DuplicateColumnName,
    ColumnLengthMismatch,
    MissingReducer,
    ReducerFailure,
    TypeMismatch,
    IndexOutOfRange,
    InvalidArgument,
    GroupColumnDropped,
};

[[nodiscard]] auto to_string(ErrorCode code) noexcept -> std::string_view;

/// Structured engine error: a category, a human-readable message and the
/// column(s) the failure is about.
struct Error {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;
    std::vector<std::string> columns;

    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto make_error(ErrorCode code, std::string message,
                              std::vector<std::string> columns = {}) -> Error;

/// Exception thrown by the fluent Frame API when an engine call fails.
class FrameError : public std::runtime_error {
   public:
    explicit FrameError(Error error);

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return error_.code; }
    [[nodiscard]] auto columns() const noexcept -> const std::vector<std::string>& {
        return error_.columns;
    }
    [[nodiscard]] auto error() const noexcept -> const Error& { return error_; }

   private:
    Error error_;
};

}  // namespace tabula
