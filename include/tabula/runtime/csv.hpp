#pragma once

#include <tabula/runtime/table.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <unordered_set>

namespace tabula::runtime {

struct CsvReadOptions {
    /// Treat empty fields as missing.
    bool null_if_empty = false;
    /// Field values that are read as missing.
    std::unordered_set<std::string> null_tokens;
};

/// Parse a comma separated null spec such as "<empty>,NA" into options.
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvReadOptions;

/// Read a CSV file with a header row (RFC 4180 quoting). Each column becomes
/// Int if every valid field parses as an integer, else Double if every valid
/// field parses as a number, else String.
[[nodiscard]] auto read_csv(std::string_view path, const CsvReadOptions& options = {})
    -> std::expected<Table, Error>;

}  // namespace tabula::runtime
