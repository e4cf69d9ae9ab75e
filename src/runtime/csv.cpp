#include <tabula/runtime/csv.hpp>

#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <vector>

namespace tabula::runtime {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto try_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_double(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

/// Every valid field satisfies `parses`, and at least one field is valid.
template <typename Parse>
auto all_valid_parse(const std::vector<std::string>& vals, const Validity& validity, Parse parses)
    -> bool {
    bool any_valid = false;
    for (std::size_t i = 0; i < vals.size(); ++i) {
        if (!validity[i]) {
            continue;
        }
        if (!parses(vals[i])) {
            return false;
        }
        any_valid = true;
    }
    return any_valid;
}

template <typename T, typename Parse>
auto build_column(const std::vector<std::string>& vals, const Validity& validity, Parse parse)
    -> Column<T> {
    Column<T> col;
    col.reserve(vals.size());
    for (std::size_t i = 0; i < vals.size(); ++i) {
        T value{};
        if (validity[i]) {
            parse(vals[i], value);
        }
        col.push_back(value);
    }
    return col;
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvReadOptions {
    CsvReadOptions options;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = trim(spec.substr(pos, comma - pos));
        if (!token.empty()) {
            if (token == "<empty>") {
                options.null_if_empty = true;
            } else {
                options.null_tokens.emplace(token);
            }
        }
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
    return options;
}

auto read_csv(std::string_view path, const CsvReadOptions& options)
    -> std::expected<Table, Error> {
    Table table;
    try {
        rapidcsv::Document doc(std::string(path),
                               rapidcsv::LabelParams(0, -1),   // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(',')  // handles RFC 4180 quoting
        );

        for (const auto& name : doc.GetColumnNames()) {
            if (table.contains(name)) {
                return std::unexpected(
                    make_error(ErrorCode::DuplicateColumnName, "duplicate csv header", {name}));
            }
            std::vector<std::string> vals = doc.GetColumn<std::string>(name);
            Validity validity(vals.size(), true);
            for (std::size_t i = 0; i < vals.size(); ++i) {
                validity[i] = !((options.null_if_empty && vals[i].empty()) ||
                                options.null_tokens.contains(vals[i]));
            }

            std::int64_t iv{};
            double dv{};
            if (all_valid_parse(vals, validity,
                                [&](const std::string& v) { return try_int(v, iv); })) {
                table.add_column(name, build_column<std::int64_t>(vals, validity, try_int),
                                 std::move(validity));
            } else if (all_valid_parse(vals, validity,
                                       [&](const std::string& v) { return try_double(v, dv); })) {
                table.add_column(name, build_column<double>(vals, validity, try_double),
                                 std::move(validity));
            } else {
                Column<std::string> col;
                col.reserve(vals.size());
                for (std::size_t i = 0; i < vals.size(); ++i) {
                    col.push_back(validity[i] ? std::move(vals[i]) : std::string{});
                }
                table.add_column(name, std::move(col), std::move(validity));
            }
        }
    } catch (const std::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "failed to read csv " + std::string(path) + ": " +
                                              e.what()));
    }
    spdlog::debug("read_csv: {} rows x {} columns from {}", table.rows(), table.columns.size(),
                  path);
    return table;
}

}  // namespace tabula::runtime
