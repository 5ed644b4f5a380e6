#pragma once

#include <cstddef>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "database_error.hpp"
#include "query_result.hpp"

namespace volley {

    // How the rows of a result are handed to a response callback
    enum class shaping_mode {
        row_as_mapping,
        rows_as_list_of_lists,
        rows_as_list_of_mappings,
        column_as_list
    };

    [[nodiscard]] constexpr std::string_view to_string(shaping_mode mode) noexcept {
        switch (mode) {
            case shaping_mode::row_as_mapping:
                return "row_as_mapping";
            case shaping_mode::rows_as_list_of_lists:
                return "rows_as_list_of_lists";
            case shaping_mode::rows_as_list_of_mappings:
                return "rows_as_list_of_mappings";
            case shaping_mode::column_as_list:
                return "column_as_list";
        }
        return "unknown";
    }

    using row_mapping = std::map<std::string, field_value>;
    using column_list = std::vector<field_value>;
    using keyed_rows = std::map<std::string, row_mapping>;
    using row_lists = std::vector<std::vector<field_value>>;

    // Alternatives follow shaping_mode order
    using shaped_result = std::variant<
        std::optional<row_mapping>,
        row_lists,
        keyed_rows,
        column_list>;

    // Per-query shaping hints
    struct shape_options {
        std::vector<int> columns;                // column_as_list: 1-based, empty means {1}
        std::optional<std::size_t> max_rows;     // rows_as_list_of_lists only
    };

    // Field name to value for one row; a repeated column name keeps the last value
    [[nodiscard]] inline row_mapping fetch_row_mapping(const query_result& result, int row) {
        row_mapping mapping;
        for (int col = 0; col < result.column_count(); ++col) {
            mapping.insert_or_assign(result.column_name(col).value_or(""), result.field(row, col));
        }
        return mapping;
    }

    [[nodiscard]] inline std::optional<row_mapping> shape_row_as_mapping(const query_result& result) {
        if (result.row_count() == 0) {
            return std::nullopt;
        }
        return fetch_row_mapping(result, 0);
    }

    // Values of the hinted columns, row by row
    [[nodiscard]] inline column_list shape_column_as_list(const query_result& result,
                                                          const std::vector<int>& columns) {
        std::vector<int> indexes = columns.empty() ? std::vector<int>{1} : columns;
        for (int index : indexes) {
            if (index < 1 || index > result.column_count()) {
                throw query_error{std::format("Column index {} is out of range for a result with {} columns",
                                              index, result.column_count())};
            }
        }

        column_list values;
        values.reserve(static_cast<std::size_t>(result.row_count()) * indexes.size());
        for (int row : result) {
            for (int index : indexes) {
                values.push_back(result.field(row, index - 1));
            }
        }
        return values;
    }

    // Rows keyed by the value of key_field. A later row with the same key replaces
    // the earlier one and a NULL key is stored under "".
    [[nodiscard]] inline keyed_rows shape_rows_as_list_of_mappings(const query_result& result,
                                                                    std::string_view key_field) {
        auto key_col = result.column_index(key_field);
        if (!key_col) {
            throw query_error{std::format("Key field '{}' is not a column of the result", key_field)};
        }

        keyed_rows rows;
        for (int row : result) {
            rows.insert_or_assign(result.field(row, *key_col).value_or(""), fetch_row_mapping(result, row));
        }
        return rows;
    }

    [[nodiscard]] inline row_lists shape_rows_as_list_of_lists(const query_result& result,
                                                               std::optional<std::size_t> max_rows) {
        std::size_t limit = static_cast<std::size_t>(result.row_count());
        if (max_rows && *max_rows < limit) {
            limit = *max_rows;
        }

        row_lists rows;
        rows.reserve(limit);
        for (int row = 0; row < static_cast<int>(limit); ++row) {
            std::vector<field_value> values;
            values.reserve(static_cast<std::size_t>(result.column_count()));
            for (int col = 0; col < result.column_count(); ++col) {
                values.push_back(result.field(row, col));
            }
            rows.push_back(std::move(values));
        }
        return rows;
    }

    [[nodiscard]] inline shaped_result shape_result(shaping_mode mode,
                                                    const query_result& result,
                                                    const std::optional<std::string>& key_field,
                                                    const shape_options& options) {
        switch (mode) {
            case shaping_mode::row_as_mapping:
                return shape_row_as_mapping(result);
            case shaping_mode::rows_as_list_of_lists:
                return shape_rows_as_list_of_lists(result, options.max_rows);
            case shaping_mode::rows_as_list_of_mappings:
                if (!key_field || key_field->empty()) {
                    throw usage_error{"rows_as_list_of_mappings requires a key field"};
                }
                return shape_rows_as_list_of_mappings(result, *key_field);
            case shaping_mode::column_as_list:
                return shape_column_as_list(result, options.columns);
        }
        throw usage_error{"Unknown shaping mode"};
    }

} // namespace volley
