#pragma once

#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "database_connection.hpp"
#include "result_shaping.hpp"

namespace volley {

    // Callback for one shaped result. Accepts callables taking (Result) or
    // (Result, database_connection&); the connection is the one the query ran on.
    template<typename Result>
    class response_handler {
    public:
        using function_type = std::function<void(Result, database_connection&)>;

        response_handler() = default;

        template<typename F>
            requires (!std::same_as<F, response_handler> &&
                      std::invocable<F&, Result, database_connection&>)
        response_handler(F fn) : fn_(std::move(fn)) {}

        template<typename F>
            requires (!std::same_as<F, response_handler> &&
                      std::invocable<F&, Result> &&
                      !std::invocable<F&, Result, database_connection&>)
        response_handler(F fn)
            : fn_([inner = std::move(fn)](Result result, database_connection&) mutable {
                  inner(std::move(result));
              }) {}

        void operator()(Result result, database_connection& conn) const {
            fn_(std::move(result), conn);
        }

        [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(fn_); }

    private:
        function_type fn_;
    };

    // Options accepted by the enqueue methods, filled with designated initializers:
    //   column_list_options{.response = [&](column_list c) { ... }, .columns = {1, 2}}
    template<typename Result>
    struct query_options {
        response_handler<Result> response;
        std::vector<int> columns{};              // column_as_list only, 1-based
        std::optional<std::size_t> max_rows{};   // rows_as_list_of_lists only
    };

    using row_mapping_options = query_options<std::optional<row_mapping>>;
    using column_list_options = query_options<column_list>;
    using keyed_rows_options = query_options<keyed_rows>;
    using row_lists_options = query_options<row_lists>;

    // One deferred query. Built at enqueue time and consumed once by the dispatcher.
    struct query_descriptor {
        std::string sql;
        shaping_mode mode = shaping_mode::row_as_mapping;
        std::optional<std::string> key_field;
        bind_list binds;
        shape_options options;
        std::function<void(shaped_result, database_connection&)> response;
    };

    template<typename Result>
    [[nodiscard]] query_descriptor make_descriptor(std::string sql,
                                                   shaping_mode mode,
                                                   std::optional<std::string> key_field,
                                                   query_options<Result> options,
                                                   bind_list binds) {
        query_descriptor descriptor{
            .sql = std::move(sql),
            .mode = mode,
            .key_field = std::move(key_field),
            .binds = std::move(binds),
            .options = shape_options{
                .columns = std::move(options.columns),
                .max_rows = options.max_rows
            },
            .response = nullptr
        };

        if (options.response) {
            descriptor.response = [handler = std::move(options.response)](
                shaped_result shaped, database_connection& conn) {
                handler(std::get<Result>(std::move(shaped)), conn);
            };
        }
        return descriptor;
    }

    // Reasons a descriptor cannot be dispatched, or std::nullopt when it can
    [[nodiscard]] inline std::optional<std::string> validate_descriptor(const query_descriptor& descriptor) {
        if (!descriptor.response) {
            return std::format("query '{}' has no response callback", descriptor.sql);
        }
        if (descriptor.mode == shaping_mode::rows_as_list_of_mappings &&
            (!descriptor.key_field || descriptor.key_field->empty())) {
            return std::format("query '{}' uses rows_as_list_of_mappings without a key field", descriptor.sql);
        }
        return std::nullopt;
    }

} // namespace volley
