#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>

namespace volley {

    // Error type for database operations
    struct database_error : public std::runtime_error {
        std::string sql_state;
        std::source_location location;

        database_error(std::string msg, std::string state = "",
                      std::source_location loc = std::source_location::current())
            : std::runtime_error(msg), sql_state(std::move(state)), location(loc) {}
    };

    // A session could not be established, or broke while a query was in flight
    struct connection_error : public database_error {
        using database_error::database_error;
    };

    // The server rejected a query, or its rows did not fit the requested shape
    struct query_error : public database_error {
        using database_error::database_error;
    };

    // The caller handed the batch something it cannot run
    struct usage_error : public database_error {
        using database_error::database_error;
    };

    // A batch outlived client_config::batch_timeout
    struct batch_timeout_error : public database_error {
        using database_error::database_error;
    };

    // libpq messages end in a newline
    [[nodiscard]] inline std::string trim_message(std::string_view msg) {
        auto end = msg.find_last_not_of(" \t\r\n");
        return std::string(end == std::string_view::npos ? std::string_view{} : msg.substr(0, end + 1));
    }

    // "file:line" of a call site, used to prefix errors raised on behalf of a caller
    [[nodiscard]] inline std::string describe_location(const std::source_location& loc) {
        return std::format("{}:{}", loc.file_name(), loc.line());
    }

} // namespace volley
