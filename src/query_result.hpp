#pragma once

#include <libpq-fe.h>
#include <charconv>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace volley {

    // Text value of one field; std::nullopt is SQL NULL
    using field_value = std::optional<std::string>;

    // RAII wrapper for PGresult
    class query_result {
    public:
        // Empty result; co_spawn hands one to completion handlers on failure
        query_result() : result_(nullptr, PQclear) {}
        explicit query_result(PGresult* result) : result_(result, PQclear) {}

        query_result(const query_result&) = delete;
        query_result& operator=(const query_result&) = delete;
        query_result(query_result&&) = default;
        query_result& operator=(query_result&&) = default;

        [[nodiscard]] int row_count() const noexcept {
            return result_ ? PQntuples(result_.get()) : 0;
        }

        [[nodiscard]] int column_count() const noexcept {
            return result_ ? PQnfields(result_.get()) : 0;
        }

        [[nodiscard]] std::optional<std::string> column_name(int col) const {
            if (!result_ || col < 0 || col >= column_count()) {
                return std::nullopt;
            }
            return PQfname(result_.get(), col);
        }

        [[nodiscard]] std::optional<int> column_index(std::string_view name) const {
            if (!result_) return std::nullopt;
            // Exact match; PQfnumber would case-fold unquoted names
            for (int col = 0; col < column_count(); ++col) {
                if (name == PQfname(result_.get(), col)) {
                    return col;
                }
            }
            return std::nullopt;
        }

        [[nodiscard]] bool is_null(int row, int col) const noexcept {
            if (!result_) return true;
            return PQgetisnull(result_.get(), row, col) == 1;
        }

        [[nodiscard]] std::optional<std::string_view> get_value(int row, int col) const {
            if (!result_ || is_null(row, col)) {
                return std::nullopt;
            }
            return std::string_view(PQgetvalue(result_.get(), row, col),
                                    static_cast<std::size_t>(PQgetlength(result_.get(), row, col)));
        }

        // Owned copy of a field, the form handed to response callbacks
        [[nodiscard]] field_value field(int row, int col) const {
            auto val = get_value(row, col);
            if (!val) return std::nullopt;
            return std::string(*val);
        }

        // Get value with type conversion
        template<typename T>
        [[nodiscard]] std::optional<T> get(int row, int col) const {
            auto val = get_value(row, col);
            if (!val) return std::nullopt;
            return parse_value<T>(*val);
        }

        template<typename T>
        [[nodiscard]] std::optional<T> get(int row, std::string_view col_name) const {
            auto idx = column_index(col_name);
            if (!idx) return std::nullopt;
            return get<T>(row, *idx);
        }

        // Get number of affected rows (for INSERT/UPDATE/DELETE)
        [[nodiscard]] int affected_rows() const noexcept {
            if (!result_) return 0;
            const char* rows = PQcmdTuples(result_.get());
            return rows && *rows ? std::atoi(rows) : 0;
        }

        // Iterator support for range-based for loops
        class row_iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = int;
            using difference_type = std::ptrdiff_t;
            using pointer = const int*;
            using reference = const int&;

            explicit row_iterator(int row) : row_(row) {}

            int operator*() const { return row_; }

            row_iterator& operator++() {
                ++row_;
                return *this;
            }

            row_iterator operator++(int) {
                row_iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            bool operator==(const row_iterator& other) const {
                return row_ == other.row_;
            }

            bool operator!=(const row_iterator& other) const {
                return !(*this == other);
            }

        private:
            int row_;
        };

        [[nodiscard]] row_iterator begin() const {
            return row_iterator(0);
        }

        [[nodiscard]] row_iterator end() const {
            return row_iterator(row_count());
        }

    private:
        template<typename T>
        static std::optional<T> parse_value(std::string_view str) {
            if constexpr (std::is_same_v<T, std::string>) {
                return std::string(str);
            } else if constexpr (std::is_same_v<T, std::string_view>) {
                return str;
            } else if constexpr (std::is_same_v<T, bool>) {
                return str == "t" || str == "true" || str == "1";
            } else if constexpr (std::is_arithmetic_v<T>) {
                T value{};
                auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
                if (ec != std::errc{} || end != str.data() + str.size()) {
                    return std::nullopt;
                }
                return value;
            } else {
                return std::nullopt;
            }
        }

        std::unique_ptr<PGresult, decltype(&PQclear)> result_;
    };

} // namespace volley
