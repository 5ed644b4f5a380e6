#pragma once

#include <libpq-fe.h>
#include <format>
#include <string>
#include <string_view>
#include <map>
#include <memory>
#include <optional>
#include <vector>
#include <concepts>
#include <chrono>
#include <iostream>
#include <type_traits>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <coroutine>

#include "database_error.hpp"
#include "query_result.hpp"

namespace volley {

    namespace net = boost::asio;

    // Connection status enum
    enum class connection_status {
        ok,
        bad,
        started,
        made,
        awaiting_response,
        auth_ok,
        setenv,
        ssl_startup,
        needed
    };

    // C++20 concept for connection string types
    template<typename T>
    concept ConnectionString = std::convertible_to<T, std::string_view>;

    // libpq keyword/value pairs (user, password, connect_timeout, sslmode, ...)
    using connect_options = std::map<std::string, std::string>;

    // One text query parameter; std::nullopt binds SQL NULL
    using bind_value = std::optional<std::string>;
    using bind_list = std::vector<bind_value>;

    template<typename T>
    struct is_optional : std::false_type {};

    template<typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template<typename T>
    inline constexpr bool is_optional_v = is_optional<T>::value;

    template<typename T>
    inline constexpr bool unsupported_bind_type = false;

    // Convert a bind argument to its text parameter
    template<typename T>
    [[nodiscard]] bind_value to_bind_value(T&& value) {
        using DecayedT = std::remove_cvref_t<T>;

        if constexpr (std::is_same_v<DecayedT, std::nullopt_t>) {
            return std::nullopt;
        } else if constexpr (is_optional_v<DecayedT>) {
            if (!value.has_value()) {
                return std::nullopt;
            }
            return to_bind_value(*std::forward<T>(value));
        } else if constexpr (std::is_same_v<DecayedT, std::string>) {
            return std::string(std::forward<T>(value));
        } else if constexpr (std::is_convertible_v<T, std::string_view>) {
            return std::string(std::string_view(value));
        } else if constexpr (std::is_same_v<DecayedT, bool>) {
            return std::string(value ? "true" : "false");
        } else if constexpr (std::is_arithmetic_v<DecayedT>) {
            return std::to_string(value);
        } else {
            static_assert(unsupported_bind_type<DecayedT>, "unsupported bind argument type");
        }
    }

    // Pack bind arguments; a single bind_list argument is taken as-is
    template<typename... Args>
    [[nodiscard]] bind_list make_bind_list(Args&&... args) {
        if constexpr (sizeof...(Args) == 1 &&
                      (std::is_same_v<std::remove_cvref_t<Args>, bind_list> && ...)) {
            return bind_list(std::forward<Args>(args)...);
        } else {
            return bind_list{to_bind_value(std::forward<Args>(args))...};
        }
    }

    // RAII wrapper for PGcancel. cancel() may be called from any thread while the
    // owning connection is busy on another; the running query then fails with SQLSTATE 57014.
    class query_canceller {
    public:
        query_canceller() : handle_(nullptr, PQfreeCancel) {}
        explicit query_canceller(PGcancel* handle) : handle_(handle, PQfreeCancel) {}

        [[nodiscard]] bool valid() const noexcept { return handle_ != nullptr; }

        bool cancel() noexcept {
            if (!handle_) return false;
            char errbuf[256];
            if (PQcancel(handle_.get(), errbuf, sizeof(errbuf)) != 1) {
                std::cerr << "volley: cancel request failed: " << trim_message(errbuf) << std::endl;
                return false;
            }
            return true;
        }

    private:
        std::unique_ptr<PGcancel, decltype(&PQfreeCancel)> handle_;
    };

    class database_connection {
    public:
        // Constructor with connection string
        template<ConnectionString T>
        explicit database_connection(T&& conn_str) {
            connect(std::string_view(conn_str), {});
        }

        // Connection string (conninfo or URI) plus keyword overrides; overrides win
        database_connection(std::string_view conn_str, const connect_options& overrides) {
            connect(conn_str, overrides);
        }

        // Named parameter constructor using C++20 designated initializers
        struct connection_params {
            std::string host = "localhost";
            std::string port = "5432";
            std::string database;
            std::string user;
            std::string password;
            std::chrono::seconds connect_timeout{30};
            std::string application_name = "volley";
            std::string client_encoding = "UTF8";
        };

        explicit database_connection(const connection_params& params) {
            connect({}, connect_options{
                {"host", params.host},
                {"port", params.port},
                {"dbname", params.database},
                {"user", params.user},
                {"password", params.password},
                {"connect_timeout", std::to_string(params.connect_timeout.count())},
                {"application_name", params.application_name},
                {"client_encoding", params.client_encoding}
            });
        }

        // Disable copy, enable move
        database_connection(const database_connection&) = delete;
        database_connection& operator=(const database_connection&) = delete;

        database_connection(database_connection&& other) noexcept
            : conn_(std::exchange(other.conn_, nullptr))
            , ioc_(std::exchange(other.ioc_, nullptr)) {}

        database_connection& operator=(database_connection&& other) noexcept {
            if (this != &other) {
                close();
                conn_ = std::exchange(other.conn_, nullptr);
                ioc_ = std::exchange(other.ioc_, nullptr);
            }
            return *this;
        }

        ~database_connection() {
            close();
        }

        // Check if connection is valid
        [[nodiscard]] bool is_connected() const noexcept {
            return conn_ && PQstatus(conn_) == CONNECTION_OK;
        }

        // Get connection status
        [[nodiscard]] connection_status status() const noexcept {
            if (!conn_) return connection_status::bad;
            return static_cast<connection_status>(PQstatus(conn_));
        }

        // Execute a simple query (no parameters)
        [[nodiscard]] query_result execute(const std::string& query) {
            return execute_binds(query, {});
        }

        // Execute parameterized query
        template<typename... Args>
        [[nodiscard]] query_result execute_params(const std::string& query, Args&&... args) {
            return execute_binds(query, make_bind_list(std::forward<Args>(args)...));
        }

        [[nodiscard]] query_result execute_binds(const std::string& query, const bind_list& binds) {
            if (!is_connected()) {
                throw connection_error{"Connection is not valid"};
            }

            auto param_ptrs = param_pointers(binds);
            PGresult* result = PQexecParams(
                conn_,
                query.c_str(),
                static_cast<int>(param_ptrs.size()),
                nullptr,  // let server determine param types
                param_ptrs.data(),
                nullptr,  // text format
                nullptr,  // text format
                0         // text result format
            );

            if (!result) {
                throw connection_error{std::format("Query execution failed: {}", last_error())};
            }
            return checked(result);
        }

        // Get last error message
        [[nodiscard]] std::string last_error() const {
            return conn_ ? trim_message(PQerrorMessage(conn_)) : "No connection";
        }

        // Get database info
        [[nodiscard]] std::string database_name() const {
            return conn_ ? PQdb(conn_) : "";
        }

        [[nodiscard]] std::string user_name() const {
            return conn_ ? PQuser(conn_) : "";
        }

        [[nodiscard]] std::string host() const {
            return conn_ ? PQhost(conn_) : "";
        }

        [[nodiscard]] std::string port() const {
            return conn_ ? PQport(conn_) : "";
        }

        // Server process serving this session
        [[nodiscard]] int backend_pid() const noexcept {
            return conn_ ? PQbackendPID(conn_) : 0;
        }

        // Socket of the session, -1 when closed
        [[nodiscard]] int socket_descriptor() const noexcept {
            return conn_ ? PQsocket(conn_) : -1;
        }

        // Close connection
        void close() noexcept {
            if (conn_) {
                PQfinish(conn_);
                conn_ = nullptr;
            }
        }

        // Snapshot of what the server needs to cancel this session's running statement
        [[nodiscard]] query_canceller make_canceller() const {
            return query_canceller(conn_ ? PQgetCancel(conn_) : nullptr);
        }

        // === ASYNC METHODS (require io_context) ===

        // Set io_context for async operations
        void set_io_context(net::io_context& ioc) noexcept {
            ioc_ = &ioc;
        }

        // Get the io_context (if set)
        [[nodiscard]] net::io_context* get_io_context() noexcept {
            return ioc_;
        }

        // Send a query and resume once its result has arrived.
        // Arguments are taken by value so they live in the coroutine frame.
        [[nodiscard]] net::awaitable<query_result> async_execute(std::string query, bind_list binds = {}) {
            if (!is_connected()) {
                throw connection_error{std::format("Connection is not valid: {}", last_error())};
            }
            if (!ioc_) {
                throw usage_error{"io_context not set. Call set_io_context() first."};
            }

            auto param_ptrs = param_pointers(binds);
            if (!PQsendQueryParams(
                conn_,
                query.c_str(),
                static_cast<int>(param_ptrs.size()),
                nullptr,
                param_ptrs.data(),
                nullptr,
                nullptr,
                0)) {
                throw connection_error{std::format("Failed to send async query: {}", last_error())};
            }

            co_return co_await wait_for_result();
        }

    private:
        void connect(std::string_view conn_str, const connect_options& overrides) {
            // The connection string rides in dbname with expand_dbname set, so later
            // keywords override whatever it says.
            std::vector<std::string> storage;
            storage.reserve(2 * (overrides.size() + 1));
            if (!conn_str.empty()) {
                storage.emplace_back("dbname");
                storage.emplace_back(conn_str);
            }
            for (const auto& [key, value] : overrides) {
                if (value.empty()) continue;
                storage.push_back(key);
                storage.push_back(value);
            }

            std::vector<const char*> keywords;
            std::vector<const char*> values;
            for (std::size_t i = 0; i < storage.size(); i += 2) {
                keywords.push_back(storage[i].c_str());
                values.push_back(storage[i + 1].c_str());
            }
            keywords.push_back(nullptr);
            values.push_back(nullptr);

            conn_ = PQconnectdbParams(keywords.data(), values.data(), 1);
            if (!is_connected()) {
                std::string error = last_error();
                close();
                throw connection_error{std::format("Failed to connect to database: {}", error)};
            }
        }

        static std::vector<const char*> param_pointers(const bind_list& binds) {
            std::vector<const char*> ptrs;
            ptrs.reserve(binds.size());
            for (const auto& val : binds) {
                ptrs.push_back(val ? val->c_str() : nullptr);
            }
            return ptrs;
        }

        // Turn an error result into query_error, or connection_error when the
        // session did not survive it; otherwise take ownership
        query_result checked(PGresult* result) const {
            ExecStatusType status = PQresultStatus(result);
            if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
                std::string error_msg = trim_message(PQresultErrorMessage(result));
                const char* state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
                std::string sql_state = state ? state : "";
                PQclear(result);
                if (!is_connected()) {
                    throw connection_error{std::format("Connection lost: {}", error_msg), std::move(sql_state)};
                }
                throw query_error{std::move(error_msg), std::move(sql_state)};
            }
            return query_result(result);
        }

        // Drain whatever the server still has queued for the current command
        void discard_pending_results() noexcept {
            PGresult* next_result;
            while ((next_result = PQgetResult(conn_)) != nullptr) {
                PQclear(next_result);
            }
        }

        // Wait for query result asynchronously using socket-based waiting
        [[nodiscard]] net::awaitable<query_result> wait_for_result() {
            auto executor = co_await net::this_coro::executor;

            auto socket_fd = PQsocket(conn_);
            if (socket_fd < 0) {
                throw connection_error{"Invalid socket from PostgreSQL connection"};
            }

            // PostgreSQL owns the socket, we're just borrowing it for async waiting
            net::ip::tcp::socket socket(executor);
            socket.assign(net::ip::tcp::v4(), socket_fd);

            struct socket_releaser {
                net::ip::tcp::socket& sock;
                ~socket_releaser() { sock.release(); }
            } releaser{socket};

            while (true) {
                if (PQconsumeInput(conn_) == 0) {
                    throw connection_error{std::format("Failed to consume input: {}", last_error())};
                }

                if (PQisBusy(conn_) == 0) {
                    PGresult* result = PQgetResult(conn_);
                    if (!result) {
                        throw connection_error{std::format("Query returned no result: {}", last_error())};
                    }

                    discard_pending_results();
                    co_return checked(result);
                }

                // Suspends until the server has sent something
                co_await socket.async_wait(net::socket_base::wait_read, net::use_awaitable);
            }
        }

        PGconn* conn_{nullptr};
        net::io_context* ioc_{nullptr};
    };

} // namespace volley
