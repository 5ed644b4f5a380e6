#pragma once

#include <chrono>
#include <cstddef>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <utility>
#include <boost/asio/io_context.hpp>

#include "batch_dispatcher.hpp"
#include "connection_pool.hpp"
#include "database_connection.hpp"
#include "query_descriptor.hpp"
#include "query_queue.hpp"

namespace volley {

    // Collects read queries and runs them as one concurrent batch.
    //
    //   batch_client client("host=localhost dbname=app", "reader", "secret");
    //   client.enqueue_row_as_mapping("SELECT * FROM users WHERE id = $1",
    //       {.response = [&](std::optional<row_mapping> row) { user = std::move(row); }}, 42);
    //   client.enqueue_column_as_list("SELECT id FROM orders",
    //       {.response = [&](column_list ids) { order_ids = std::move(ids); }});
    //   client.execute_batch();   // both queries in flight at once, returns when both are done
    //
    // A client is driven from one thread. Nothing touches the network until
    // execute_batch(); connections are opened then and kept for later batches.
    // Response callbacks run on the thread that called execute_batch() unless
    // worker_threads is raised, and never two at a time.
    class batch_client {
    public:
        struct client_config {
            std::string connection_string;       // conninfo string or postgresql:// URI
            std::string username;
            std::string password;
            connect_options driver_options;      // extra libpq keywords, e.g. {"sslmode", "require"}
            std::size_t worker_threads = 1;              // threads serving a batch, the caller included
            std::optional<std::chrono::milliseconds> batch_timeout;
            std::chrono::milliseconds cancel_grace{1000};  // after a failure, before running queries are dropped
            std::string application_name = "volley";
            bool verbose = false;
        };

        // Cumulative over the client's lifetime
        struct batch_stats {
            std::size_t batches_executed = 0;
            std::size_t batches_failed = 0;
            std::size_t queries_dispatched = 0;
            std::size_t callbacks_invoked = 0;
            std::size_t pool_size = 0;
            std::size_t connections_replaced = 0;
            std::chrono::milliseconds last_batch_duration{0};
        };

        batch_client(std::string connection_string,
                     std::string username,
                     std::string password,
                     connect_options driver_options = {})
            : batch_client(client_config{
                  .connection_string = std::move(connection_string),
                  .username = std::move(username),
                  .password = std::move(password),
                  .driver_options = std::move(driver_options)
              }) {}

        explicit batch_client(client_config config)
            : config_(std::move(config)),
              pool_(make_pool_config(config_, ioc_)),
              dispatcher_(ioc_, batch_dispatcher::dispatch_options{
                  .worker_threads = config_.worker_threads,
                  .timeout = config_.batch_timeout,
                  .cancel_grace = config_.cancel_grace,
                  .verbose = config_.verbose
              }) {}

        // Disable copy and move
        batch_client(const batch_client&) = delete;
        batch_client& operator=(const batch_client&) = delete;
        batch_client(batch_client&&) = delete;
        batch_client& operator=(batch_client&&) = delete;

        // First row as column name -> value; std::nullopt when there is no row
        template<typename... Args>
        void enqueue_row_as_mapping(std::string sql, row_mapping_options options, Args&&... binds) {
            queue_.push(make_descriptor(std::move(sql), shaping_mode::row_as_mapping, std::nullopt,
                                        std::move(options), make_bind_list(std::forward<Args>(binds)...)));
        }

        // Values of options.columns (1-based, default the first column), row by row
        template<typename... Args>
        void enqueue_column_as_list(std::string sql, column_list_options options, Args&&... binds) {
            queue_.push(make_descriptor(std::move(sql), shaping_mode::column_as_list, std::nullopt,
                                        std::move(options), make_bind_list(std::forward<Args>(binds)...)));
        }

        // Every row, keyed by the value of key_field
        template<typename... Args>
        void enqueue_rows_as_list_of_mappings(std::string sql, std::string key_field,
                                              keyed_rows_options options, Args&&... binds) {
            queue_.push(make_descriptor(std::move(sql), shaping_mode::rows_as_list_of_mappings,
                                        std::optional<std::string>(std::move(key_field)),
                                        std::move(options), make_bind_list(std::forward<Args>(binds)...)));
        }

        // Every row (up to options.max_rows) as a list of values
        template<typename... Args>
        void enqueue_rows_as_list_of_lists(std::string sql, row_lists_options options, Args&&... binds) {
            queue_.push(make_descriptor(std::move(sql), shaping_mode::rows_as_list_of_lists, std::nullopt,
                                        std::move(options), make_bind_list(std::forward<Args>(binds)...)));
        }

        // Run everything queued so far concurrently and block until all of it has
        // settled. The queue is empty afterwards whether or not the batch succeeded.
        // Queries enqueued from inside a response callback wait for the next batch.
        void execute_batch(std::source_location location = std::source_location::current()) {
            if (queue_.empty()) {
                return;
            }

            auto batch = queue_.take();
            batch_dispatcher::batch_report report;
            try {
                for (const auto& descriptor : batch) {
                    if (auto problem = validate_descriptor(descriptor)) {
                        throw usage_error{*problem, "", location};
                    }
                }
                pool_.ensure_capacity(batch.size());
                dispatcher_.dispatch(batch, pool_, report);
            } catch (const connection_error& e) {
                record_failure(report);
                throw connection_error{std::format("DB error: {} at {}", trim_message(e.what()),
                                                   describe_location(location)),
                                       e.sql_state, location};
            } catch (...) {
                record_failure(report);
                throw;
            }

            record(report);
            ++stats_.batches_executed;
        }

        // Drop every pending query without running it or calling its callback
        void cancel_queue() noexcept {
            queue_.clear();
        }

        // A dedicated connection outside the pool, for direct driver access
        [[nodiscard]] std::unique_ptr<database_connection> raw_connection() {
            return pool_.create_connection();
        }

        [[nodiscard]] std::size_t queue_size() const noexcept {
            return queue_.size();
        }

        [[nodiscard]] std::size_t pool_size() const noexcept {
            return pool_.size();
        }

        [[nodiscard]] batch_stats get_stats() const noexcept {
            batch_stats stats = stats_;
            stats.pool_size = pool_.size();
            stats.connections_replaced = pool_.get_stats().connections_replaced;
            return stats;
        }

        [[nodiscard]] const client_config& config() const noexcept {
            return config_;
        }

    private:
        static connection_pool::pool_config make_pool_config(const client_config& config,
                                                             net::io_context& ioc) {
            connect_options options{
                {"user", config.username},
                {"password", config.password},
                {"application_name", config.application_name}
            };
            for (const auto& [key, value] : config.driver_options) {
                options.insert_or_assign(key, value);
            }
            return connection_pool::pool_config{
                .connection_string = config.connection_string,
                .options = std::move(options),
                .io_context = &ioc
            };
        }

        void record(const batch_dispatcher::batch_report& report) {
            stats_.queries_dispatched += report.dispatched;
            stats_.callbacks_invoked += report.callbacks_invoked;
            stats_.last_batch_duration = report.elapsed;
        }

        void record_failure(const batch_dispatcher::batch_report& report) {
            cancel_queue();
            record(report);
            ++stats_.batches_failed;
        }

        client_config config_;
        net::io_context ioc_;
        connection_pool pool_;
        batch_dispatcher dispatcher_;
        query_queue queue_;
        batch_stats stats_;
    };

} // namespace volley
