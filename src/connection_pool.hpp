#pragma once

#include "database_connection.hpp"
#include <cstddef>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>

namespace volley {

    // Lazily grown set of connections owned by one client. Slots are index-stable:
    // the pool never shrinks, and a broken connection is replaced in its own slot.
    // Only touched between batches, from the thread that drives them.
    class connection_pool {
    public:
        struct pool_config {
            std::string connection_string;
            connect_options options;                         // user, password, driver keywords
            boost::asio::io_context* io_context = nullptr;   // bound to every connection
        };

        explicit connection_pool(pool_config config)
            : config_(std::move(config)) {}

        // Disable copy and move
        connection_pool(const connection_pool&) = delete;
        connection_pool& operator=(const connection_pool&) = delete;
        connection_pool(connection_pool&&) = delete;
        connection_pool& operator=(connection_pool&&) = delete;

        // Make slots [0, count) hold live connections. Throws connection_error if one
        // cannot be opened; slots filled before the failure are kept.
        void ensure_capacity(std::size_t count) {
            for (std::size_t i = 0; i < connections_.size(); ++i) {
                if (!connections_[i]->is_connected()) {
                    std::cerr << "volley: replacing broken pooled connection " << i
                              << ": " << connections_[i]->last_error() << std::endl;
                    connections_[i] = create_connection();
                    ++connections_replaced_;
                }
            }

            while (connections_.size() < count) {
                connections_.push_back(create_connection());
            }
        }

        [[nodiscard]] database_connection& at(std::size_t index) {
            if (index >= connections_.size()) {
                throw usage_error{std::format("Pool slot {} does not exist (pool size {})",
                                              index, connections_.size())};
            }
            return *connections_[index];
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return connections_.size();
        }

        // Get pool statistics
        struct pool_stats {
            std::size_t total_connections;
            std::size_t connections_created;
            std::size_t connections_replaced;
        };

        [[nodiscard]] pool_stats get_stats() const noexcept {
            return pool_stats{
                .total_connections = connections_.size(),
                .connections_created = connections_created_,
                .connections_replaced = connections_replaced_
            };
        }

        // Open a connection with the pool's parameters without adding it to the pool
        [[nodiscard]] std::unique_ptr<database_connection> create_connection() {
            auto conn = std::make_unique<database_connection>(config_.connection_string, config_.options);

            // Set io_context if provided (enables async operations)
            if (config_.io_context) {
                conn->set_io_context(*config_.io_context);
            }

            ++connections_created_;
            return conn;
        }

    private:
        pool_config config_;
        std::vector<std::unique_ptr<database_connection>> connections_;
        std::size_t connections_created_{0};
        std::size_t connections_replaced_{0};
    };

} // namespace volley
