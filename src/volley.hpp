#pragma once

/**
 * Volley - concurrent query batches over PostgreSQL libpq
 *
 * A header-only library providing:
 * - Deferred read queries with typed result callbacks
 * - One blocking call that runs the whole batch concurrently
 * - A per-client connection pool sized to the largest batch seen
 * - Batch-granular failure: first error cancels the rest and is rethrown
 *
 * Usage:
 *   #include "volley.hpp"
 *   using namespace volley;
 *
 * Examples:
 *   batch_client client("host=localhost dbname=mydb", "user", "pass");
 *
 *   client.enqueue_column_as_list(
 *       "SELECT id, name FROM users WHERE active = $1",
 *       {.response = [&](column_list values) { ... }, .columns = {1, 2}},
 *       true);
 *
 *   client.enqueue_rows_as_list_of_mappings(
 *       "SELECT id, total FROM orders", "id",
 *       {.response = [&](keyed_rows orders, database_connection& conn) { ... }});
 *
 *   client.execute_batch();
 */

// Core components
#include "database_error.hpp"
#include "query_result.hpp"
#include "database_connection.hpp"
#include "result_shaping.hpp"
#include "query_descriptor.hpp"
#include "query_queue.hpp"
#include "completion_tracker.hpp"
#include "connection_pool.hpp"
#include "batch_dispatcher.hpp"
#include "batch_client.hpp"

// Version information
#define VOLLEY_VERSION_MAJOR 1
#define VOLLEY_VERSION_MINOR 0
#define VOLLEY_VERSION_PATCH 0

namespace volley {

    /**
     * Library version information
     */
    constexpr struct version_info {
        int major = VOLLEY_VERSION_MAJOR;
        int minor = VOLLEY_VERSION_MINOR;
        int patch = VOLLEY_VERSION_PATCH;

        [[nodiscard]] constexpr const char* string() const noexcept {
            return "1.0.0";
        }
    } version;

} // namespace volley
