#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "../src/volley.hpp"

using namespace volley;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

constexpr const char* TEST_CONNECTION_STRING = "host=localhost dbname=testdb";
constexpr const char* TEST_USER = "testuser";
constexpr const char* TEST_PASSWORD = "testpass";

namespace {

    // Real tables: pooled connections are separate sessions and cannot see TEMP ones
    void create_test_table(batch_client& client) {
        auto conn = client.raw_connection();
        (void)conn->execute("DROP TABLE IF EXISTS test");
        (void)conn->execute("CREATE TABLE test (test1 int, test2 varchar)");
        (void)conn->execute_params("INSERT INTO test (test1, test2) VALUES ($1, $2)", 1, "foobar");
    }

    void drop_test_table(batch_client& client) {
        auto conn = client.raw_connection();
        (void)conn->execute("DROP TABLE IF EXISTS test");
    }

} // namespace

TEST_CASE("batch_client - Mixed shapes in one batch", "[client][live]") {
    batch_client client(TEST_CONNECTION_STRING, TEST_USER, TEST_PASSWORD);
    create_test_table(client);

    column_list column_result;
    std::optional<row_mapping> row_result;
    keyed_rows keyed_result;
    row_lists lists_result;

    client.enqueue_column_as_list("select test1, test2 from test",
        {.response = [&](column_list values) { column_result = std::move(values); },
         .columns = {1, 2}});
    client.enqueue_row_as_mapping("select test1, test2 from test",
        {.response = [&](std::optional<row_mapping> row) { row_result = std::move(row); }});
    client.enqueue_rows_as_list_of_mappings("select test1, test2 from test", "test1",
        {.response = [&](keyed_rows rows) { keyed_result = std::move(rows); }});
    client.enqueue_rows_as_list_of_lists("select test1, test2 from test where test2 = $1",
        {.response = [&](row_lists rows) { lists_result = std::move(rows); }},
        "foobar");
    REQUIRE(client.queue_size() == 4);

    client.execute_batch();

    REQUIRE(column_result == column_list{"1", "foobar"});
    REQUIRE(row_result.has_value());
    REQUIRE(*row_result == row_mapping{{"test1", "1"}, {"test2", "foobar"}});
    REQUIRE(keyed_result.at("1").at("test2") == "foobar");
    REQUIRE(lists_result == row_lists{{"1", "foobar"}});
    REQUIRE(client.queue_size() == 0);

    drop_test_table(client);
}

TEST_CASE("batch_client - Every callback fires exactly once", "[client][live]") {
    batch_client client(TEST_CONNECTION_STRING, TEST_USER, TEST_PASSWORD);
    constexpr int query_count = 8;
    std::vector<int> calls(query_count, 0);
    std::set<int> backends;

    for (int i = 0; i < query_count; ++i) {
        client.enqueue_row_as_mapping("SELECT $1::int AS n, pg_backend_pid() AS pid",
            {.response = [&, i](std::optional<row_mapping> row, database_connection& conn) {
                ++calls[i];
                REQUIRE(row->at("n") == std::to_string(i));
                REQUIRE(row->at("pid") == std::to_string(conn.backend_pid()));
                backends.insert(conn.backend_pid());
            }},
            i);
    }

    client.execute_batch();

    REQUIRE(calls == std::vector<int>(query_count, 1));
    // No two queries of a batch share a connection
    REQUIRE(backends.size() == query_count);

    auto stats = client.get_stats();
    REQUIRE(stats.batches_executed == 1);
    REQUIRE(stats.queries_dispatched == query_count);
    REQUIRE(stats.callbacks_invoked == query_count);
}

TEST_CASE("batch_client - Queries run concurrently", "[client][concurrency][live]") {
    batch_client client(TEST_CONNECTION_STRING, TEST_USER, TEST_PASSWORD);
    constexpr int query_count = 4;
    int completed = 0;

    for (int i = 0; i < query_count; ++i) {
        client.enqueue_column_as_list("SELECT pg_sleep(0.5)",
            {.response = [&](column_list) { ++completed; }});
    }

    // Warm the pool so connection setup does not count against the timing
    client.execute_batch();
    REQUIRE(completed == query_count);

    for (int i = 0; i < query_count; ++i) {
        client.enqueue_column_as_list("SELECT pg_sleep(0.5)",
            {.response = [&](column_list) { ++completed; }});
    }

    auto started = std::chrono::steady_clock::now();
    client.execute_batch();
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(completed == 2 * query_count);
    REQUIRE(elapsed < 1500ms);  // sequential would take 2s
}

TEST_CASE("batch_client - Pool tracks the largest batch", "[client][pool][live]") {
    batch_client client(TEST_CONNECTION_STRING, TEST_USER, TEST_PASSWORD);
    int completed = 0;
    auto enqueue = [&](int count) {
        for (int i = 0; i < count; ++i) {
            client.enqueue_column_as_list("SELECT 1", {.response = [&](column_list) { ++completed; }});
        }
    };

    SECTION("Empty batch creates nothing") {
        client.execute_batch();
        REQUIRE(client.pool_size() == 0);
    }

    SECTION("Growth across batches") {
        std::vector<std::size_t> sizes;
        for (int count : {2, 1, 5, 3}) {
            enqueue(count);
            client.execute_batch();
            sizes.push_back(client.pool_size());
            REQUIRE(client.queue_size() == 0);
        }

        REQUIRE(sizes == std::vector<std::size_t>{2, 2, 5, 5});
        REQUIRE(completed == 11);
    }
}

TEST_CASE("batch_client - Failing query fails the batch", "[client][errors][live]") {
    batch_client client(TEST_CONNECTION_STRING, TEST_USER, TEST_PASSWORD);
    int completed = 0;

    SECTION("Invalid SQL throws and does not hang") {
        client.enqueue_column_as_list("SELECT 1", {.response = [&](column_list) { ++completed; }});
        client.enqueue_column_as_list("SELEKT nonsense", {.response = [&](column_list) { ++completed; }});

        try {
            client.execute_batch();
            FAIL("execute_batch() should have thrown");
        } catch (const query_error& e) {
            REQUIRE(e.sql_state == "42601");
        }
        REQUIRE(client.queue_size() == 0);
        REQUIRE(completed <= 1);
        REQUIRE(client.get_stats().batches_failed == 1);

        // Connections were drained, so the next batch runs normally
        client.enqueue_column_as_list("SELECT 1", {.response = [&](column_list) { ++completed; }});
        client.enqueue_column_as_list("SELECT 2", {.response = [&](column_list) { ++completed; }});
        int before = completed;
        client.execute_batch();
        REQUIRE(completed == before + 2);
        // A query error leaves the session healthy, so its connection keeps its slot
        REQUIRE(client.get_stats().connections_replaced == 0);
    }

    SECTION("Slow neighbours are cancelled") {
        client.enqueue_column_as_list("SELECT pg_sleep(30)", {.response = [&](column_list) { ++completed; }});
        client.enqueue_column_as_list("SELECT * FROM no_such_table", {.response = [&](column_list) { ++completed; }});

        auto started = std::chrono::steady_clock::now();
        REQUIRE_THROWS_AS(client.execute_batch(), query_error);
        REQUIRE(std::chrono::steady_clock::now() - started < 10s);
        REQUIRE(completed == 0);
    }

    SECTION("Unknown key field") {
        client.enqueue_rows_as_list_of_mappings("SELECT 1 AS id", "missing",
            {.response = [&](keyed_rows) { ++completed; }});
        REQUIRE_THROWS_WITH(client.execute_batch(), ContainsSubstring("missing"));
        REQUIRE(completed == 0);
    }

    SECTION("Throwing callback propagates unchanged") {
        client.enqueue_column_as_list("SELECT 1",
            {.response = [](column_list) { throw std::runtime_error("callback exploded"); }});
        REQUIRE_THROWS_WITH(client.execute_batch(), "callback exploded");
        REQUIRE(client.queue_size() == 0);
    }
}

TEST_CASE("batch_client - Batch timeout", "[client][timeout][live]") {
    batch_client client(batch_client::client_config{
        .connection_string = TEST_CONNECTION_STRING,
        .username = TEST_USER,
        .password = TEST_PASSWORD,
        .batch_timeout = 300ms
    });
    int completed = 0;

    client.enqueue_column_as_list("SELECT pg_sleep(30)", {.response = [&](column_list) { ++completed; }});
    client.enqueue_column_as_list("SELECT 1", {.response = [&](column_list) { ++completed; }});

    auto started = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(client.execute_batch(), batch_timeout_error);
    REQUIRE(std::chrono::steady_clock::now() - started < 10s);
    REQUIRE(completed == 1);
    REQUIRE(client.queue_size() == 0);

    // The cancelled connection is still usable
    client.enqueue_column_as_list("SELECT 1", {.response = [&](column_list) { ++completed; }});
    client.enqueue_column_as_list("SELECT 2", {.response = [&](column_list) { ++completed; }});
    client.execute_batch();
    REQUIRE(completed == 3);
    REQUIRE(client.get_stats().connections_replaced == 0);
}

TEST_CASE("batch_client - Several I/O workers", "[client][concurrency][live]") {
    batch_client client(batch_client::client_config{
        .connection_string = TEST_CONNECTION_STRING,
        .username = TEST_USER,
        .password = TEST_PASSWORD,
        .worker_threads = 4
    });
    constexpr int query_count = 12;
    std::atomic<bool> in_callback{false};
    std::atomic<int> overlaps{0};
    std::vector<std::size_t> row_counts(query_count, 0);
    int completed = 0;  // callbacks are serialized, so no atomic needed

    for (int i = 0; i < query_count; ++i) {
        client.enqueue_rows_as_list_of_lists("SELECT generate_series(1, $1)",
            {.response = [&, i](row_lists rows) {
                if (in_callback.exchange(true)) {
                    ++overlaps;
                }
                row_counts[i] = rows.size();
                std::this_thread::sleep_for(5ms);
                ++completed;
                in_callback = false;
            }},
            i + 1);
    }

    client.execute_batch();
    REQUIRE(completed == query_count);
    REQUIRE(overlaps == 0);
    for (int i = 0; i < query_count; ++i) {
        REQUIRE(row_counts[i] == static_cast<std::size_t>(i + 1));
    }
}

TEST_CASE("batch_client - Callbacks run on the calling thread", "[client][concurrency][live]") {
    batch_client client(TEST_CONNECTION_STRING, TEST_USER, TEST_PASSWORD);
    std::vector<std::thread::id> callback_threads;

    for (int i = 0; i < 3; ++i) {
        client.enqueue_column_as_list("SELECT 1",
            {.response = [&](column_list) { callback_threads.push_back(std::this_thread::get_id()); }});
    }

    client.execute_batch();
    REQUIRE(callback_threads == std::vector<std::thread::id>(3, std::this_thread::get_id()));
}

TEST_CASE("batch_client - Connection lost mid-batch", "[client][errors][live]") {
    batch_client client(TEST_CONNECTION_STRING, TEST_USER, TEST_PASSWORD);
    int victim_pid = 0;
    int completed = 0;

    client.enqueue_column_as_list("SELECT 1",
        {.response = [&](column_list, database_connection& conn) { victim_pid = conn.backend_pid(); }});
    client.enqueue_column_as_list("SELECT 1", {.response = [&](column_list) { ++completed; }});
    client.execute_batch();
    REQUIRE(victim_pid > 0);

    // Slot 0 runs the first query of every batch, so the sleeper lands on victim_pid
    auto admin = client.raw_connection();
    client.enqueue_column_as_list("SELECT pg_sleep(30)", {.response = [&](column_list) { ++completed; }});
    client.enqueue_column_as_list("SELECT 1", {.response = [&](column_list) { ++completed; }});

    std::thread killer([&]() {
        std::this_thread::sleep_for(300ms);
        (void)admin->execute_params("SELECT pg_terminate_backend($1)", victim_pid);
    });

    auto started = std::chrono::steady_clock::now();
    std::exception_ptr failure;
    try {
        client.execute_batch();
    } catch (...) {
        failure = std::current_exception();
    }
    killer.join();

    REQUIRE(failure);
    REQUIRE(std::chrono::steady_clock::now() - started < 10s);
    try {
        std::rethrow_exception(failure);
    } catch (const connection_error& e) {
        REQUIRE_THAT(e.what(), ContainsSubstring("DB error"));
        REQUIRE_THAT(e.what(), ContainsSubstring("batch_client_test.cpp:"));
        REQUIRE_THAT(e.what(), ContainsSubstring(describe_location(e.location)));
        REQUIRE(e.sql_state == "57P01");
    }
    REQUIRE(client.queue_size() == 0);
    REQUIRE(client.get_stats().batches_failed == 1);

    // The dead slot is replaced in place and the next batch runs normally
    int before = completed;
    client.enqueue_column_as_list("SELECT 1", {.response = [&](column_list) { ++completed; }});
    client.enqueue_column_as_list("SELECT 2", {.response = [&](column_list) { ++completed; }});
    client.execute_batch();

    REQUIRE(completed == before + 2);
    auto stats = client.get_stats();
    REQUIRE(stats.connections_replaced == 1);
    REQUIRE(stats.pool_size == 2);
}

TEST_CASE("batch_client - Callbacks may enqueue follow-up work", "[client][live]") {
    batch_client client(TEST_CONNECTION_STRING, TEST_USER, TEST_PASSWORD);
    std::optional<row_mapping> follow_up;

    client.enqueue_column_as_list("SELECT 7", {.response = [&](column_list values) {
        client.enqueue_row_as_mapping("SELECT $1::int * 6 AS answer",
            {.response = [&](std::optional<row_mapping> row) { follow_up = std::move(row); }},
            values.at(0));
    }});

    client.execute_batch();
    REQUIRE(client.queue_size() == 1);
    REQUIRE_FALSE(follow_up.has_value());

    client.execute_batch();
    REQUIRE(client.queue_size() == 0);
    REQUIRE(follow_up->at("answer") == "42");
}

TEST_CASE("batch_client - Raw connection bypasses the queue", "[client][live]") {
    batch_client client(TEST_CONNECTION_STRING, TEST_USER, TEST_PASSWORD);
    client.enqueue_column_as_list("SELECT 1", {.response = [](column_list) {}});

    auto conn = client.raw_connection();
    REQUIRE(conn->is_connected());
    REQUIRE(conn->execute("SELECT current_setting('application_name')").get<std::string>(0, 0) == "volley");
    REQUIRE(client.queue_size() == 1);
    REQUIRE(client.pool_size() == 0);
}
