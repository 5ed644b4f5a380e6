#include <iostream>
#include "../src/volley.hpp"

using namespace volley;

constexpr const char* CONNECTION_STRING = "host=localhost dbname=testdb";

int main() {
    try {
        batch_client client(batch_client::client_config{
            .connection_string = CONNECTION_STRING,
            .username = "testuser",
            .password = "testpass",
            .verbose = true
        });

        {
            auto conn = client.raw_connection();
            std::cout << "Connected to: " << conn->database_name() << "\n";
        }

        client.enqueue_row_as_mapping("SELECT current_database() AS db, version() AS version",
            {.response = [](std::optional<row_mapping> row) {
                if (row) {
                    std::cout << "Server: " << row->at("version").value_or("Unknown") << "\n";
                }
            }});

        client.enqueue_column_as_list("SELECT datname FROM pg_database ORDER BY datname",
            {.response = [](column_list names) {
                std::cout << "Databases:";
                for (const auto& name : names) {
                    std::cout << " " << name.value_or("NULL");
                }
                std::cout << "\n";
            }});

        client.enqueue_rows_as_list_of_mappings(
            "SELECT oid::text AS oid, typname FROM pg_type WHERE typname = ANY($1::text[])", "typname",
            {.response = [](keyed_rows types) {
                for (const auto& [name, row] : types) {
                    std::cout << name << " has oid " << row.at("oid").value_or("?") << "\n";
                }
            }},
            "{int4,text,bool}");

        client.enqueue_rows_as_list_of_lists("SELECT n, n * n FROM generate_series(1, 10) AS n",
            {.response = [](row_lists rows, database_connection& conn) {
                std::cout << "Squares from backend " << conn.backend_pid() << ":";
                for (const auto& row : rows) {
                    std::cout << " " << row[1].value_or("NULL");
                }
                std::cout << "\n";
            },
             .max_rows = 5});

        client.execute_batch();

        auto stats = client.get_stats();
        std::cout << stats.queries_dispatched << " queries on " << stats.pool_size
                  << " connections in " << stats.last_batch_duration.count() << "ms\n";
        return 0;
    } catch (const database_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
