#pragma once

#include <sys/socket.h>
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <format>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "completion_tracker.hpp"
#include "connection_pool.hpp"
#include "database_connection.hpp"
#include "query_descriptor.hpp"
#include "result_shaping.hpp"

namespace volley {

    // Runs one batch: descriptor i on pool connection i, all in flight at once,
    // and returns once every query has settled.
    //
    // The calling thread serves the io_context for the whole batch, joined by
    // worker_threads - 1 extra threads. With the default of one thread every
    // response callback runs on the caller's thread.
    //
    // The first failure (query error, broken connection, throwing callback, timeout)
    // fails the batch: the queries still running are cancelled on the server, no
    // further callbacks are invoked, and once everything has settled the first
    // error is rethrown. A query still running cancel_grace after the failure has
    // its socket shut down, and a connection whose cancel request the server has
    // not acknowledged by then is closed; the pool replaces both before the next
    // batch. Callbacks never run concurrently with each other.
    class batch_dispatcher {
    public:
        struct dispatch_options {
            std::size_t worker_threads = 1;                  // the caller included
            std::optional<std::chrono::milliseconds> timeout;
            std::chrono::milliseconds cancel_grace{1000};
            bool verbose = false;
        };

        // Filled in while the batch runs, so it is meaningful after a throw too
        struct batch_report {
            std::size_t dispatched = 0;
            std::size_t callbacks_invoked = 0;
            std::size_t cancelled = 0;
            std::size_t abandoned = 0;
            std::chrono::milliseconds elapsed{0};
        };

        batch_dispatcher(net::io_context& ioc, dispatch_options options)
            : ioc_(ioc), options_(std::move(options)) {}

        batch_dispatcher(const batch_dispatcher&) = delete;
        batch_dispatcher& operator=(const batch_dispatcher&) = delete;

        void dispatch(std::vector<query_descriptor>& batch, connection_pool& pool, batch_report& report) {
            if (batch.empty()) {
                return;
            }
            if (pool.size() < batch.size()) {
                throw usage_error{std::format("Pool holds {} connections for a batch of {}",
                                              pool.size(), batch.size())};
            }

            auto started = std::chrono::steady_clock::now();
            ioc_.restart();
            batch_state state(ioc_, batch.size(), options_.cancel_grace);
            for (std::size_t i = 0; i < batch.size(); ++i) {
                state.cancellers.push_back(pool.at(i).make_canceller());
                state.sockets.push_back(pool.at(i).socket_descriptor());
            }

            for (std::size_t i = 0; i < batch.size(); ++i) {
                state.tracker.begin();
                net::co_spawn(ioc_, run_query(batch[i], pool.at(i), state),
                    [&state, i](std::exception_ptr error) {
                        settle(state, i, error);
                    });
                ++report.dispatched;
            }
            if (options_.timeout) {
                arm_deadline(state, *options_.timeout);
            }

            serve();
            state.tracker.wait();
            retire_unacknowledged(state, pool);

            report.callbacks_invoked = state.callbacks_invoked;
            report.cancelled = state.cancelled;
            report.abandoned = static_cast<std::size_t>(
                std::count(state.dropped.begin(), state.dropped.end(), true));
            report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);

            if (state.first_error) {
                std::cerr << std::format("volley: batch of {} queries failed ({} cancelled, {} abandoned): {}",
                                         batch.size(), report.cancelled, report.abandoned,
                                         describe_exception(state.first_error)) << std::endl;
                std::rethrow_exception(state.first_error);
            }

            if (options_.verbose) {
                std::cerr << std::format("volley: batch of {} queries on {} connections finished in {}ms",
                                         batch.size(), pool.size(), report.elapsed.count()) << std::endl;
            }
        }

    private:
        struct batch_state {
            batch_state(net::io_context& ioc, std::size_t size, std::chrono::milliseconds grace)
                : cancel_requests(size), settled(size, false), dropped(size, false),
                  deadline(ioc), grace_timer(ioc), cancel_grace(grace) {
                cancellers.reserve(size);
                sockets.reserve(size);
            }

            completion_tracker tracker;
            std::vector<query_canceller> cancellers;
            std::vector<int> sockets;
            std::vector<std::future<void>> cancel_requests;

            // Guards everything below and serializes response callbacks
            std::mutex mutex;
            std::vector<bool> settled;
            std::size_t settled_count = 0;
            bool failed = false;
            std::exception_ptr first_error;
            std::size_t callbacks_invoked = 0;
            std::size_t cancelled = 0;
            std::vector<bool> dropped;
            std::chrono::steady_clock::time_point grace_expiry;
            net::steady_timer deadline;
            net::steady_timer grace_timer;
            std::chrono::milliseconds cancel_grace;
        };

        static net::awaitable<void> run_query(query_descriptor& descriptor,
                                              database_connection& conn,
                                              batch_state& state) {
            auto raw = co_await conn.async_execute(descriptor.sql, descriptor.binds);
            auto shaped = shape_result(descriptor.mode, raw, descriptor.key_field, descriptor.options);

            std::lock_guard<std::mutex> lock(state.mutex);
            if (state.failed) {
                co_return;
            }
            descriptor.response(std::move(shaped), conn);
            ++state.callbacks_invoked;
        }

        static void settle(batch_state& state, std::size_t index, std::exception_ptr error) {
            {
                std::lock_guard<std::mutex> lock(state.mutex);
                state.settled[index] = true;
                if (error) {
                    record_failure(state, error);
                }
                if (++state.settled_count == state.settled.size()) {
                    state.deadline.cancel();
                    state.grace_timer.cancel();
                }
            }
            state.tracker.end();
        }

        // First failure wins: cancel the slots still running and give them
        // cancel_grace to settle. Caller holds the mutex.
        static void record_failure(batch_state& state, std::exception_ptr error) {
            if (state.failed) {
                return;
            }
            state.failed = true;
            state.first_error = error;

            state.grace_expiry = std::chrono::steady_clock::now() + state.cancel_grace;
            for (std::size_t i = 0; i < state.settled.size(); ++i) {
                if (!state.settled[i]) {
                    request_cancel(state, i);
                    ++state.cancelled;
                }
            }
            if (state.cancelled > 0) {
                arm_grace(state);
            }
        }

        // PQcancel blocks until the server answers, so it never runs on a thread
        // serving the io_context. The thread owns its PGcancel and may outlive the batch.
        static void request_cancel(batch_state& state, std::size_t index) {
            query_canceller canceller = std::move(state.cancellers[index]);
            if (!canceller.valid()) {
                return;
            }
            std::promise<void> acknowledged;
            state.cancel_requests[index] = acknowledged.get_future();
            std::thread([canceller = std::move(canceller), acknowledged = std::move(acknowledged)]() mutable {
                canceller.cancel();
                acknowledged.set_value();
            }).detach();
        }

        static void arm_deadline(batch_state& state, std::chrono::milliseconds timeout) {
            state.deadline.expires_after(timeout);
            state.deadline.async_wait([&state, timeout](const boost::system::error_code& ec) {
                if (ec == net::error::operation_aborted) {
                    return;
                }
                std::lock_guard<std::mutex> lock(state.mutex);
                if (state.settled_count == state.settled.size()) {
                    return;
                }
                record_failure(state, std::make_exception_ptr(batch_timeout_error{
                    std::format("Batch of {} queries did not finish within {}ms",
                                state.settled.size(), timeout.count())}));
            });
        }

        static void arm_grace(batch_state& state) {
            state.grace_timer.expires_after(state.cancel_grace);
            state.grace_timer.async_wait([&state](const boost::system::error_code& ec) {
                if (ec == net::error::operation_aborted) {
                    return;
                }
                std::lock_guard<std::mutex> lock(state.mutex);
                for (std::size_t i = 0; i < state.settled.size(); ++i) {
                    if (!state.settled[i]) {
                        abandon(state, i);
                    }
                }
            });
        }

        // Shutting the socket down fails the pending read with a connection error
        static void abandon(batch_state& state, std::size_t index) {
            std::cerr << std::format("volley: query on pooled connection {} outlived its cancel request, "
                                     "dropping the connection", index) << std::endl;
            if (state.sockets[index] >= 0) {
                ::shutdown(state.sockets[index], SHUT_RDWR);
            }
            state.dropped[index] = true;
        }

        // A cancel request still in flight could hit the next query on that session
        static void retire_unacknowledged(batch_state& state, connection_pool& pool) {
            for (std::size_t i = 0; i < state.cancel_requests.size(); ++i) {
                auto& request = state.cancel_requests[i];
                if (!request.valid() ||
                    request.wait_until(state.grace_expiry) == std::future_status::ready) {
                    continue;
                }
                if (!state.dropped[i]) {
                    std::cerr << std::format("volley: cancel request for pooled connection {} "
                                             "went unanswered, closing the connection", i) << std::endl;
                    state.dropped[i] = true;
                }
                pool.at(i).close();
            }
        }

        // Serve the io_context from this thread plus worker_threads - 1 others until
        // every query and timer of the batch is done
        void serve() {
            std::size_t thread_count = options_.worker_threads > 0 ? options_.worker_threads : 1;
            std::vector<std::exception_ptr> escaped(thread_count);
            std::vector<std::thread> workers;
            workers.reserve(thread_count - 1);
            for (std::size_t i = 1; i < thread_count; ++i) {
                workers.emplace_back([this, &slot = escaped[i]] { slot = drain(); });
            }

            escaped[0] = drain();
            for (auto& worker : workers) {
                worker.join();
            }
            for (const auto& error : escaped) {
                if (error) {
                    std::rethrow_exception(error);
                }
            }
        }

        // A handler that throws does not stop the batch from draining; the first
        // such exception is handed back once the io_context runs out of work
        std::exception_ptr drain() {
            std::exception_ptr escaped;
            for (;;) {
                try {
                    ioc_.run();
                    return escaped;
                } catch (...) {
                    if (!escaped) {
                        escaped = std::current_exception();
                    }
                }
            }
        }

        static std::string describe_exception(const std::exception_ptr& error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                return e.what();
            } catch (...) {
                return "non-standard exception";
            }
        }

        net::io_context& ioc_;
        dispatch_options options_;
    };

} // namespace volley
