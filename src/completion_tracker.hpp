#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>

namespace volley {

    // Wait group for one batch: begin() per dispatched query, end() per completion,
    // wait() blocks until every begin() has been matched.
    class completion_tracker {
    public:
        completion_tracker() = default;

        completion_tracker(const completion_tracker&) = delete;
        completion_tracker& operator=(const completion_tracker&) = delete;

        void begin() {
            std::lock_guard<std::mutex> lock(mutex_);
            ++outstanding_;
        }

        void end() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (outstanding_ == 0) {
                throw std::logic_error{"completion_tracker::end() without a matching begin()"};
            }
            if (--outstanding_ == 0) {
                cv_.notify_all();
            }
        }

        void wait() {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return outstanding_ == 0; });
        }

        // Returns false if work is still outstanding when the timeout expires
        template<typename Rep, typename Period>
        [[nodiscard]] bool wait_for(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
        }

        [[nodiscard]] std::size_t outstanding() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return outstanding_;
        }

        [[nodiscard]] bool idle() const {
            return outstanding() == 0;
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::size_t outstanding_{0};
    };

} // namespace volley
