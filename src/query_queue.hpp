#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "query_descriptor.hpp"

namespace volley {

    // Pending descriptors in enqueue order
    class query_queue {
    public:
        using container_type = std::vector<query_descriptor>;
        using const_iterator = container_type::const_iterator;

        void push(query_descriptor descriptor) {
            items_.push_back(std::move(descriptor));
        }

        [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
        [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

        [[nodiscard]] const query_descriptor& operator[](std::size_t index) const {
            return items_[index];
        }

        [[nodiscard]] const_iterator begin() const noexcept { return items_.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return items_.end(); }

        // Drop everything without running it
        void clear() noexcept {
            items_.clear();
        }

        // Move every descriptor out, leaving the queue empty
        [[nodiscard]] container_type take() noexcept {
            return std::exchange(items_, container_type{});
        }

    private:
        container_type items_;
    };

} // namespace volley
