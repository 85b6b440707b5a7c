#pragma once

#include <cstddef>
#include <deque>
#include <stdexcept>
#include <utility>
#include <vector>

namespace telemon {

// Fixed-capacity FIFO: pushing into a full history evicts the oldest entry
template<typename T>
class BoundedHistory {
public:
    explicit BoundedHistory(std::size_t capacity)
        : capacity_(capacity)
    {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedHistory capacity must be positive");
        }
    }

    void push(T value) {
        entries_.push_back(std::move(value));
        if (entries_.size() > capacity_) {
            entries_.pop_front();
        }
    }

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }

    const T& back() const { return entries_.back(); }
    const T& front() const { return entries_.front(); }

    auto begin() { return entries_.begin(); }
    auto end() { return entries_.end(); }
    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

    std::vector<T> to_vector() const {
        return std::vector<T>(entries_.begin(), entries_.end());
    }

    void clear() { entries_.clear(); }

private:
    std::size_t capacity_;
    std::deque<T> entries_;
};

} // namespace telemon
