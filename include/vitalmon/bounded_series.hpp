#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace vitalmon {

constexpr size_t kDefaultHistoryCapacity = 60;

// Fixed-capacity ring buffer; pushing into a full series drops the oldest value
template<typename T>
class BoundedSeries {
public:
    explicit BoundedSeries(size_t capacity = kDefaultHistoryCapacity)
        : capacity_(std::max<size_t>(capacity, 1))
    {
        data_.reserve(capacity_);
    }

    void push(T value) {
        if (data_.size() < capacity_) {
            data_.push_back(std::move(value));
            return;
        }
        data_[head_] = std::move(value);
        head_ = (head_ + 1) % capacity_;
    }

    // Oldest first
    std::vector<T> snapshot() const {
        std::vector<T> out;
        out.reserve(data_.size());
        for (size_t i = 0; i < data_.size(); ++i) {
            out.push_back(data_[(head_ + i) % data_.size()]);
        }
        return out;
    }

    // Shrinking keeps the newest values
    void set_capacity(size_t capacity) {
        capacity = std::max<size_t>(capacity, 1);
        std::vector<T> values = snapshot();
        if (values.size() > capacity) {
            values.erase(values.begin(), values.end() - static_cast<std::ptrdiff_t>(capacity));
        }
        capacity_ = capacity;
        head_ = 0;
        data_ = std::move(values);
        data_.reserve(capacity_);
    }

    void clear() {
        data_.clear();
        head_ = 0;
    }

    size_t size() const { return data_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return data_.empty(); }

private:
    std::vector<T> data_;
    size_t head_ = 0;        // index of the oldest value once full
    size_t capacity_;
};

} // namespace vitalmon
