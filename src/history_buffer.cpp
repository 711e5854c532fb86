#include "vitalmon/history_buffer.hpp"

namespace vitalmon {

namespace series {

std::string cpu_core(size_t index) {
    return "cpu." + std::to_string(index);
}

const char* const kMemoryPercent = "memory.percent";
const char* const kNetSent = "net.sent";
const char* const kNetRecv = "net.recv";

} // namespace series

HistoryBuffer::HistoryBuffer(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1))
{
}

void HistoryBuffer::push(const std::string& series_id, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(series_id);
    if (it == series_.end()) {
        it = series_.emplace(series_id, BoundedSeries<double>(capacity_)).first;
    }
    it->second.push(value);
}

std::vector<double> HistoryBuffer::snapshot(const std::string& series_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(series_id);
    if (it == series_.end()) {
        return {};
    }
    return it->second.snapshot();
}

void HistoryBuffer::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : series_) {
        entry.second.clear();
    }
}

void HistoryBuffer::set_capacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = std::max<size_t>(capacity, 1);
    for (auto& entry : series_) {
        entry.second.set_capacity(capacity_);
    }
}

size_t HistoryBuffer::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

size_t HistoryBuffer::size(const std::string& series_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(series_id);
    return it == series_.end() ? 0 : it->second.size();
}

std::vector<std::string> HistoryBuffer::series_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(series_.size());
    for (const auto& entry : series_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace vitalmon
