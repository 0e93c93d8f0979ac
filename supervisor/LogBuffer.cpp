#include "LogBuffer.hpp"

#include <stdexcept>

namespace supervisor {

LogBuffer::LogBuffer(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("LogBuffer capacity must be positive");
    }
}

void LogBuffer::push(LogEntry entry) {
    if (entries_.size() == capacity_) {
        entries_.pop_front();
    }
    entries_.push_back(std::move(entry));
}

std::vector<LogEntry> LogBuffer::snapshot() const {
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

} // namespace supervisor
