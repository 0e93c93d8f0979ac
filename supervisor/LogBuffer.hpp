/**
 * \file supervisor/LogBuffer.hpp
 * \brief Fixed-capacity ring of log entries; the oldest entry is evicted first.
 * \ingroup supervisor_module
 * \details Not synchronized. The owning supervisor guards it with its own mutex.
 */
#pragma once

#include "ServiceConfig.hpp"

#include <cstddef>
#include <deque>
#include <vector>

namespace supervisor {

class LogBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit LogBuffer(std::size_t capacity = kDefaultCapacity);

    void push(LogEntry entry);
    std::vector<LogEntry> snapshot() const;
    void clear() { entries_.clear(); }

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<LogEntry> entries_;
};

} // namespace supervisor
