#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

constexpr size_t kReadingsCapacity = 10;

// Most-recent-first; adding to a full log evicts the oldest entry.
class ReadingsLog {
public:
    explicit ReadingsLog(size_t capacity = kReadingsCapacity) : capacity_(capacity) {}

    void Add(std::string entry);
    void Clear() { entries_.clear(); }

    std::vector<std::string> Entries() const { return { entries_.begin(), entries_.end() }; }
    size_t Size() const { return entries_.size(); }
    size_t Capacity() const { return capacity_; }
    bool Empty() const { return entries_.empty(); }

private:
    size_t capacity_;
    std::deque<std::string> entries_;
};

// "HR: 75bpm - 14:03:27", local wall-clock time
std::string FormatReading(uint16_t bpm, std::chrono::system_clock::time_point at);
