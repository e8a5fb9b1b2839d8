#include "readings-log.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

void ReadingsLog::Add(std::string entry) {
    if (capacity_ == 0) return;
    while (entries_.size() >= capacity_) {
        entries_.pop_back();
    }
    entries_.push_front(std::move(entry));
}

std::string FormatReading(uint16_t bpm, std::chrono::system_clock::time_point at) {
    std::time_t t = std::chrono::system_clock::to_time_t(at);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    std::stringstream ss;
    ss << "HR: " << bpm << "bpm - " << std::put_time(&local, "%H:%M:%S");
    return ss.str();
}
