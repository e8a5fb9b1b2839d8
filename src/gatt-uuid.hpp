#pragma once
#include <cstdint>
#include <string>

// 16-bit SIG-assigned UUID, expanded on the Bluetooth base UUID
// 0000xxxx-0000-1000-8000-00805f9b34fb
struct GattUuid {
    uint16_t short_id = 0;

    std::string ToString() const;

    bool operator==(const GattUuid& other) const { return short_id == other.short_id; }
    bool operator!=(const GattUuid& other) const { return short_id != other.short_id; }
};

constexpr GattUuid kHeartRateService{ 0x180D };
constexpr GattUuid kHeartRateMeasurementChar{ 0x2A37 };
constexpr GattUuid kBatteryService{ 0x180F };
constexpr GattUuid kBatteryLevelChar{ 0x2A19 };
