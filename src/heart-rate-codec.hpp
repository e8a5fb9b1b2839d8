#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Flags byte of the Heart Rate Measurement characteristic (0x2A37)
constexpr uint8_t kHrFlagValueUint16 = 0x01;
constexpr uint8_t kHrFlagContactDetected = 0x02;
constexpr uint8_t kHrFlagContactSupported = 0x04;
constexpr uint8_t kHrFlagEnergyExpended = 0x08;
constexpr uint8_t kHrFlagRrIntervals = 0x10;

struct HeartRateMeasurement {
    uint16_t bpm = 0;
    bool sensor_contact_supported = false;
    bool sensor_contact_detected = false;
    std::optional<uint16_t> energy_expended_kj;
    std::vector<uint16_t> rr_intervals_ms;
};

struct DecodeFailure {
    std::string reason;
};

template <typename T>
using DecodeResult = std::variant<T, DecodeFailure>;

// Only a missing or truncated bpm field fails; truncated optional fields are dropped.
DecodeResult<HeartRateMeasurement> DecodeHeartRate(const std::vector<uint8_t>& bytes);

// Battery Level (0x2A19). Values above 100 are returned as reported.
DecodeResult<uint8_t> DecodeBatteryLevel(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> EncodeHeartRate(const HeartRateMeasurement& measurement);
