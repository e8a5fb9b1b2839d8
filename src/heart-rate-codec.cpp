#include "heart-rate-codec.hpp"

static uint16_t ReadUint16Le(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

static void WriteUint16Le(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>(value >> 8));
}

// RR intervals travel in units of 1/1024 s
static uint16_t RrRawToMs(uint16_t raw) {
    return static_cast<uint16_t>((static_cast<uint32_t>(raw) * 1000 + 512) / 1024);
}

static uint16_t RrMsToRaw(uint16_t ms) {
    uint32_t raw = (static_cast<uint32_t>(ms) * 1024 + 500) / 1000;
    return raw > 0xFFFF ? 0xFFFF : static_cast<uint16_t>(raw);
}

DecodeResult<HeartRateMeasurement> DecodeHeartRate(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return DecodeFailure{ "empty heart rate frame" };
    }

    uint8_t flags = bytes[0];
    bool is_u16 = flags & kHrFlagValueUint16;

    HeartRateMeasurement m;
    size_t offset = 1;
    if (is_u16) {
        if (bytes.size() < 3) {
            return DecodeFailure{ "truncated UINT16 heart rate value (" + std::to_string(bytes.size()) + " bytes)" };
        }
        m.bpm = ReadUint16Le(bytes, offset);
        offset += 2;
    } else {
        if (bytes.size() < 2) {
            return DecodeFailure{ "missing UINT8 heart rate value" };
        }
        m.bpm = bytes[offset];
        offset += 1;
    }

    m.sensor_contact_supported = flags & kHrFlagContactSupported;
    m.sensor_contact_detected = m.sensor_contact_supported && (flags & kHrFlagContactDetected);

    if (flags & kHrFlagEnergyExpended) {
        if (bytes.size() < offset + 2) {
            return m;
        }
        m.energy_expended_kj = ReadUint16Le(bytes, offset);
        offset += 2;
    }

    if (flags & kHrFlagRrIntervals) {
        while (offset + 2 <= bytes.size()) {
            m.rr_intervals_ms.push_back(RrRawToMs(ReadUint16Le(bytes, offset)));
            offset += 2;
        }
    }

    return m;
}

DecodeResult<uint8_t> DecodeBatteryLevel(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return DecodeFailure{ "empty battery level value" };
    }
    return bytes[0];
}

std::vector<uint8_t> EncodeHeartRate(const HeartRateMeasurement& m) {
    uint8_t flags = 0;
    if (m.bpm > 0xFF) flags |= kHrFlagValueUint16;
    if (m.sensor_contact_supported) {
        flags |= kHrFlagContactSupported;
        if (m.sensor_contact_detected) flags |= kHrFlagContactDetected;
    }
    if (m.energy_expended_kj) flags |= kHrFlagEnergyExpended;
    if (!m.rr_intervals_ms.empty()) flags |= kHrFlagRrIntervals;

    std::vector<uint8_t> out;
    out.push_back(flags);
    if (flags & kHrFlagValueUint16) {
        WriteUint16Le(out, m.bpm);
    } else {
        out.push_back(static_cast<uint8_t>(m.bpm));
    }
    if (m.energy_expended_kj) {
        WriteUint16Le(out, *m.energy_expended_kj);
    }
    for (uint16_t rr : m.rr_intervals_ms) {
        WriteUint16Le(out, RrMsToRaw(rr));
    }
    return out;
}
