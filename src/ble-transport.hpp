#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gatt-uuid.hpp"

struct Peripheral {
    std::string id;
    std::optional<std::string> display_name;
    std::optional<int> rssi;
};

using ConnectionHandle = uint64_t;
constexpr ConnectionHandle kNoConnection = 0;

struct ScanFilter {
    // Empty means report every advertiser
    std::vector<GattUuid> services;
};

// Completion callbacks carry an error string that is empty on success.
using ScanCallback = std::function<void(const std::string& error, const Peripheral& peripheral)>;
using ConnectCallback = std::function<void(const std::string& error, ConnectionHandle handle)>;
using CompletionCallback = std::function<void(const std::string& error)>;
using ValueCallback = std::function<void(const std::string& error, const std::vector<uint8_t>& value)>;
using DisconnectCallback = std::function<void(const std::string& peripheral_id)>;

// Radio access. Every call returns immediately; results arrive on the callbacks,
// possibly on another thread.
class BleTransport {
public:
    virtual ~BleTransport() = default;

    virtual void StartScan(const ScanFilter& filter, ScanCallback callback) = 0;
    virtual void StopScan() = 0;
    virtual void Connect(const std::string& peripheral_id, ConnectCallback callback) = 0;
    virtual void DiscoverServices(ConnectionHandle handle, CompletionCallback callback) = 0;
    virtual void SubscribeNotifications(ConnectionHandle handle, GattUuid service, GattUuid characteristic,
                                        ValueCallback callback) = 0;
    virtual void UnsubscribeNotifications(ConnectionHandle handle, GattUuid service, GattUuid characteristic) = 0;
    virtual void ReadCharacteristic(ConnectionHandle handle, GattUuid service, GattUuid characteristic,
                                    ValueCallback callback) = 0;
    virtual void Disconnect(ConnectionHandle handle, CompletionCallback callback) = 0;
    // Fires only for link losses that Disconnect() did not cause.
    virtual void OnUnsolicitedDisconnect(ConnectionHandle handle, DisconnectCallback callback) = 0;

    static std::shared_ptr<BleTransport> Create();
};
