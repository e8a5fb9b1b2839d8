#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include "ble-transport.hpp"
#include <util/base.h>

#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Foundation.Collections.h>
#include <winrt/Windows.Devices.Bluetooth.h>
#include <winrt/Windows.Devices.Bluetooth.Advertisement.h>
#include <winrt/Windows.Devices.Bluetooth.GenericAttributeProfile.h>
#include <winrt/Windows.Storage.Streams.h>

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <vector>

using namespace winrt;
using namespace Windows::Foundation;
using namespace Windows::Devices::Bluetooth;
using namespace Windows::Devices::Bluetooth::Advertisement;
using namespace Windows::Devices::Bluetooth::GenericAttributeProfile;
using namespace Windows::Storage::Streams;

// Helper to check for valid UTF-8
static bool IsValidUtf8(const std::vector<uint8_t>& data) {
    int n;
    for (size_t i = 0; i < data.size(); ++i) {
        if ((data[i] & 0x80) == 0) {
            n = 0;
        } else if ((data[i] & 0xE0) == 0xC0) {
            n = 1;
        } else if ((data[i] & 0xF0) == 0xE0) {
            n = 2;
        } else if ((data[i] & 0xF8) == 0xF0) {
            n = 3;
        } else {
            return false;
        }
        for (int j = 0; j < n; ++j) {
            if (++i == data.size() || (data[i] & 0xC0) != 0x80) {
                return false;
            }
        }
    }
    return true;
}

// Helper to convert Bytes (likely GBK) to UTF-8
static std::string BytesToUtf8(const std::vector<uint8_t>& bytes, UINT codepage) {
    if (bytes.empty()) return "";
    int len = MultiByteToWideChar(codepage, 0, (LPCSTR)bytes.data(), (int)bytes.size(), NULL, 0);
    if (len <= 0) return "";
    std::wstring wstr(len, 0);
    MultiByteToWideChar(codepage, 0, (LPCSTR)bytes.data(), (int)bytes.size(), &wstr[0], len);
    return to_string(wstr);
}

// Trailing 0x00/0xFF padding shows up in some bands' name sections
static void TrimRawBytes(std::vector<uint8_t>& bytes) {
    while (!bytes.empty() && (bytes.back() == 0x00 || bytes.back() == 0xFF)) {
        bytes.pop_back();
    }
}

static std::vector<uint8_t> ReadBytes(IBuffer const& buffer) {
    auto reader = DataReader::FromBuffer(buffer);
    std::vector<uint8_t> bytes(reader.UnconsumedBufferLength());
    if (!bytes.empty()) {
        reader.ReadBytes(bytes);
    }
    return bytes;
}

// Complete (0x09) beats Shortened (0x08) local name; falls back to the OS-parsed name
static std::string DecodeLocalName(BluetoothLEAdvertisement const& advertisement) {
    std::string name;
    for (auto section : advertisement.DataSections()) {
        uint8_t type = section.DataType();
        if (type != 0x09 && type != 0x08) continue;

        std::vector<uint8_t> bytes = ReadBytes(section.Data());
        TrimRawBytes(bytes);
        if (bytes.empty()) continue;

        std::string s;
        if (IsValidUtf8(bytes)) {
            s.assign(bytes.begin(), bytes.end());
        } else {
            // Try GBK (936)
            s = BytesToUtf8(bytes, 936);
        }
        if (!s.empty() && (name.empty() || type == 0x09)) name = s;
    }

    if (name.empty()) {
        name = to_string(advertisement.LocalName());
    }
    return name;
}

static guid ToGuid(GattUuid uuid) {
    return guid{ static_cast<uint32_t>(uuid.short_id), 0x0000, 0x1000,
                 { 0x80, 0x00, 0x00, 0x80, 0x5f, 0x9b, 0x34, 0xfb } };
}

static uint32_t CharacteristicKey(GattUuid service, GattUuid characteristic) {
    return (static_cast<uint32_t>(service.short_id) << 16) | characteristic.short_id;
}

class BleTransportWinRT : public BleTransport, public std::enable_shared_from_this<BleTransportWinRT> {
    struct Link {
        std::string peripheral_id;
        BluetoothLEDevice device{ nullptr };
        event_token status_token;
        DisconnectCallback on_disconnect;
        std::vector<GattDeviceService> services;
        std::map<uint32_t, GattCharacteristic> characteristics;
        std::map<uint32_t, event_token> value_tokens;
        bool closing = false;
    };

    BluetoothLEAdvertisementWatcher watcher_{ nullptr };

    std::mutex mutex_;
    bool is_scanning_ = false;
    ScanCallback scan_callback_;
    std::vector<guid> scan_services_;
    // Addresses that advertised a filtered service during this scan; their
    // scan responses (which carry the name) are accepted too
    std::set<uint64_t> matched_addresses_;

    std::map<ConnectionHandle, std::shared_ptr<Link>> links_;
    ConnectionHandle next_handle_ = 1;

public:
    BleTransportWinRT() {
        watcher_ = BluetoothLEAdvertisementWatcher();
        watcher_.ScanningMode(BluetoothLEScanningMode::Active);

        watcher_.Received([this](BluetoothLEAdvertisementWatcher const&,
                                 BluetoothLEAdvertisementReceivedEventArgs const& args) {
            OnAdvertisement(args);
        });

        watcher_.Stopped([this](BluetoothLEAdvertisementWatcher const&,
                                BluetoothLEAdvertisementWatcherStoppedEventArgs const& args) {
            ScanCallback callback;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!is_scanning_ || args.Error() == BluetoothError::Success) return;
                is_scanning_ = false;
                callback = scan_callback_;
            }
            if (callback) {
                callback("watcher stopped with Bluetooth error " + std::to_string((int)args.Error()), Peripheral{});
            }
        });
    }

    ~BleTransportWinRT() {
        StopScan();
        std::map<ConnectionHandle, std::shared_ptr<Link>> links;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            links.swap(links_);
        }
        for (auto& [handle, link] : links) {
            Release(*link);
        }
    }

    void StartScan(const ScanFilter& filter, ScanCallback callback) override {
        std::string error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            scan_callback_ = callback;
            scan_services_.clear();
            for (auto& uuid : filter.services) {
                scan_services_.push_back(ToGuid(uuid));
            }
            matched_addresses_.clear();
            if (!is_scanning_) {
                try {
                    watcher_.Start();
                    is_scanning_ = true;
                } catch (hresult_error const& e) {
                    error = to_string(e.message());
                }
            }
        }
        if (!error.empty()) {
            blog(LOG_WARNING, "Failed to start advertisement watcher: %s", error.c_str());
            callback(error, Peripheral{});
        }
    }

    void StopScan() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_scanning_) {
            is_scanning_ = false;
            try {
                watcher_.Stop();
            } catch (hresult_error const& e) {
                blog(LOG_WARNING, "Failed to stop advertisement watcher: %s", to_string(e.message()).c_str());
            }
        }
        scan_callback_ = nullptr;
    }

    void Connect(const std::string& peripheral_id, ConnectCallback callback) override {
        ConnectAsync(peripheral_id, std::move(callback));
    }

    void DiscoverServices(ConnectionHandle handle, CompletionCallback callback) override {
        DiscoverServicesAsync(handle, std::move(callback));
    }

    void SubscribeNotifications(ConnectionHandle handle, GattUuid service, GattUuid characteristic,
                                ValueCallback callback) override {
        SubscribeAsync(handle, service, characteristic, std::move(callback));
    }

    void UnsubscribeNotifications(ConnectionHandle handle, GattUuid service, GattUuid characteristic) override {
        GattCharacteristic chr{ nullptr };
        event_token token{};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto link = FindLinkLocked(handle);
            if (!link) return;
            uint32_t key = CharacteristicKey(service, characteristic);
            auto c = link->characteristics.find(key);
            if (c != link->characteristics.end()) chr = c->second;
            auto t = link->value_tokens.find(key);
            if (t != link->value_tokens.end()) {
                token = t->second;
                link->value_tokens.erase(t);
            }
        }
        if (!chr) return;

        try {
            if (token.value != 0) {
                chr.ValueChanged(token);
            }
            // Write None to CCCD so the device stops notifying; bounded wait
            auto op = chr.WriteClientCharacteristicConfigurationDescriptorAsync(
                GattClientCharacteristicConfigurationDescriptorValue::None);
            if (op.wait_for(std::chrono::seconds(1)) != AsyncStatus::Completed) {
                op.Cancel();
            }
        } catch (hresult_error const& e) {
            blog(LOG_DEBUG, "Unsubscribe from %s: %s", characteristic.ToString().c_str(),
                 to_string(e.message()).c_str());
        }
    }

    void ReadCharacteristic(ConnectionHandle handle, GattUuid service, GattUuid characteristic,
                            ValueCallback callback) override {
        ReadAsync(handle, service, characteristic, std::move(callback));
    }

    void Disconnect(ConnectionHandle handle, CompletionCallback callback) override {
        std::shared_ptr<Link> link;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = links_.find(handle);
            if (it != links_.end()) {
                link = it->second;
                link->closing = true;
                links_.erase(it);
            }
        }
        if (!link) {
            // Already released after a link loss
            callback("");
            return;
        }
        callback(Release(*link));
    }

    void OnUnsolicitedDisconnect(ConnectionHandle handle, DisconnectCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto link = FindLinkLocked(handle);
        if (!link) {
            blog(LOG_DEBUG, "No link for handle %llu, disconnect watch not installed", handle);
            return;
        }
        link->on_disconnect = std::move(callback);
    }

private:
    std::shared_ptr<Link> FindLinkLocked(ConnectionHandle handle) {
        auto it = links_.find(handle);
        return it == links_.end() ? nullptr : it->second;
    }

    std::shared_ptr<Link> FindLink(ConnectionHandle handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        return FindLinkLocked(handle);
    }

    // Null once the link has been released
    BluetoothLEDevice LinkDevice(Link& link) {
        std::lock_guard<std::mutex> lock(mutex_);
        return link.closing ? nullptr : link.device;
    }

    void OnAdvertisement(BluetoothLEAdvertisementReceivedEventArgs const& args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_scanning_ || !scan_callback_) return;

        uint64_t address = args.BluetoothAddress();
        if (!scan_services_.empty() && !matched_addresses_.count(address)) {
            bool matched = false;
            for (auto uuid : args.Advertisement().ServiceUuids()) {
                for (auto& wanted : scan_services_) {
                    if (uuid == wanted) matched = true;
                }
            }
            if (!matched) return;
            matched_addresses_.insert(address);
        }

        Peripheral peripheral;
        peripheral.id = std::to_string(address);
        peripheral.rssi = args.RawSignalStrengthInDBm();
        std::string name = DecodeLocalName(args.Advertisement());
        if (!name.empty()) {
            peripheral.display_name = name;
        }
        scan_callback_("", peripheral);
    }

    void OnConnectionStatusChanged(ConnectionHandle handle, BluetoothConnectionStatus status) {
        if (status != BluetoothConnectionStatus::Disconnected) return;

        std::shared_ptr<Link> link;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = links_.find(handle);
            if (it == links_.end() || it->second->closing) return;
            link = it->second;
            link->closing = true;
            links_.erase(it);
        }

        blog(LOG_INFO, "Link to %s lost", link->peripheral_id.c_str());
        std::string error = Release(*link);
        if (!error.empty()) {
            blog(LOG_DEBUG, "Releasing lost link: %s", error.c_str());
        }
        if (link->on_disconnect) {
            link->on_disconnect(link->peripheral_id);
        }
    }

    // Drops every event registration and closes the device. Returns the error text, if any.
    // The link state is taken under the lock; coroutines still in flight see `closing`
    // and leave the link alone.
    std::string Release(Link& link) {
        std::vector<GattDeviceService> services;
        std::map<uint32_t, GattCharacteristic> characteristics;
        std::map<uint32_t, event_token> value_tokens;
        BluetoothLEDevice device{ nullptr };
        event_token status_token{};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            link.closing = true;
            services.swap(link.services);
            characteristics.swap(link.characteristics);
            value_tokens.swap(link.value_tokens);
            std::swap(device, link.device);
            std::swap(status_token, link.status_token);
        }

        try {
            for (auto& [key, token] : value_tokens) {
                auto c = characteristics.find(key);
                if (c != characteristics.end() && token.value != 0) {
                    c->second.ValueChanged(token);
                }
            }
            for (auto& service : services) {
                service.Close();
            }

            if (device) {
                if (status_token.value != 0) {
                    device.ConnectionStatusChanged(status_token);
                }
                device.Close();
            }
        } catch (hresult_error const& e) {
            return to_string(e.message());
        }
        return "";
    }

    fire_and_forget ConnectAsync(std::string peripheral_id, ConnectCallback callback) {
        // Keep alive while async
        auto self = shared_from_this();

        uint64_t address = 0;
        try {
            address = std::stoull(peripheral_id);
        } catch (const std::exception&) {
            address = 0;
        }
        if (address == 0) {
            callback("invalid device id '" + peripheral_id + "'", kNoConnection);
            co_return;
        }

        std::string error;
        try {
            blog(LOG_INFO, "Connecting to device address: %llu", address);
            auto device = co_await BluetoothLEDevice::FromBluetoothAddressAsync(address);
            if (!device) {
                callback("failed to get device object", kNoConnection);
                co_return;
            }

            // An uncached service query forces the link up
            auto services = co_await device.GetGattServicesAsync(BluetoothCacheMode::Uncached);
            if (services.Status() != GattCommunicationStatus::Success) {
                device.Close();
                callback("device unreachable, status " + std::to_string((int)services.Status()), kNoConnection);
                co_return;
            }

            auto link = std::make_shared<Link>();
            link->peripheral_id = peripheral_id;
            link->device = device;

            ConnectionHandle handle;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                handle = next_handle_++;
                links_[handle] = link;

                std::weak_ptr<BleTransportWinRT> weak = self;
                link->status_token = device.ConnectionStatusChanged(
                    [weak, handle](BluetoothLEDevice const& sender, IInspectable const&) {
                        if (auto transport = weak.lock()) {
                            transport->OnConnectionStatusChanged(handle, sender.ConnectionStatus());
                        }
                    });
            }
            callback("", handle);
        } catch (hresult_error const& e) {
            error = to_string(e.message());
        }

        if (!error.empty()) {
            blog(LOG_ERROR, "Exception in ConnectAsync: %s", error.c_str());
            callback(error, kNoConnection);
        }
    }

    fire_and_forget DiscoverServicesAsync(ConnectionHandle handle, CompletionCallback callback) {
        auto self = shared_from_this();
        auto link = FindLink(handle);
        if (!link) {
            callback("unknown connection");
            co_return;
        }

        std::string error;
        try {
            BluetoothLEDevice device = LinkDevice(*link);
            if (!device) {
                callback("connection closed");
                co_return;
            }

            blog(LOG_INFO, "Discovering services...");
            auto servicesResult = co_await device.GetGattServicesForUuidAsync(ToGuid(kHeartRateService));
            if (servicesResult.Status() != GattCommunicationStatus::Success) {
                callback("failed to get services, status " + std::to_string((int)servicesResult.Status()));
                co_return;
            }

            auto services = servicesResult.Services();
            if (services.Size() == 0) {
                callback("no Heart Rate Service found");
                co_return;
            }
            auto service = services.GetAt(0);

            auto charResult = co_await service.GetCharacteristicsForUuidAsync(ToGuid(kHeartRateMeasurementChar));
            if (charResult.Status() != GattCommunicationStatus::Success || charResult.Characteristics().Size() == 0) {
                callback("no Heart Rate Measurement characteristic found");
                co_return;
            }

            GattCharacteristic characteristic = charResult.Characteristics().GetAt(0);
            auto properties = characteristic.CharacteristicProperties();
            if ((properties & GattCharacteristicProperties::Notify) == GattCharacteristicProperties::None) {
                callback("Heart Rate Measurement does not support notify");
                co_return;
            }

            bool closed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed = link->closing;
                if (!closed) {
                    link->services.push_back(service);
                    link->characteristics.insert_or_assign(
                        CharacteristicKey(kHeartRateService, kHeartRateMeasurementChar), characteristic);
                }
            }
            if (closed) {
                service.Close();
                callback("connection closed during discovery");
                co_return;
            }
            blog(LOG_INFO, "Heart Rate Service found");
            callback("");
        } catch (hresult_error const& e) {
            error = to_string(e.message());
        }

        if (!error.empty()) {
            callback(error);
        }
    }

    // Cached lookup; resolves to nullptr when the device lacks the service or characteristic
    IAsyncOperation<GattCharacteristic> FindCharacteristicAsync(std::shared_ptr<Link> link, GattUuid service,
                                                                GattUuid characteristic) {
        uint32_t key = CharacteristicKey(service, characteristic);
        GattCharacteristic cached{ nullptr };
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = link->characteristics.find(key);
            if (it != link->characteristics.end()) cached = it->second;
        }
        if (cached) co_return cached;

        BluetoothLEDevice device = LinkDevice(*link);
        if (!device) co_return nullptr;

        auto servicesResult = co_await device.GetGattServicesForUuidAsync(ToGuid(service));
        if (servicesResult.Status() != GattCommunicationStatus::Success || servicesResult.Services().Size() == 0) {
            co_return nullptr;
        }
        auto gattService = servicesResult.Services().GetAt(0);

        auto charResult = co_await gattService.GetCharacteristicsForUuidAsync(ToGuid(characteristic));
        if (charResult.Status() != GattCommunicationStatus::Success || charResult.Characteristics().Size() == 0) {
            co_return nullptr;
        }

        GattCharacteristic found = charResult.Characteristics().GetAt(0);
        bool closed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed = link->closing;
            if (!closed) {
                link->services.push_back(gattService);
                link->characteristics.insert_or_assign(key, found);
            }
        }
        if (closed) {
            gattService.Close();
            co_return nullptr;
        }
        co_return found;
    }

    fire_and_forget SubscribeAsync(ConnectionHandle handle, GattUuid service, GattUuid characteristic,
                                   ValueCallback callback) {
        auto self = shared_from_this();
        auto link = FindLink(handle);
        if (!link) {
            callback("unknown connection", {});
            co_return;
        }

        std::string error;
        try {
            GattCharacteristic chr = co_await FindCharacteristicAsync(link, service, characteristic);
            if (!chr) {
                callback("characteristic " + characteristic.ToString() + " not available", {});
                co_return;
            }

            blog(LOG_INFO, "Subscribing to notifications...");
            auto status = co_await chr.WriteClientCharacteristicConfigurationDescriptorAsync(
                GattClientCharacteristicConfigurationDescriptorValue::Notify);
            if (status != GattCommunicationStatus::Success) {
                callback("failed to subscribe, status " + std::to_string((int)status), {});
                co_return;
            }

            bool closed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed = link->closing;
                if (!closed) {
                    link->value_tokens[CharacteristicKey(service, characteristic)] =
                        chr.ValueChanged([callback](GattCharacteristic const&, GattValueChangedEventArgs const& args) {
                            callback("", ReadBytes(args.CharacteristicValue()));
                        });
                }
            }
            if (closed) {
                callback("connection closed during subscribe", {});
                co_return;
            }
            blog(LOG_INFO, "Subscribed successfully");
        } catch (hresult_error const& e) {
            error = to_string(e.message());
        }

        if (!error.empty()) {
            callback(error, {});
        }
    }

    fire_and_forget ReadAsync(ConnectionHandle handle, GattUuid service, GattUuid characteristic,
                              ValueCallback callback) {
        auto self = shared_from_this();
        auto link = FindLink(handle);
        if (!link) {
            callback("unknown connection", {});
            co_return;
        }

        std::string error;
        try {
            GattCharacteristic chr = co_await FindCharacteristicAsync(link, service, characteristic);
            if (!chr) {
                callback("characteristic " + characteristic.ToString() + " not available", {});
                co_return;
            }

            auto result = co_await chr.ReadValueAsync(BluetoothCacheMode::Uncached);
            if (result.Status() != GattCommunicationStatus::Success) {
                callback("read failed, status " + std::to_string((int)result.Status()), {});
                co_return;
            }
            callback("", ReadBytes(result.Value()));
        } catch (hresult_error const& e) {
            error = to_string(e.message());
        }

        if (!error.empty()) {
            callback(error, {});
        }
    }
};

std::shared_ptr<BleTransport> BleTransport::Create() {
    return std::make_shared<BleTransportWinRT>();
}
