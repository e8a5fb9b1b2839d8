#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include "permission-gate.hpp"
#include <util/base.h>

#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Devices.Bluetooth.h>
#include <winrt/Windows.Devices.Radios.h>

using namespace winrt;
using namespace Windows::Devices::Bluetooth;
using namespace Windows::Devices::Radios;

class PermissionGateWinRT : public PermissionGate {
public:
    PermissionStatus Check() override {
        try {
            auto adapter = BluetoothAdapter::GetDefaultAsync().get();
            if (!adapter) {
                blog(LOG_WARNING, "No Bluetooth adapter present");
                return PermissionStatus::Denied;
            }
            if (!adapter.IsLowEnergySupported()) {
                blog(LOG_WARNING, "Bluetooth adapter does not support Low Energy");
                return PermissionStatus::Denied;
            }

            auto access = Radio::RequestAccessAsync().get();
            if (access != RadioAccessStatus::Allowed) {
                blog(LOG_WARNING, "Radio access not allowed (status %d)", (int)access);
                return PermissionStatus::Denied;
            }

            auto radio = adapter.GetRadioAsync().get();
            if (radio && radio.State() != RadioState::On) {
                blog(LOG_WARNING, "Bluetooth radio is off");
                return PermissionStatus::Denied;
            }
            return PermissionStatus::Granted;
        } catch (hresult_error const& e) {
            blog(LOG_WARNING, "Bluetooth capability check failed: %s", to_string(e.message()).c_str());
            return PermissionStatus::Denied;
        }
    }
};

std::shared_ptr<PermissionGate> PermissionGate::Create() {
    return std::make_shared<PermissionGateWinRT>();
}
