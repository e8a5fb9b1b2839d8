#include "device-registry.hpp"

#include <algorithm>

void DeviceRegistry::Reset() {
    devices_.clear();
}

bool DeviceRegistry::Observe(const Peripheral& peripheral) {
    if (peripheral.id.empty() || !peripheral.display_name || peripheral.display_name->empty()) {
        return false;
    }
    if (Find(peripheral.id)) {
        return false;
    }
    devices_.push_back(peripheral);
    return true;
}

std::optional<Peripheral> DeviceRegistry::Take(const std::string& id) {
    auto it = std::find_if(devices_.begin(), devices_.end(), [&](const Peripheral& p) { return p.id == id; });
    if (it == devices_.end()) {
        return std::nullopt;
    }
    Peripheral taken = std::move(*it);
    devices_.erase(it);
    return taken;
}

const Peripheral* DeviceRegistry::Find(const std::string& id) const {
    for (auto& d : devices_) {
        if (d.id == id) return &d;
    }
    return nullptr;
}
