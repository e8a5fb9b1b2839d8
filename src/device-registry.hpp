#pragma once
#include <optional>
#include <string>
#include <vector>

#include "ble-transport.hpp"

// Peripherals sighted during the current scan window, keyed by id.
class DeviceRegistry {
public:
    void Reset();

    // Ignores unnamed peripherals and ids already present (first sighting wins).
    // Returns true when a new entry was added.
    bool Observe(const Peripheral& peripheral);

    // Removes the entry and hands it to the caller.
    std::optional<Peripheral> Take(const std::string& id);

    const Peripheral* Find(const std::string& id) const;
    std::vector<Peripheral> List() const { return devices_; }
    size_t Size() const { return devices_.size(); }

private:
    std::vector<Peripheral> devices_;
};
