#include "gatt-uuid.hpp"

#include <cstdio>

std::string GattUuid::ToString() const {
    char buf[37];
    std::snprintf(buf, sizeof(buf), "0000%04x-0000-1000-8000-00805f9b34fb", short_id);
    return buf;
}
