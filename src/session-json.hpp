#pragma once
#include <string>

#include "session-machine.hpp"

// HTTP API bodies. Absent optional fields are omitted.
std::string SessionToJson(const Session& session);
std::string DevicesToJson(const std::vector<Peripheral>& devices);
std::string ReadingsToJson(const std::vector<std::string>& readings);

// {"hr": n}, -1 unless subscribed with a reading
std::string HeartRateToJson(const Session& session);

// Reads "id" from a {"id": "..."} body; empty on malformed input.
std::string ParseDeviceId(const std::string& body);
