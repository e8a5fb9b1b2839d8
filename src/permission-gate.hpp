#pragma once
#include <memory>

enum class PermissionStatus {
    Granted,
    Denied,
};

// Platform check for scan/connect capability. May block briefly.
class PermissionGate {
public:
    virtual ~PermissionGate() = default;
    virtual PermissionStatus Check() = 0;

    static std::shared_ptr<PermissionGate> Create();
};
