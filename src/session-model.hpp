#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ble-transport.hpp"
#include "device-registry.hpp"
#include "readings-log.hpp"

enum class SessionState {
    Idle,
    Scanning,
    Connecting,
    Discovering,
    Subscribed,
    Reconnecting,
    Disconnecting,
};

const char* SessionStateName(SessionState state);

enum class ErrorKind {
    PermissionDenied,
    ScanFailure,
    ConnectFailure,
    DiscoveryFailure,
    NotificationFailure,
    DisconnectFailure,
};

const char* ErrorKindName(ErrorKind kind);

struct ErrorRecord {
    ErrorKind kind;
    std::string message;
};

struct Session {
    SessionState state = SessionState::Idle;
    std::optional<Peripheral> peripheral;
    std::optional<uint16_t> heart_rate;
    std::optional<uint8_t> battery_level;
    std::optional<ErrorRecord> last_error;
};

struct SessionConfig {
    std::chrono::milliseconds scan_timeout{ 10000 };
    bool filter_heart_rate_service = true;
    // Consecutive auto-reconnects without a decoded frame; 0 = unlimited
    int max_reconnect_attempts = 5;
};

// Everything the transition function reads and writes.
struct SessionModel {
    Session session;
    DeviceRegistry devices;
    ReadingsLog readings;

    ConnectionHandle handle = kNoConnection;
    // Handle being torn down by a user disconnect; link-loss reports for it are expected
    ConnectionHandle closing_handle = kNoConnection;
    uint64_t scan_generation = 0;
    // Bumped per connect issued; completions from an abandoned attempt carry an older value
    uint64_t connect_attempt = 0;
    bool reconnecting = false;
    int reconnect_count = 0;
};

// User commands
struct StartScanCommand {};
struct ConnectCommand { std::string peripheral_id; };
struct DisconnectCommand {};
struct DismissErrorCommand {};

// Completions and transport events
struct PermissionCheckedEvent { bool granted; };
struct ScanResultEvent { Peripheral peripheral; };
struct ScanErrorEvent { std::string reason; };
struct ScanTimeoutEvent { uint64_t generation; };
struct ConnectSucceededEvent { std::string peripheral_id; uint64_t attempt; ConnectionHandle handle; };
struct ConnectFailedEvent { std::string peripheral_id; uint64_t attempt; std::string reason; };
struct ServicesDiscoveredEvent { ConnectionHandle handle; };
struct DiscoveryFailedEvent { ConnectionHandle handle; std::string reason; };
struct NotificationEvent {
    ConnectionHandle handle;
    std::vector<uint8_t> value;
    std::chrono::system_clock::time_point received_at;
};
struct NotificationErrorEvent { ConnectionHandle handle; std::string reason; };
struct BatteryReadEvent { ConnectionHandle handle; std::vector<uint8_t> value; };
struct BatteryReadFailedEvent { ConnectionHandle handle; std::string reason; };
struct DisconnectCompletedEvent { ConnectionHandle handle; };
struct DisconnectFailedEvent { ConnectionHandle handle; std::string reason; };
struct UnsolicitedDisconnectEvent { ConnectionHandle handle; std::string peripheral_id; };
struct ReconnectDueEvent {};

using SessionEvent = std::variant<
    StartScanCommand, ConnectCommand, DisconnectCommand, DismissErrorCommand,
    PermissionCheckedEvent, ScanResultEvent, ScanErrorEvent, ScanTimeoutEvent,
    ConnectSucceededEvent, ConnectFailedEvent, ServicesDiscoveredEvent, DiscoveryFailedEvent,
    NotificationEvent, NotificationErrorEvent, BatteryReadEvent, BatteryReadFailedEvent,
    DisconnectCompletedEvent, DisconnectFailedEvent, UnsolicitedDisconnectEvent, ReconnectDueEvent>;

struct CheckPermissionEffect {};
struct StartScanEffect { ScanFilter filter; };
struct StopScanEffect {};
struct ArmScanTimerEffect { uint64_t generation; std::chrono::milliseconds timeout; };
struct CancelScanTimerEffect {};
struct ConnectEffect { std::string peripheral_id; uint64_t attempt; };
struct WatchDisconnectEffect { ConnectionHandle handle; };
struct DiscoverServicesEffect { ConnectionHandle handle; };
struct SubscribeHeartRateEffect { ConnectionHandle handle; };
struct UnsubscribeHeartRateEffect { ConnectionHandle handle; };
struct ReadBatteryEffect { ConnectionHandle handle; };
struct DisconnectEffect { ConnectionHandle handle; };
struct ScheduleReconnectEffect {};
struct LogEffect { int level; std::string message; };

using SessionEffect = std::variant<
    CheckPermissionEffect, StartScanEffect, StopScanEffect, ArmScanTimerEffect, CancelScanTimerEffect,
    ConnectEffect, WatchDisconnectEffect, DiscoverServicesEffect, SubscribeHeartRateEffect,
    UnsubscribeHeartRateEffect, ReadBatteryEffect, DisconnectEffect, ScheduleReconnectEffect, LogEffect>;

struct TransitionResult {
    SessionModel model;
    std::vector<SessionEffect> effects;
};

// Pure: no I/O, no clock, no logging. Side effects are returned for the caller to run.
TransitionResult Transition(SessionModel model, const SessionEvent& event, const SessionConfig& config);
