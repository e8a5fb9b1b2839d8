#include "session-model.hpp"
#include "heart-rate-codec.hpp"

#include <util/base.h>

const char* SessionStateName(SessionState state) {
    switch (state) {
    case SessionState::Idle: return "idle";
    case SessionState::Scanning: return "scanning";
    case SessionState::Connecting: return "connecting";
    case SessionState::Discovering: return "discovering";
    case SessionState::Subscribed: return "subscribed";
    case SessionState::Reconnecting: return "reconnecting";
    case SessionState::Disconnecting: return "disconnecting";
    }
    return "unknown";
}

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::PermissionDenied: return "permission_denied";
    case ErrorKind::ScanFailure: return "scan_failure";
    case ErrorKind::ConnectFailure: return "connect_failure";
    case ErrorKind::DiscoveryFailure: return "discovery_failure";
    case ErrorKind::NotificationFailure: return "notification_failure";
    case ErrorKind::DisconnectFailure: return "disconnect_failure";
    }
    return "unknown";
}

static std::string Describe(const Peripheral& p) {
    if (p.display_name && !p.display_name->empty()) {
        return *p.display_name + " (" + p.id + ")";
    }
    return p.id;
}

class Transitioner {
public:
    Transitioner(SessionModel& model, std::vector<SessionEffect>& effects, const SessionConfig& config)
        : m_(model), effects_(effects), config_(config) {}

    void operator()(const StartScanCommand&) {
        if (m_.session.state != SessionState::Idle) {
            Log(LOG_WARNING, std::string("Scan rejected while ") + SessionStateName(m_.session.state));
            return;
        }
        effects_.push_back(CheckPermissionEffect{});
    }

    void operator()(const PermissionCheckedEvent& e) {
        if (m_.session.state != SessionState::Idle) {
            Log(LOG_DEBUG, "Permission result arrived after leaving idle, ignoring");
            return;
        }
        if (!e.granted) {
            Fail(ErrorKind::PermissionDenied, "Bluetooth permission denied");
            return;
        }

        m_.session.last_error.reset();
        m_.devices.Reset();
        m_.scan_generation++;
        m_.session.state = SessionState::Scanning;

        ScanFilter filter;
        if (config_.filter_heart_rate_service) {
            filter.services.push_back(kHeartRateService);
        }
        effects_.push_back(StartScanEffect{ filter });
        effects_.push_back(ArmScanTimerEffect{ m_.scan_generation, config_.scan_timeout });
        Log(LOG_INFO, "Scanning for devices (" + std::to_string(config_.scan_timeout.count()) + " ms window)");
    }

    void operator()(const ScanResultEvent& e) {
        if (m_.session.state != SessionState::Scanning) return;
        if (m_.devices.Observe(e.peripheral)) {
            Log(LOG_DEBUG, "Found device " + Describe(e.peripheral));
        }
    }

    void operator()(const ScanErrorEvent& e) {
        if (m_.session.state != SessionState::Scanning) return;
        EndScan();
        Fail(ErrorKind::ScanFailure, "Scan error: " + e.reason);
    }

    void operator()(const ScanTimeoutEvent& e) {
        if (m_.session.state != SessionState::Scanning || e.generation != m_.scan_generation) {
            return;
        }
        m_.session.state = SessionState::Idle;
        effects_.push_back(StopScanEffect{});
        Log(LOG_INFO, "Scan window elapsed, " + std::to_string(m_.devices.Size()) + " device(s) found");
    }

    void operator()(const ConnectCommand& e) {
        if (e.peripheral_id.empty()) {
            Log(LOG_WARNING, "Connect requested without a device id");
            return;
        }
        if (m_.session.state == SessionState::Scanning) {
            EndScan();
        } else if (m_.session.state != SessionState::Idle) {
            Log(LOG_WARNING, std::string("Connect rejected while ") + SessionStateName(m_.session.state));
            return;
        }

        std::optional<Peripheral> peripheral = m_.devices.Take(e.peripheral_id);
        if (!peripheral) {
            peripheral = Peripheral{ e.peripheral_id, std::nullopt, std::nullopt };
        }

        m_.session.peripheral = peripheral;
        m_.session.heart_rate.reset();
        m_.session.battery_level.reset();
        m_.readings.Clear();
        m_.reconnecting = false;
        m_.reconnect_count = 0;
        m_.session.state = SessionState::Connecting;
        effects_.push_back(ConnectEffect{ e.peripheral_id, ++m_.connect_attempt });
        Log(LOG_INFO, "Connecting to " + Describe(*peripheral));
    }

    void operator()(const ConnectSucceededEvent& e) {
        if (!IsCurrentAttempt(e.peripheral_id, e.attempt)) {
            Log(LOG_DEBUG, "Releasing connection to " + e.peripheral_id + " nobody is waiting for");
            effects_.push_back(DisconnectEffect{ e.handle });
            return;
        }
        m_.handle = e.handle;
        m_.session.state = SessionState::Discovering;
        effects_.push_back(WatchDisconnectEffect{ e.handle });
        effects_.push_back(DiscoverServicesEffect{ e.handle });
        Log(LOG_INFO, "Connected, discovering services...");
    }

    void operator()(const ConnectFailedEvent& e) {
        if (!IsCurrentAttempt(e.peripheral_id, e.attempt)) {
            Log(LOG_DEBUG, "Ignoring stale connect failure for " + e.peripheral_id);
            return;
        }
        std::string message = (m_.reconnecting ? "Reconnect failed: " : "Connection failed: ") + e.reason;
        EndSession();
        Fail(ErrorKind::ConnectFailure, message);
    }

    void operator()(const ServicesDiscoveredEvent& e) {
        if (m_.session.state != SessionState::Discovering || e.handle != m_.handle) return;

        m_.session.state = SessionState::Subscribed;
        effects_.push_back(SubscribeHeartRateEffect{ e.handle });
        effects_.push_back(ReadBatteryEffect{ e.handle });
        if (m_.reconnecting) {
            Log(LOG_INFO, "Reconnected to " + Describe(*m_.session.peripheral));
            m_.reconnecting = false;
        } else {
            Log(LOG_INFO, "Subscribed to heart rate notifications");
        }
    }

    void operator()(const DiscoveryFailedEvent& e) {
        if (m_.session.state != SessionState::Discovering || e.handle != m_.handle) return;

        m_.closing_handle = e.handle;
        effects_.push_back(DisconnectEffect{ e.handle });
        EndSession();
        Fail(ErrorKind::DiscoveryFailure, "Service discovery failed: " + e.reason);
    }

    void operator()(const NotificationEvent& e) {
        if (m_.session.state != SessionState::Subscribed || e.handle != m_.handle) return;

        auto result = DecodeHeartRate(e.value);
        if (auto* failure = std::get_if<DecodeFailure>(&result)) {
            Log(LOG_WARNING, "Dropping heart rate frame: " + failure->reason);
            return;
        }
        const auto& measurement = std::get<HeartRateMeasurement>(result);
        m_.session.heart_rate = measurement.bpm;
        m_.readings.Add(FormatReading(measurement.bpm, e.received_at));
        m_.reconnect_count = 0;
    }

    void operator()(const NotificationErrorEvent& e) {
        if (m_.session.state != SessionState::Subscribed || e.handle != m_.handle) return;
        Fail(ErrorKind::NotificationFailure, "Notification error: " + e.reason);
    }

    void operator()(const BatteryReadEvent& e) {
        if (m_.session.state != SessionState::Subscribed || e.handle != m_.handle) return;

        auto result = DecodeBatteryLevel(e.value);
        if (auto* failure = std::get_if<DecodeFailure>(&result)) {
            Log(LOG_WARNING, "Ignoring battery level: " + failure->reason);
            return;
        }
        m_.session.battery_level = std::get<uint8_t>(result);
        Log(LOG_INFO, "Battery level " + std::to_string(*m_.session.battery_level) + "%");
    }

    void operator()(const BatteryReadFailedEvent& e) {
        if (e.handle != m_.handle) return;
        Log(LOG_INFO, "Battery service not available: " + e.reason);
    }

    void operator()(const DisconnectCommand&) {
        switch (m_.session.state) {
        case SessionState::Connecting:
        case SessionState::Reconnecting:
            Log(LOG_INFO, "Connection attempt abandoned");
            EndSession();
            break;
        case SessionState::Discovering:
        case SessionState::Subscribed:
            if (m_.session.state == SessionState::Subscribed) {
                effects_.push_back(UnsubscribeHeartRateEffect{ m_.handle });
            }
            effects_.push_back(DisconnectEffect{ m_.handle });
            m_.closing_handle = m_.handle;
            m_.handle = kNoConnection;
            m_.reconnecting = false;
            m_.session.state = SessionState::Disconnecting;
            Log(LOG_INFO, "Disconnecting...");
            break;
        default:
            Log(LOG_DEBUG, std::string("Disconnect ignored while ") + SessionStateName(m_.session.state));
            break;
        }
    }

    void operator()(const DisconnectCompletedEvent& e) {
        if (e.handle == kNoConnection || e.handle != m_.closing_handle) return;
        m_.closing_handle = kNoConnection;
        if (m_.session.state == SessionState::Disconnecting) {
            EndSession();
            Log(LOG_INFO, "Disconnected");
        }
    }

    void operator()(const DisconnectFailedEvent& e) {
        if (e.handle == kNoConnection || e.handle != m_.closing_handle) return;
        m_.closing_handle = kNoConnection;
        if (m_.session.state == SessionState::Disconnecting) {
            EndSession();
            Fail(ErrorKind::DisconnectFailure, "Disconnect failed: " + e.reason);
        }
    }

    void operator()(const UnsolicitedDisconnectEvent& e) {
        if (e.handle == kNoConnection || e.handle != m_.handle) {
            Log(LOG_DEBUG, "Ignoring link loss report for " + e.peripheral_id);
            return;
        }

        if (m_.session.state == SessionState::Discovering) {
            EndSession();
            Fail(ErrorKind::DiscoveryFailure, "Link lost during service discovery");
            return;
        }
        if (m_.session.state != SessionState::Subscribed) return;

        if (config_.max_reconnect_attempts > 0 && m_.reconnect_count >= config_.max_reconnect_attempts) {
            int attempts = m_.reconnect_count;
            EndSession();
            Fail(ErrorKind::ConnectFailure,
                 "Gave up after " + std::to_string(attempts) + " reconnect attempts without data");
            return;
        }

        m_.handle = kNoConnection;
        m_.reconnect_count++;
        m_.session.state = SessionState::Reconnecting;
        effects_.push_back(ScheduleReconnectEffect{});
        Log(LOG_WARNING, "Device disconnected. Reconnecting...");
    }

    void operator()(const ReconnectDueEvent&) {
        if (m_.session.state != SessionState::Reconnecting || !m_.session.peripheral) return;
        m_.reconnecting = true;
        m_.session.state = SessionState::Connecting;
        effects_.push_back(ConnectEffect{ m_.session.peripheral->id, ++m_.connect_attempt });
    }

    void operator()(const DismissErrorCommand&) {
        m_.session.last_error.reset();
    }

private:
    bool IsCurrentAttempt(const std::string& peripheral_id, uint64_t attempt) const {
        return m_.session.state == SessionState::Connecting && m_.session.peripheral &&
               m_.session.peripheral->id == peripheral_id && attempt == m_.connect_attempt;
    }

    void Log(int level, std::string message) {
        effects_.push_back(LogEffect{ level, std::move(message) });
    }

    void Fail(ErrorKind kind, std::string message) {
        Log(LOG_WARNING, message);
        m_.session.last_error = ErrorRecord{ kind, std::move(message) };
    }

    void EndScan() {
        m_.scan_generation++;
        m_.session.state = SessionState::Idle;
        effects_.push_back(StopScanEffect{});
        effects_.push_back(CancelScanTimerEffect{});
    }

    // The peripheral goes back into the registry so it can be picked again.
    void EndSession() {
        if (m_.session.peripheral) {
            m_.devices.Observe(*m_.session.peripheral);
        }
        m_.session.peripheral.reset();
        m_.session.heart_rate.reset();
        m_.session.battery_level.reset();
        m_.readings.Clear();
        m_.handle = kNoConnection;
        m_.reconnecting = false;
        m_.reconnect_count = 0;
        m_.session.state = SessionState::Idle;
    }

    SessionModel& m_;
    std::vector<SessionEffect>& effects_;
    const SessionConfig& config_;
};

TransitionResult Transition(SessionModel model, const SessionEvent& event, const SessionConfig& config) {
    TransitionResult result{ std::move(model), {} };
    std::visit(Transitioner(result.model, result.effects, config), event);
    return result;
}
