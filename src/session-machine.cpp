#include "session-machine.hpp"

#include <type_traits>
#include <util/base.h>

bool SessionEventQueue::Push(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

bool SessionEventQueue::WaitPop(SessionEvent& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || !events_.empty(); });
    if (events_.empty()) return false;
    out = std::move(events_.front());
    events_.pop_front();
    return true;
}

bool SessionEventQueue::TryPop(SessionEvent& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) return false;
    out = std::move(events_.front());
    events_.pop_front();
    return true;
}

void SessionEventQueue::Reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

void SessionEventQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

static void PostTo(const std::weak_ptr<SessionEventQueue>& queue, SessionEvent event) {
    if (auto q = queue.lock()) {
        q->Push(std::move(event));
    }
}

SessionMachine::SessionMachine(std::shared_ptr<BleTransport> transport, std::shared_ptr<PermissionGate> permission,
                               std::shared_ptr<Scheduler> scheduler, SessionConfig config)
    : transport_(std::move(transport)),
      permission_(std::move(permission)),
      scheduler_(std::move(scheduler)),
      config_(config),
      queue_(std::make_shared<SessionEventQueue>()) {}

SessionMachine::~SessionMachine() {
    Stop();
}

void SessionMachine::Start() {
    if (running_.exchange(true)) return;
    queue_->Reopen();
    worker_ = std::thread([this]() {
        SessionEvent event;
        while (queue_->WaitPop(event)) {
            Handle(event);
        }
    });
}

// Events already queued are still applied before the worker exits.
void SessionMachine::Stop() {
    queue_->Close();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
    scheduler_->Cancel(scan_timer_);
    scan_timer_ = kNoTimer;
}

size_t SessionMachine::RunPending() {
    size_t handled = 0;
    SessionEvent event;
    while (queue_->TryPop(event)) {
        Handle(event);
        handled++;
    }
    return handled;
}

void SessionMachine::Post(SessionEvent event) {
    if (!queue_->Push(std::move(event))) {
        blog(LOG_DEBUG, "Session stopped, dropping event");
    }
}

SessionSnapshot SessionMachine::Snapshot() const {
    std::lock_guard<std::mutex> lock(model_mutex_);
    return SessionSnapshot{ model_.session, model_.devices.List(), model_.readings.Entries() };
}

void SessionMachine::SetObserver(SessionObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

void SessionMachine::Handle(const SessionEvent& event) {
    std::vector<SessionEffect> effects;
    SessionState before;
    SessionState after;
    {
        std::lock_guard<std::mutex> lock(model_mutex_);
        before = model_.session.state;
        auto result = Transition(model_, event, config_);
        model_ = std::move(result.model);
        effects = std::move(result.effects);
        after = model_.session.state;
    }

    if (before != after) {
        blog(LOG_INFO, "Session %s -> %s", SessionStateName(before), SessionStateName(after));
    }

    for (const auto& effect : effects) {
        Execute(effect);
    }

    SessionObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) {
        observer(Snapshot());
    }
}

void SessionMachine::Execute(const SessionEffect& effect) {
    std::weak_ptr<SessionEventQueue> queue = queue_;

    std::visit([&](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, CheckPermissionEffect>) {
            bool granted = permission_->Check() == PermissionStatus::Granted;
            Post(PermissionCheckedEvent{ granted });
        } else if constexpr (std::is_same_v<T, StartScanEffect>) {
            transport_->StartScan(e.filter, [queue](const std::string& error, const Peripheral& peripheral) {
                if (!error.empty()) {
                    PostTo(queue, ScanErrorEvent{ error });
                } else {
                    PostTo(queue, ScanResultEvent{ peripheral });
                }
            });
        } else if constexpr (std::is_same_v<T, StopScanEffect>) {
            transport_->StopScan();
        } else if constexpr (std::is_same_v<T, ArmScanTimerEffect>) {
            scheduler_->Cancel(scan_timer_);
            uint64_t generation = e.generation;
            scan_timer_ = scheduler_->After(e.timeout, [queue, generation]() {
                PostTo(queue, ScanTimeoutEvent{ generation });
            });
        } else if constexpr (std::is_same_v<T, CancelScanTimerEffect>) {
            scheduler_->Cancel(scan_timer_);
            scan_timer_ = kNoTimer;
        } else if constexpr (std::is_same_v<T, ConnectEffect>) {
            std::string id = e.peripheral_id;
            uint64_t attempt = e.attempt;
            transport_->Connect(id, [queue, id, attempt](const std::string& error, ConnectionHandle handle) {
                if (!error.empty()) {
                    PostTo(queue, ConnectFailedEvent{ id, attempt, error });
                } else if (handle == kNoConnection) {
                    PostTo(queue, ConnectFailedEvent{ id, attempt, "transport returned no connection" });
                } else {
                    PostTo(queue, ConnectSucceededEvent{ id, attempt, handle });
                }
            });
        } else if constexpr (std::is_same_v<T, WatchDisconnectEffect>) {
            ConnectionHandle handle = e.handle;
            transport_->OnUnsolicitedDisconnect(handle, [queue, handle](const std::string& peripheral_id) {
                PostTo(queue, UnsolicitedDisconnectEvent{ handle, peripheral_id });
            });
        } else if constexpr (std::is_same_v<T, DiscoverServicesEffect>) {
            ConnectionHandle handle = e.handle;
            transport_->DiscoverServices(handle, [queue, handle](const std::string& error) {
                if (!error.empty()) {
                    PostTo(queue, DiscoveryFailedEvent{ handle, error });
                } else {
                    PostTo(queue, ServicesDiscoveredEvent{ handle });
                }
            });
        } else if constexpr (std::is_same_v<T, SubscribeHeartRateEffect>) {
            ConnectionHandle handle = e.handle;
            transport_->SubscribeNotifications(
                handle, kHeartRateService, kHeartRateMeasurementChar,
                [queue, handle](const std::string& error, const std::vector<uint8_t>& value) {
                    if (!error.empty()) {
                        PostTo(queue, NotificationErrorEvent{ handle, error });
                    } else {
                        PostTo(queue, NotificationEvent{ handle, value, std::chrono::system_clock::now() });
                    }
                });
        } else if constexpr (std::is_same_v<T, UnsubscribeHeartRateEffect>) {
            transport_->UnsubscribeNotifications(e.handle, kHeartRateService, kHeartRateMeasurementChar);
        } else if constexpr (std::is_same_v<T, ReadBatteryEffect>) {
            ConnectionHandle handle = e.handle;
            transport_->ReadCharacteristic(
                handle, kBatteryService, kBatteryLevelChar,
                [queue, handle](const std::string& error, const std::vector<uint8_t>& value) {
                    if (!error.empty()) {
                        PostTo(queue, BatteryReadFailedEvent{ handle, error });
                    } else {
                        PostTo(queue, BatteryReadEvent{ handle, value });
                    }
                });
        } else if constexpr (std::is_same_v<T, DisconnectEffect>) {
            ConnectionHandle handle = e.handle;
            transport_->Disconnect(handle, [queue, handle](const std::string& error) {
                if (!error.empty()) {
                    PostTo(queue, DisconnectFailedEvent{ handle, error });
                } else {
                    PostTo(queue, DisconnectCompletedEvent{ handle });
                }
            });
        } else if constexpr (std::is_same_v<T, ScheduleReconnectEffect>) {
            Post(ReconnectDueEvent{});
        } else if constexpr (std::is_same_v<T, LogEffect>) {
            blog(e.level, "%s", e.message.c_str());
        }
    }, effect);
}
