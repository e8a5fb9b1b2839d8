#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ble-transport.hpp"
#include "permission-gate.hpp"
#include "scheduler.hpp"
#include "session-model.hpp"

struct SessionSnapshot {
    Session session;
    std::vector<Peripheral> devices;
    std::vector<std::string> readings;
};

using SessionObserver = std::function<void(const SessionSnapshot& snapshot)>;

// Closable FIFO shared with transport and timer callbacks, which may outlive the machine.
class SessionEventQueue {
public:
    bool Push(SessionEvent event);
    // Blocks until an event arrives or the queue is closed.
    bool WaitPop(SessionEvent& out);
    bool TryPop(SessionEvent& out);
    void Close();
    // Accepts events again after Close(); anything still queued is kept.
    void Reopen();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SessionEvent> events_;
    bool closed_ = false;
};

// Single owner of the transport. User commands and transport events go through
// one queue and are applied one at a time by Transition(). Either call Start()
// to consume on a worker thread, or drive the queue with RunPending().
// Stop() followed by Start() resumes with the same model.
class SessionMachine {
public:
    SessionMachine(std::shared_ptr<BleTransport> transport, std::shared_ptr<PermissionGate> permission,
                   std::shared_ptr<Scheduler> scheduler, SessionConfig config = {});
    ~SessionMachine();

    SessionMachine(const SessionMachine&) = delete;
    SessionMachine& operator=(const SessionMachine&) = delete;

    void Start();
    void Stop();
    size_t RunPending();

    void StartScan() { Post(StartScanCommand{}); }
    void ConnectTo(const std::string& peripheral_id) { Post(ConnectCommand{ peripheral_id }); }
    void Disconnect() { Post(DisconnectCommand{}); }
    void DismissError() { Post(DismissErrorCommand{}); }

    void Post(SessionEvent event);

    SessionSnapshot Snapshot() const;
    void SetObserver(SessionObserver observer);

private:
    void Handle(const SessionEvent& event);
    void Execute(const SessionEffect& effect);

    std::shared_ptr<BleTransport> transport_;
    std::shared_ptr<PermissionGate> permission_;
    std::shared_ptr<Scheduler> scheduler_;
    SessionConfig config_;

    std::shared_ptr<SessionEventQueue> queue_;
    std::thread worker_;
    std::atomic<bool> running_{ false };

    mutable std::mutex model_mutex_;
    SessionModel model_;

    std::mutex observer_mutex_;
    SessionObserver observer_;

    TimerId scan_timer_ = kNoTimer;
};
