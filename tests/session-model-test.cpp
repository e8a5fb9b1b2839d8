#include <gtest/gtest.h>

#include "session-model.hpp"

#include <util/base.h>

template <typename T>
static size_t CountEffects(const std::vector<SessionEffect>& effects) {
    size_t n = 0;
    for (auto& e : effects) {
        if (std::holds_alternative<T>(e)) n++;
    }
    return n;
}

static bool Logged(const std::vector<SessionEffect>& effects, int level, const std::string& fragment) {
    for (auto& e : effects) {
        if (auto* log = std::get_if<LogEffect>(&e)) {
            if (log->level == level && log->message.find(fragment) != std::string::npos) return true;
        }
    }
    return false;
}

static SessionModel Subscribed(ConnectionHandle handle) {
    SessionModel model;
    model.session.state = SessionState::Subscribed;
    model.session.peripheral = Peripheral{ "AA:01", std::string("Band 7"), -50 };
    model.handle = handle;
    return model;
}

TEST(SessionTransition, StaleScanTimeoutIsIgnored) {
    SessionModel model;
    model.session.state = SessionState::Scanning;
    model.scan_generation = 3;

    auto result = Transition(model, ScanTimeoutEvent{ 2 }, SessionConfig{});
    EXPECT_EQ(result.model.session.state, SessionState::Scanning);
    EXPECT_TRUE(result.effects.empty());
}

TEST(SessionTransition, ScanStartClearsPreviousErrorAndDevices) {
    SessionModel model;
    model.session.last_error = ErrorRecord{ ErrorKind::ConnectFailure, "Connection failed" };
    model.devices.Observe(Peripheral{ "OLD", std::string("Old band"), std::nullopt });

    SessionConfig config;
    config.filter_heart_rate_service = false;
    auto result = Transition(model, PermissionCheckedEvent{ true }, config);

    EXPECT_EQ(result.model.session.state, SessionState::Scanning);
    EXPECT_FALSE(result.model.session.last_error.has_value());
    EXPECT_EQ(result.model.devices.Size(), 0u);
    ASSERT_EQ(CountEffects<StartScanEffect>(result.effects), 1u);
    for (auto& e : result.effects) {
        if (auto* scan = std::get_if<StartScanEffect>(&e)) {
            EXPECT_TRUE(scan->filter.services.empty());
        }
    }
    EXPECT_EQ(CountEffects<ArmScanTimerEffect>(result.effects), 1u);
}

TEST(SessionTransition, DecodeFailureIsLoggedNotSurfaced) {
    auto result = Transition(Subscribed(4), NotificationEvent{ 4, { 0x01, 0x4B }, std::chrono::system_clock::now() },
                             SessionConfig{});

    EXPECT_EQ(result.model.session.state, SessionState::Subscribed);
    EXPECT_FALSE(result.model.session.last_error.has_value());
    EXPECT_TRUE(Logged(result.effects, LOG_WARNING, "Dropping heart rate frame"));
}

TEST(SessionTransition, LateConnectionIsReleased) {
    SessionModel model;
    auto result = Transition(model, ConnectSucceededEvent{ "AA:01", 0, 9 }, SessionConfig{});

    EXPECT_EQ(result.model.session.state, SessionState::Idle);
    ASSERT_EQ(CountEffects<DisconnectEffect>(result.effects), 1u);
    EXPECT_EQ(result.model.handle, kNoConnection);
}

TEST(SessionTransition, EachConnectGetsFreshAttempt) {
    SessionModel model;
    auto first = Transition(model, ConnectCommand{ "AA:01" }, SessionConfig{});
    auto abandoned = Transition(first.model, DisconnectCommand{}, SessionConfig{});
    auto second = Transition(abandoned.model, ConnectCommand{ "AA:01" }, SessionConfig{});

    EXPECT_NE(first.model.connect_attempt, second.model.connect_attempt);

    auto stale = Transition(second.model, ConnectFailedEvent{ "AA:01", first.model.connect_attempt, "timeout" },
                            SessionConfig{});
    EXPECT_EQ(stale.model.session.state, SessionState::Connecting);
    EXPECT_FALSE(stale.model.session.last_error.has_value());

    auto live = Transition(stale.model, ConnectSucceededEvent{ "AA:01", second.model.connect_attempt, 42 },
                           SessionConfig{});
    EXPECT_EQ(live.model.session.state, SessionState::Discovering);
    EXPECT_EQ(live.model.handle, 42u);
}

TEST(SessionTransition, DisconnectWhileConnectingAbandonsAttempt) {
    SessionModel model;
    model.session.state = SessionState::Connecting;
    model.session.peripheral = Peripheral{ "AA:01", std::string("Band 7"), std::nullopt };

    auto result = Transition(model, DisconnectCommand{}, SessionConfig{});
    EXPECT_EQ(result.model.session.state, SessionState::Idle);
    EXPECT_FALSE(result.model.session.peripheral.has_value());
    EXPECT_NE(result.model.devices.Find("AA:01"), nullptr);
}

TEST(SessionTransition, ReconnectCapEndsChain) {
    SessionConfig config;
    config.max_reconnect_attempts = 2;

    auto model = Subscribed(4);
    model.reconnect_count = 2;
    auto result = Transition(model, UnsolicitedDisconnectEvent{ 4, "AA:01" }, config);

    EXPECT_EQ(result.model.session.state, SessionState::Idle);
    ASSERT_TRUE(result.model.session.last_error.has_value());
    EXPECT_EQ(result.model.session.last_error->kind, ErrorKind::ConnectFailure);
    EXPECT_EQ(CountEffects<ScheduleReconnectEffect>(result.effects), 0u);
}

TEST(SessionTransition, ReconnectCapZeroMeansUnlimited) {
    SessionConfig config;
    config.max_reconnect_attempts = 0;

    auto model = Subscribed(4);
    model.reconnect_count = 1000;
    auto result = Transition(model, UnsolicitedDisconnectEvent{ 4, "AA:01" }, config);

    EXPECT_EQ(result.model.session.state, SessionState::Reconnecting);
    EXPECT_EQ(CountEffects<ScheduleReconnectEffect>(result.effects), 1u);
}

TEST(SessionTransition, DecodedFrameResetsReconnectCount) {
    auto model = Subscribed(4);
    model.reconnect_count = 3;
    auto result = Transition(model, NotificationEvent{ 4, { 0x00, 70 }, std::chrono::system_clock::now() },
                             SessionConfig{});
    EXPECT_EQ(result.model.reconnect_count, 0);
    EXPECT_EQ(*result.model.session.heart_rate, 70);
}

TEST(SessionTransition, LinkLossDuringDiscoveryFailsSession) {
    SessionModel model;
    model.session.state = SessionState::Discovering;
    model.session.peripheral = Peripheral{ "AA:01", std::string("Band 7"), std::nullopt };
    model.handle = 5;

    auto result = Transition(model, UnsolicitedDisconnectEvent{ 5, "AA:01" }, SessionConfig{});
    EXPECT_EQ(result.model.session.state, SessionState::Idle);
    ASSERT_TRUE(result.model.session.last_error.has_value());
    EXPECT_EQ(result.model.session.last_error->kind, ErrorKind::DiscoveryFailure);
}

TEST(SessionTransition, BatteryAboveHundredIsKept) {
    auto result = Transition(Subscribed(4), BatteryReadEvent{ 4, { 120 } }, SessionConfig{});
    ASSERT_TRUE(result.model.session.battery_level.has_value());
    EXPECT_EQ(*result.model.session.battery_level, 120);
}

TEST(SessionTransition, StateNames) {
    EXPECT_STREQ(SessionStateName(SessionState::Reconnecting), "reconnecting");
    EXPECT_STREQ(ErrorKindName(ErrorKind::PermissionDenied), "permission_denied");
}
