#include <gtest/gtest.h>

#include "session-json.hpp"

#include <obs-data.h>

// Parses the produced JSON back so assertions don't depend on key order or spacing
struct Parsed {
    explicit Parsed(const std::string& json) : data(obs_data_create_from_json(json.c_str())) {}
    ~Parsed() { obs_data_release(data); }
    obs_data_t* data;
};

TEST(SessionJson, SubscribedSession) {
    Session session;
    session.state = SessionState::Subscribed;
    session.peripheral = Peripheral{ "1234", std::string("Band 7"), -61 };
    session.heart_rate = 75;
    session.battery_level = 88;

    Parsed json(SessionToJson(session));
    ASSERT_NE(json.data, nullptr);
    EXPECT_STREQ(obs_data_get_string(json.data, "state"), "subscribed");
    EXPECT_EQ(obs_data_get_int(json.data, "heart_rate"), 75);
    EXPECT_EQ(obs_data_get_int(json.data, "battery_level"), 88);

    obs_data_t* peripheral = obs_data_get_obj(json.data, "peripheral");
    ASSERT_NE(peripheral, nullptr);
    EXPECT_STREQ(obs_data_get_string(peripheral, "name"), "Band 7");
    EXPECT_EQ(obs_data_get_int(peripheral, "rssi"), -61);
    obs_data_release(peripheral);

    EXPECT_FALSE(obs_data_has_user_value(json.data, "error"));
}

TEST(SessionJson, IdleWithErrorOmitsReadings) {
    Session session;
    session.last_error = ErrorRecord{ ErrorKind::ConnectFailure, "Connection failed: timeout" };

    Parsed json(SessionToJson(session));
    ASSERT_NE(json.data, nullptr);
    EXPECT_STREQ(obs_data_get_string(json.data, "state"), "idle");
    EXPECT_FALSE(obs_data_has_user_value(json.data, "heart_rate"));
    EXPECT_FALSE(obs_data_has_user_value(json.data, "peripheral"));

    obs_data_t* error = obs_data_get_obj(json.data, "error");
    ASSERT_NE(error, nullptr);
    EXPECT_STREQ(obs_data_get_string(error, "kind"), "connect_failure");
    EXPECT_STREQ(obs_data_get_string(error, "message"), "Connection failed: timeout");
    obs_data_release(error);
}

TEST(SessionJson, HeartRateIsMinusOneUnlessStreaming) {
    Session session;
    session.heart_rate = 80;
    Parsed idle(HeartRateToJson(session));
    EXPECT_EQ(obs_data_get_int(idle.data, "hr"), -1);

    session.state = SessionState::Subscribed;
    Parsed streaming(HeartRateToJson(session));
    EXPECT_EQ(obs_data_get_int(streaming.data, "hr"), 80);
}

TEST(SessionJson, DevicesAndReadingsArrays) {
    Parsed devices(DevicesToJson({ Peripheral{ "1", std::string("A"), std::nullopt },
                                   Peripheral{ "2", std::string("B"), -40 } }));
    obs_data_array_t* list = obs_data_get_array(devices.data, "devices");
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(obs_data_array_count(list), 2u);
    obs_data_t* second = obs_data_array_item(list, 1);
    EXPECT_STREQ(obs_data_get_string(second, "id"), "2");
    obs_data_release(second);
    obs_data_array_release(list);

    Parsed readings(ReadingsToJson({ "HR: 75bpm - 10:00:01", "HR: 74bpm - 10:00:00" }));
    obs_data_array_t* entries = obs_data_get_array(readings.data, "readings");
    ASSERT_NE(entries, nullptr);
    ASSERT_EQ(obs_data_array_count(entries), 2u);
    obs_data_t* first = obs_data_array_item(entries, 0);
    EXPECT_STREQ(obs_data_get_string(first, "entry"), "HR: 75bpm - 10:00:01");
    obs_data_release(first);
    obs_data_array_release(entries);
}

TEST(SessionJson, ParseDeviceId) {
    EXPECT_EQ(ParseDeviceId("{\"id\": \"246813579\"}"), "246813579");
    EXPECT_EQ(ParseDeviceId("{\"name\": \"x\"}"), "");
    EXPECT_EQ(ParseDeviceId("not json"), "");
}
