#include "session-json.hpp"

#include <obs-data.h>

static std::string take_json(obs_data_t* data) {
    const char* json = obs_data_get_json(data);
    std::string out = json ? json : "{}";
    obs_data_release(data);
    return out;
}

static obs_data_t* peripheral_to_data(const Peripheral& p) {
    obs_data_t* item = obs_data_create();
    obs_data_set_string(item, "id", p.id.c_str());
    if (p.display_name) obs_data_set_string(item, "name", p.display_name->c_str());
    if (p.rssi) obs_data_set_int(item, "rssi", *p.rssi);
    return item;
}

std::string SessionToJson(const Session& session) {
    obs_data_t* data = obs_data_create();
    obs_data_set_string(data, "state", SessionStateName(session.state));

    if (session.peripheral) {
        obs_data_t* peripheral = peripheral_to_data(*session.peripheral);
        obs_data_set_obj(data, "peripheral", peripheral);
        obs_data_release(peripheral);
    }
    if (session.heart_rate) obs_data_set_int(data, "heart_rate", *session.heart_rate);
    if (session.battery_level) obs_data_set_int(data, "battery_level", *session.battery_level);

    if (session.last_error) {
        obs_data_t* error = obs_data_create();
        obs_data_set_string(error, "kind", ErrorKindName(session.last_error->kind));
        obs_data_set_string(error, "message", session.last_error->message.c_str());
        obs_data_set_obj(data, "error", error);
        obs_data_release(error);
    }
    return take_json(data);
}

std::string DevicesToJson(const std::vector<Peripheral>& devices) {
    obs_data_t* data = obs_data_create();
    obs_data_array_t* array = obs_data_array_create();
    for (auto& d : devices) {
        obs_data_t* item = peripheral_to_data(d);
        obs_data_array_push_back(array, item);
        obs_data_release(item);
    }
    obs_data_set_array(data, "devices", array);
    obs_data_array_release(array);
    return take_json(data);
}

std::string ReadingsToJson(const std::vector<std::string>& readings) {
    obs_data_t* data = obs_data_create();
    obs_data_array_t* array = obs_data_array_create();
    for (auto& r : readings) {
        obs_data_t* item = obs_data_create();
        obs_data_set_string(item, "entry", r.c_str());
        obs_data_array_push_back(array, item);
        obs_data_release(item);
    }
    obs_data_set_array(data, "readings", array);
    obs_data_array_release(array);
    return take_json(data);
}

std::string HeartRateToJson(const Session& session) {
    int hr = -1;
    if (session.state == SessionState::Subscribed && session.heart_rate) {
        hr = *session.heart_rate;
    }
    obs_data_t* data = obs_data_create();
    obs_data_set_int(data, "hr", hr);
    return take_json(data);
}

std::string ParseDeviceId(const std::string& body) {
    std::string id;
    obs_data_t* data = obs_data_create_from_json(body.c_str());
    if (data) {
        const char* val = obs_data_get_string(data, "id");
        if (val) id = val;
        obs_data_release(data);
    }
    return id;
}
