#define WIN32_LEAN_AND_MEAN
#include <winsock2.h>
#include <obs-module.h>
#include <obs-frontend-api.h>
#include "ble-transport.hpp"
#include "permission-gate.hpp"
#include "plugin-config.hpp"
#include "scheduler.hpp"
#include "session-json.hpp"
#include "session-machine.hpp"
#include <windows.h>
#include <shellapi.h>
#include <thread>
#include <atomic>
#include <mutex>
#include <string>
#include <sstream>
#include <fstream>
#include "httplib.h"

OBS_DECLARE_MODULE()
OBS_MODULE_USE_DEFAULT_LOCALE("ble-heart-rate", "en-US")

// Globals
static std::unique_ptr<SessionMachine> g_session;
static std::unique_ptr<httplib::Server> g_server;
static std::thread g_server_thread;
static std::string g_web_dir;
static std::string g_config_path;

static std::mutex g_config_mutex;
static PluginConfig g_config;

static std::atomic<int> g_server_port{0};

static void load_config() {
    char* path = obs_module_config_path("config.json");
    if (!path) {
        blog(LOG_ERROR, "Failed to get module config path");
        return;
    }
    g_config_path = path;
    bfree(path);

    std::lock_guard<std::mutex> lock(g_config_mutex);
    g_config = LoadPluginConfig(g_config_path);
}

static void save_config() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    SavePluginConfig(g_config, g_config_path);
}

// Helper to find web directory
static void setup_web_dir() {
    char* path = obs_module_file("web");
    if (path) {
        g_web_dir = path;
        bfree(path);
        blog(LOG_INFO, "Web directory found: %s", g_web_dir.c_str());
    } else {
        blog(LOG_WARNING, "Could not find 'web' directory in plugin data path.");
    }
}

static void open_url(const char* url) {
    ShellExecuteA(NULL, "open", url, NULL, NULL, SW_SHOWNORMAL);
}

static std::string get_base_url() {
    return "http://localhost:" + std::to_string(g_server_port.load());
}

// Remembers the device once a session is fully up
static void on_session_changed(const SessionSnapshot& snapshot) {
    if (snapshot.session.state != SessionState::Subscribed || !snapshot.session.peripheral) return;

    const std::string& id = snapshot.session.peripheral->id;
    {
        std::lock_guard<std::mutex> lock(g_config_mutex);
        if (g_config.last_device_id == id) return;
        g_config.last_device_id = id;
    }
    save_config();
}

static void check_and_create_source() {
    obs_source_t* scene_source = obs_frontend_get_current_scene();
    if (!scene_source) return;

    obs_scene_t* scene = obs_scene_from_source(scene_source);
    if (!scene || g_server_port == 0) {
        obs_source_release(scene_source);
        return;
    }

    const char* source_name = obs_module_text("HeartRateSource");
    obs_sceneitem_t* item = obs_scene_find_source_recursive(scene, source_name);
    std::string url = get_base_url() + "/index.html";

    if (item) {
        // Source exists, check and update URL if needed
        obs_source_t* source = obs_sceneitem_get_source(item);
        if (source) {
            obs_data_t* settings = obs_source_get_settings(source);
            const char* current_url = obs_data_get_string(settings, "url");
            if (current_url && url != current_url) {
                blog(LOG_INFO, "Updating Heart Rate browser source URL to %s", url.c_str());
                obs_data_set_string(settings, "url", url.c_str());
                obs_source_update(source, settings);
            }
            obs_data_release(settings);
        }
    } else {
        blog(LOG_INFO, "Creating Heart Rate browser source...");
        obs_data_t* settings = obs_data_create();
        obs_data_set_string(settings, "url", url.c_str());
        obs_data_set_int(settings, "width", 350);
        obs_data_set_int(settings, "height", 150);
        obs_data_set_int(settings, "fps", 60);
        obs_data_set_bool(settings, "is_local_file", false);

        obs_source_t* source = obs_source_create("browser_source", source_name, settings, nullptr);
        obs_data_release(settings);

        if (source) {
            obs_sceneitem_t* new_item = obs_scene_add(scene, source);
            if (new_item) {
                obs_sceneitem_set_visible(new_item, true);
            }
            obs_source_release(source);
        }
    }

    obs_source_release(scene_source);
}

static void on_frontend_event(enum obs_frontend_event event, void* data) {
    if (event != OBS_FRONTEND_EVENT_FINISHED_LOADING) return;

    check_and_create_source();

    std::string device_id;
    bool auto_connect;
    {
        std::lock_guard<std::mutex> lock(g_config_mutex);
        device_id = g_config.last_device_id;
        auto_connect = g_config.auto_connect;
    }
    if (auto_connect && !device_id.empty() && g_session) {
        blog(LOG_INFO, "Auto connecting to last device: %s", device_id.c_str());
        g_session->ConnectTo(device_id);
    }
}

static void on_tool_config(void* data) {
    if (g_server_port > 0) {
        open_url((get_base_url() + "/index.html").c_str());
    }
}

static void set_json(httplib::Response& res, const std::string& body) {
    res.set_content(body, "application/json");
    res.set_header("Access-Control-Allow-Origin", "*");
}

static void start_http_server() {
    g_server = std::make_unique<httplib::Server>();

    // Serve static files
    auto serve_file = [](const std::string& filename, const std::string& mime) {
        return [filename, mime](const httplib::Request&, httplib::Response& res) {
            std::string path = g_web_dir + "/" + filename;
            std::ifstream file(path);
            if (file) {
                std::stringstream buffer;
                buffer << file.rdbuf();
                res.set_content(buffer.str(), mime);
            } else {
                res.status = 404;
                res.set_content("File not found", "text/plain");
            }
        };
    };

    g_server->Get("/", serve_file("index.html", "text/html"));
    g_server->Get("/index.html", serve_file("index.html", "text/html"));

    g_server->Get("/api/hr", [](const httplib::Request&, httplib::Response& res) {
        set_json(res, HeartRateToJson(g_session->Snapshot().session));
    });

    g_server->Get("/api/session", [](const httplib::Request&, httplib::Response& res) {
        set_json(res, SessionToJson(g_session->Snapshot().session));
    });

    g_server->Get("/api/devices", [](const httplib::Request&, httplib::Response& res) {
        set_json(res, DevicesToJson(g_session->Snapshot().devices));
    });

    g_server->Get("/api/readings", [](const httplib::Request&, httplib::Response& res) {
        set_json(res, ReadingsToJson(g_session->Snapshot().readings));
    });

    g_server->Post("/api/scan", [](const httplib::Request&, httplib::Response& res) {
        g_session->StartScan();
        set_json(res, "{\"status\": \"requested\"}");
    });

    g_server->Post("/api/connect", [](const httplib::Request& req, httplib::Response& res) {
        std::string id = ParseDeviceId(req.body);
        if (id.empty()) {
            blog(LOG_WARNING, "Connect request without device id");
            res.status = 400;
            return;
        }
        g_session->ConnectTo(id);
        set_json(res, "{\"status\": \"connecting\"}");
    });

    g_server->Post("/api/disconnect", [](const httplib::Request&, httplib::Response& res) {
        g_session->Disconnect();
        set_json(res, "{\"status\": \"disconnecting\"}");
    });

    g_server->Post("/api/error/dismiss", [](const httplib::Request&, httplib::Response& res) {
        g_session->DismissError();
        set_json(res, "{\"status\": \"ok\"}");
    });

    // Disconnect and forget the remembered device
    g_server->Post("/api/reset", [](const httplib::Request&, httplib::Response& res) {
        g_session->Disconnect();
        {
            std::lock_guard<std::mutex> lock(g_config_mutex);
            g_config.last_device_id = "";
        }
        save_config();
        set_json(res, "{\"status\": \"reset\"}");
    });

    int port = 17878;
    while (port < 65535) {
        if (g_server->bind_to_port("0.0.0.0", port)) {
            g_server_port = port;
            blog(LOG_INFO, "HTTP Server started on port %d", port);
            g_server->listen_after_bind();
            return;
        }
        port++;
    }
    blog(LOG_ERROR, "Failed to bind to any port starting from 17878");
}

bool obs_module_load(void)
{
    setup_web_dir();
    load_config();

    SessionConfig session_config;
    {
        std::lock_guard<std::mutex> lock(g_config_mutex);
        session_config = g_config.ToSessionConfig();
    }

    g_session = std::make_unique<SessionMachine>(BleTransport::Create(), PermissionGate::Create(),
                                                 std::make_shared<ThreadScheduler>(), session_config);
    g_session->SetObserver(on_session_changed);
    g_session->Start();

    // Start Server
    g_server_thread = std::thread(start_http_server);

    // Wait for server to bind port (max 2 seconds)
    int retries = 0;
    while (g_server_port == 0 && retries < 20) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        retries++;
    }

    // Register UI
    obs_frontend_add_tools_menu_item(obs_module_text("ToolsMenu.HeartRate"), on_tool_config, nullptr);
    obs_frontend_add_event_callback(on_frontend_event, nullptr);

    blog(LOG_INFO, "Heart Rate plugin loaded");
    return true;
}

void obs_module_unload(void)
{
    obs_frontend_remove_event_callback(on_frontend_event, nullptr);

    if (g_server) {
        g_server->stop();
    }
    if (g_server_thread.joinable()) {
        g_server_thread.join();
    }
    if (g_session) {
        g_session->Disconnect();
        g_session->Stop();
        g_session.reset();
    }
    blog(LOG_INFO, "Heart Rate plugin unloaded");
}
