#include "seathold/Config.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iostream>

using nlohmann::json;

namespace seathold {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ReservationConfig ReservationConfig::fromYaml(const std::string& yaml_path) {
    ReservationConfig c;
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        try_get(r, "db_path", c.db_path);

        try_get(r, "hold_duration_sec",  c.hold_duration_sec);
        try_get(r, "max_seats_per_show", c.max_seats_per_show);
        try_get(r, "default_seat_count", c.default_seat_count);
        try_get(r, "seed_default_show",  c.seed_default_show);

        try_get(r, "reclaim_interval_ms",   c.reclaim_interval_ms);
        try_get(r, "broadcast_interval_ms", c.broadcast_interval_ms);

        try_get(r, "ws_host", c.ws_host);
        try_get(r, "ws_port", c.ws_port);

        try_get(r, "busy_timeout_ms", c.busy_timeout_ms);
    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] " << yaml_path << ": " << e.what() << ", keeping defaults" << std::endl;
        return ReservationConfig();
    }
    return c;
}

ReservationConfig ReservationConfig::fromJson(const std::string& json_path) {
    ReservationConfig c;
    try {
        std::ifstream ifs(json_path);
        if (!ifs.is_open()) {
            std::cerr << "[Config] Cannot open " << json_path << ", keeping defaults" << std::endl;
            return c;
        }
        json r; ifs >> r;
        auto get_s = [&](const char* k, std::string& v){ if(r.contains(k)) v = r[k].get<std::string>(); };
        auto get_i = [&](const char* k, int& v){ if(r.contains(k)) v = r[k].get<int>(); };
        auto get_b = [&](const char* k, bool& v){ if(r.contains(k)) v = r[k].get<bool>(); };

        get_s("db_path", c.db_path);

        get_i("hold_duration_sec", c.hold_duration_sec);
        get_i("max_seats_per_show", c.max_seats_per_show);
        get_i("default_seat_count", c.default_seat_count);
        get_b("seed_default_show", c.seed_default_show);

        get_i("reclaim_interval_ms", c.reclaim_interval_ms);
        get_i("broadcast_interval_ms", c.broadcast_interval_ms);

        get_s("ws_host", c.ws_host);
        get_i("ws_port", c.ws_port);

        get_i("busy_timeout_ms", c.busy_timeout_ms);
    } catch (const json::exception& e) {
        std::cerr << "[Config] " << json_path << ": " << e.what() << ", keeping defaults" << std::endl;
        return ReservationConfig();
    }
    return c;
}

ReservationConfig ReservationConfig::fromFile(const std::string& path) {
    if (ends_with(path, ".yml") || ends_with(path, ".yaml")) {
        return fromYaml(path);
    }
    return fromJson(path);
}

std::string ReservationConfig::validate() const {
    if (db_path.empty()) return "db_path must not be empty";
    if (hold_duration_sec <= 0) return "hold_duration_sec must be positive";
    if (max_seats_per_show <= 0) return "max_seats_per_show must be positive";
    if (default_seat_count <= 0 || default_seat_count > max_seats_per_show)
        return "default_seat_count must be within 1..max_seats_per_show";
    if (reclaim_interval_ms <= 0) return "reclaim_interval_ms must be positive";
    if (broadcast_interval_ms < 0) return "broadcast_interval_ms must not be negative";
    if (ws_port <= 0 || ws_port > 65535) return "ws_port must be within 1..65535";
    if (busy_timeout_ms < 0) return "busy_timeout_ms must not be negative";
    return std::string();
}

} // namespace seathold
