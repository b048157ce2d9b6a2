#pragma once
#include <string>

namespace seathold {

// Reservation service config (load from reservation.yml)
struct ReservationConfig {
    // ===================== fields ===================== //

    std::string db_path = "out/reservations.db";    // SQLite file; ":memory:" for a throwaway store

    // Holds
    int hold_duration_sec    = 20;     // hold deadline = hold time + this
    int max_seats_per_show   = 500;
    int default_seat_count   = 30;     // seats of the show seeded on first start
    bool seed_default_show   = true;

    // Background work
    int reclaim_interval_ms   = 5000;  // expiry sweep period, independent of hold_duration_sec
    int broadcast_interval_ms = 2000;  // seat_update push to subscribers (0 disables)

    // WebSocket hub
    std::string ws_host = "127.0.0.1";
    int ws_port         = 12345;

    // SQLite busy handler; bounds how long an operation waits on another process
    int busy_timeout_ms = 5000;

    // ===================== methods ===================== //

    static ReservationConfig fromYaml(const std::string& yaml_path);
    static ReservationConfig fromJson(const std::string& json_path);

    // Picks the loader by extension (.yml/.yaml, anything else is JSON)
    static ReservationConfig fromFile(const std::string& path);

    // Empty when every field is in range, otherwise the first complaint
    std::string validate() const;
};

} // namespace seathold
