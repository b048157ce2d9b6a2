#ifndef DATABASE_SCHEMAS_H
#define DATABASE_SCHEMAS_H

#include <string>

// Timestamps are INTEGER milliseconds since the Unix epoch
namespace DatabaseSchemas {
    // Shows
    const std::string CREATE_SHOWS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS shows (
            show_id TEXT PRIMARY KEY,
            name TEXT NOT NULL DEFAULT 'Show',
            seat_count INTEGER NOT NULL CHECK(seat_count > 0),
            created_at INTEGER NOT NULL
        );
    )";
    // Seats; the CHECK pins the three legal field shapes
    const std::string CREATE_SEATS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS seats (
            seat_row INTEGER PRIMARY KEY AUTOINCREMENT,
            show_id TEXT NOT NULL,
            label TEXT NOT NULL,
            status TEXT NOT NULL DEFAULT 'AVAILABLE' CHECK(status IN ('AVAILABLE', 'HELD', 'BOOKED')),
            hold_expires_at INTEGER,
            hold_token TEXT,
            held_by TEXT,
            booked_by TEXT,
            booked_at INTEGER,
            FOREIGN KEY (show_id) REFERENCES shows(show_id) ON DELETE CASCADE,
            UNIQUE(show_id, label),
            CHECK (
                (status = 'AVAILABLE' AND hold_expires_at IS NULL AND hold_token IS NULL
                    AND held_by IS NULL AND booked_by IS NULL AND booked_at IS NULL)
             OR (status = 'HELD' AND hold_expires_at IS NOT NULL AND hold_token IS NOT NULL
                    AND booked_by IS NULL AND booked_at IS NULL)
             OR (status = 'BOOKED' AND hold_expires_at IS NULL AND hold_token IS NULL
                    AND held_by IS NULL AND booked_by IS NOT NULL AND booked_at IS NOT NULL)
            )
        );
    )";
    // Booking transactions, keyed by the hold token
    const std::string CREATE_BOOKINGS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS bookings (
            token TEXT PRIMARY KEY,
            show_id TEXT NOT NULL,
            seat_label TEXT NOT NULL,
            customer_name TEXT NOT NULL,
            status TEXT NOT NULL DEFAULT 'HELD' CHECK(status IN ('HELD', 'CONFIRMED', 'CANCELLED')),
            hold_expires_at INTEGER NOT NULL,
            confirmed_at INTEGER,
            created_at INTEGER NOT NULL,
            FOREIGN KEY (show_id, seat_label) REFERENCES seats(show_id, label) ON DELETE CASCADE
        );
    )";

    const std::string CREATE_SEATS_HOLD_TOKEN_INDEX = R"(
        CREATE UNIQUE INDEX IF NOT EXISTS idx_seats_hold_token
        ON seats(hold_token) WHERE hold_token IS NOT NULL;
    )";
    const std::string CREATE_SEATS_EXPIRY_INDEX = R"(
        CREATE INDEX IF NOT EXISTS idx_seats_status_expiry
        ON seats(status, hold_expires_at);
    )";
    // At most one live hold per seat
    const std::string CREATE_BOOKINGS_ONE_HELD_INDEX = R"(
        CREATE UNIQUE INDEX IF NOT EXISTS idx_bookings_one_held
        ON bookings(show_id, seat_label) WHERE status = 'HELD';
    )";
    const std::string CREATE_BOOKINGS_STATUS_INDEX = R"(
        CREATE INDEX IF NOT EXISTS idx_bookings_status
        ON bookings(status, hold_expires_at);
    )";
} // namespace DatabaseSchemas

#endif // DATABASE_SCHEMAS_H
