#ifndef RESERVATION_DATABASE_H
#define RESERVATION_DATABASE_H

#include <SQLiteCpp/SQLiteCpp.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "DataTypes.h"
#include "ReservationStore.h"

struct StoreOptions {
    std::chrono::seconds hold_duration{20};
    int busy_timeout_ms = 5000;
    int max_seats_per_show = 500;
};

// SQLite-backed reservation store. In-process callers are serialised by
// db_mutex_; other processes on the same file by BEGIN IMMEDIATE.
class ReservationDatabase : public ReservationStore {
public:
    // Get instance using Singleton pattern; arguments only matter on first call
    static ReservationDatabase& getInstance(const std::string& db_path = "../out/reservations.db",
                                           const StoreOptions& options = StoreOptions());

    // Throws SQLite::Exception when the file cannot be opened
    explicit ReservationDatabase(const std::string& db_path,
                                 const StoreOptions& options = StoreOptions());
    ~ReservationDatabase() override = default;

    // Copying and assignment are prohibited
    ReservationDatabase(const ReservationDatabase&) = delete;
    ReservationDatabase& operator=(const ReservationDatabase&) = delete;

    // Create tables and indexes
    bool initialize();

    ReservationResult<std::string> createShow(int seat_count,
                                              const std::string& name,
                                              TimePoint now) override;
    ReservationResult<std::vector<ShowInfo>> listShows() override;

    ReservationResult<HoldGrant> tryHold(const std::string& show_id,
                                         const std::string& label,
                                         const std::string& requester_name,
                                         TimePoint now) override;
    ReservationOutcome confirm(const std::string& token, TimePoint now) override;
    ReservationOutcome release(const std::string& token) override;

    ReservationResult<std::vector<Seat>> listSeats(const std::string& show_id) override;
    ReservationResult<std::optional<BookingTransaction>> lookupHold(const std::string& token) override;

    ReservationResult<std::vector<ReclaimedHold>> reclaimExpired(TimePoint now) override;

    // Read-only audit of the seat/transaction pairing; one line per problem
    ReservationResult<std::vector<std::string>> verifyConsistency();

    std::chrono::seconds holdDuration() const override { return options_.hold_duration; }

    // Delete every show, seat and booking
    bool clearAll();

private:
    std::string db_path_;
    StoreOptions options_;
    std::unique_ptr<SQLite::Database> database_;
    std::mutex db_mutex_;

    bool createTables();
    static std::string generateToken();

    // Seat -> AVAILABLE and its HELD transaction -> CANCELLED; caller holds
    // the lock and an open write transaction. False when the hold was gone.
    bool releaseHeldLocked(const std::string& token);
};

#endif // RESERVATION_DATABASE_H
