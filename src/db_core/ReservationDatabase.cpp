#include "ReservationDatabase.h"
#include "DatabaseSchemas.h"
#include "SeatLabels.h"
#include "TimeUtils.h"
#include <uuid/uuid.h>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace {

// BEGIN IMMEDIATE takes the write lock up front, so the conditional update
// never has to upgrade a read lock that another connection is waiting on.
// Rolls back unless commit() was reached.
class WriteTransaction {
public:
    explicit WriteTransaction(SQLite::Database& db) : db_(db) {
        db_.exec("BEGIN IMMEDIATE");
    }

    ~WriteTransaction() {
        if (committed_) return;
        try {
            db_.exec("ROLLBACK");
        } catch (const std::exception& e) {
            std::cerr << "[Store] Rollback failed: " << e.what() << std::endl;
        }
    }

    WriteTransaction(const WriteTransaction&) = delete;
    WriteTransaction& operator=(const WriteTransaction&) = delete;

    void commit() {
        db_.exec("COMMIT");
        committed_ = true;
    }

private:
    SQLite::Database& db_;
    bool committed_ = false;
};

std::string trim(const std::string& s) {
    size_t begin = 0, end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::optional<std::string> optionalText(const SQLite::Column& column) {
    if (column.isNull()) return std::nullopt;
    return column.getString();
}

std::optional<TimePoint> optionalTime(const SQLite::Column& column) {
    if (column.isNull()) return std::nullopt;
    return TimeUtils::fromEpochMs(column.getInt64());
}

const char* SEAT_COLUMNS =
    "show_id, label, status, hold_expires_at, hold_token, held_by, booked_by, booked_at";

Seat readSeat(SQLite::Statement& query) {
    Seat seat;
    seat.show_id = query.getColumn(0).getString();
    seat.label = query.getColumn(1).getString();
    seat.status = seatStatusFromString(query.getColumn(2).getString()).value_or(SeatStatus::Available);
    seat.hold_expires_at = optionalTime(query.getColumn(3));
    seat.hold_token = optionalText(query.getColumn(4));
    seat.held_by = optionalText(query.getColumn(5));
    seat.booked_by = optionalText(query.getColumn(6));
    seat.booked_at = optionalTime(query.getColumn(7));
    return seat;
}

} // namespace

ReservationDatabase::ReservationDatabase(const std::string& db_path, const StoreOptions& options)
    : db_path_(db_path), options_(options) {
    if (db_path != ":memory:") {
        const auto parent = std::filesystem::path(db_path).parent_path();
        if (!parent.empty()) {
            std::error_code error_code;
            std::filesystem::create_directories(parent, error_code);
            if (error_code) {
                std::cerr << "[Store] Cannot create " << parent.string() << ": " << error_code.message() << std::endl;
            }
        }
    }

    try {
        database_ = std::make_unique<SQLite::Database>(db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        database_->setBusyTimeout(options_.busy_timeout_ms);
        database_->exec("PRAGMA foreign_keys = ON");
        if (db_path != ":memory:") {
            database_->exec("PRAGMA journal_mode = WAL");
        }
        std::cout << "[Store] Database opened successfully: " << db_path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Failed to open database: " << e.what() << std::endl;
        throw;
    }
}

// Singleton Pattern Implementation
ReservationDatabase& ReservationDatabase::getInstance(const std::string& db_path, const StoreOptions& options) {
    static ReservationDatabase instance(db_path, options);
    return instance;
}

bool ReservationDatabase::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        bool success = createTables();
        if (success) {
            std::cout << "[Store] Database initialized successfully." << std::endl;
        }
        return success;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Database initialization failed: " << e.what() << std::endl;
        return false;
    }
}

// Create Table
bool ReservationDatabase::createTables() {
    try {
        database_->exec(DatabaseSchemas::CREATE_SHOWS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_SEATS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_BOOKINGS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_SEATS_HOLD_TOKEN_INDEX);
        database_->exec(DatabaseSchemas::CREATE_SEATS_EXPIRY_INDEX);
        database_->exec(DatabaseSchemas::CREATE_BOOKINGS_ONE_HELD_INDEX);
        database_->exec(DatabaseSchemas::CREATE_BOOKINGS_STATUS_INDEX);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Table creation failed: " << e.what() << std::endl;
        return false;
    }
}

// Random (version 4) UUID text from the system entropy source
std::string ReservationDatabase::generateToken() {
    uuid_t id;
    uuid_generate_random(id);
    char text[37];
    uuid_unparse_lower(id, text);
    return std::string(text);
}

ReservationResult<std::string> ReservationDatabase::createShow(int seat_count,
                                                               const std::string& name,
                                                               TimePoint now) {
    using Result = ReservationResult<std::string>;
    if (seat_count <= 0 || seat_count > options_.max_seats_per_show) {
        std::cout << "[Store] Create show rejected, seat count " << seat_count
                  << " outside 1.." << options_.max_seats_per_show << std::endl;
        return Result::failure(ReservationOutcome::InvalidArgument);
    }
    std::string show_name = trim(name);
    if (show_name.empty()) show_name = "Show";

    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        WriteTransaction transaction(*database_);
        const std::string show_id = generateToken();
        const int64_t now_ms = TimeUtils::toEpochMs(now);

        SQLite::Statement insertShow(*database_,
            "INSERT INTO shows (show_id, name, seat_count, created_at) VALUES (?, ?, ?, ?)");
        insertShow.bind(1, show_id);
        insertShow.bind(2, show_name);
        insertShow.bind(3, seat_count);
        insertShow.bind(4, now_ms);
        insertShow.exec();

        SQLite::Statement insertSeat(*database_,
            "INSERT INTO seats (show_id, label, status) VALUES (?, ?, 'AVAILABLE')");
        for (const auto& label : SeatLabels::rowLabels(seat_count)) {
            insertSeat.bind(1, show_id);
            insertSeat.bind(2, label);
            insertSeat.exec();
            insertSeat.reset();
        }

        transaction.commit();
        std::cout << "[Store] Created show " << show_id << " (" << show_name << ") with "
                  << seat_count << " seats" << std::endl;
        return Result::success(show_id);
    } catch (const std::exception& e) {
        std::cerr << "[Store] Create show failed: " << e.what() << std::endl;
        return Result::failure(ReservationOutcome::StorageFailure);
    }
}

ReservationResult<std::vector<ShowInfo>> ReservationDatabase::listShows() {
    using Result = ReservationResult<std::vector<ShowInfo>>;
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<ShowInfo> shows;

    try {
        SQLite::Statement query(*database_,
            "SELECT show_id, name, seat_count, created_at FROM shows ORDER BY created_at DESC, rowid DESC");
        while (query.executeStep()) {
            ShowInfo show;
            show.show_id = query.getColumn(0).getString();
            show.name = query.getColumn(1).getString();
            show.seat_count = query.getColumn(2).getInt();
            show.created_at = TimeUtils::fromEpochMs(query.getColumn(3).getInt64());
            shows.push_back(show);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Store] List shows failed: " << e.what() << std::endl;
        return Result::failure(ReservationOutcome::StorageFailure);
    }

    return Result::success(std::move(shows));
}

ReservationResult<HoldGrant> ReservationDatabase::tryHold(const std::string& show_id,
                                                          const std::string& label,
                                                          const std::string& requester_name,
                                                          TimePoint now) {
    using Result = ReservationResult<HoldGrant>;
    const std::string customer = trim(requester_name);
    if (show_id.empty() || label.empty() || customer.empty()) {
        return Result::failure(ReservationOutcome::InvalidArgument);
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        WriteTransaction transaction(*database_);
        const std::string token = generateToken();
        const TimePoint expires_at = now + options_.hold_duration;
        const int64_t now_ms = TimeUtils::toEpochMs(now);
        const int64_t expires_ms = TimeUtils::toEpochMs(expires_at);

        // The status check and the write are the same statement
        SQLite::Statement claim(*database_, R"(
            UPDATE seats
            SET status = 'HELD', hold_expires_at = ?, hold_token = ?, held_by = ?
            WHERE show_id = ? AND label = ? AND status = 'AVAILABLE'
        )");
        claim.bind(1, expires_ms);
        claim.bind(2, token);
        claim.bind(3, customer);
        claim.bind(4, show_id);
        claim.bind(5, label);

        if (claim.exec() != 1) {
            SQLite::Statement probe(*database_, "SELECT status FROM seats WHERE show_id = ? AND label = ?");
            probe.bind(1, show_id);
            probe.bind(2, label);
            if (!probe.executeStep()) {
                std::cout << "[Store] Hold rejected, no seat " << label << " in show " << show_id << std::endl;
                return Result::failure(ReservationOutcome::SeatNotFound);
            }
            std::cout << "[Store] Hold rejected, seat " << label << " is "
                      << probe.getColumn(0).getString() << std::endl;
            return Result::failure(ReservationOutcome::SeatUnavailable);
        }

        SQLite::Statement insert(*database_, R"(
            INSERT INTO bookings (token, show_id, seat_label, customer_name, status, hold_expires_at, created_at)
            VALUES (?, ?, ?, ?, 'HELD', ?, ?)
        )");
        insert.bind(1, token);
        insert.bind(2, show_id);
        insert.bind(3, label);
        insert.bind(4, customer);
        insert.bind(5, expires_ms);
        insert.bind(6, now_ms);
        insert.exec();

        transaction.commit();
        std::cout << "[Store] Seat " << label << " held for " << customer
                  << " until " << TimeUtils::toIso8601Utc(expires_at) << std::endl;

        HoldGrant grant;
        grant.token = token;
        grant.show_id = show_id;
        grant.seat_label = label;
        grant.hold_expires_at = expires_at;
        return Result::success(grant);
    } catch (const std::exception& e) {
        std::cerr << "[Store] Hold failed: " << e.what() << std::endl;
        return Result::failure(ReservationOutcome::StorageFailure);
    }
}

ReservationOutcome ReservationDatabase::confirm(const std::string& token, TimePoint now) {
    if (token.empty()) return ReservationOutcome::HoldNotFound;

    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        WriteTransaction transaction(*database_);

        SQLite::Statement query(*database_,
            "SELECT show_id, seat_label, customer_name, status, hold_expires_at FROM bookings WHERE token = ?");
        query.bind(1, token);
        if (!query.executeStep()) {
            std::cout << "[Store] Confirm: unknown token " << token << std::endl;
            return ReservationOutcome::HoldNotFound;
        }

        const std::string show_id = query.getColumn(0).getString();
        const std::string label = query.getColumn(1).getString();
        const std::string customer = query.getColumn(2).getString();
        const std::string status = query.getColumn(3).getString();
        const TimePoint expires_at = TimeUtils::fromEpochMs(query.getColumn(4).getInt64());
        query.reset();

        if (status != toString(BookingStatus::Held)) {
            std::cout << "[Store] Confirm: transaction " << token << " already " << status << std::endl;
            return ReservationOutcome::HoldNotFound;
        }
        // Judged against the deadline, whether or not a sweep has run
        if (TimeUtils::isExpired(expires_at, now)) {
            std::cout << "[Store] Confirm: hold on " << label << " expired at "
                      << TimeUtils::toIso8601Utc(expires_at) << std::endl;
            return ReservationOutcome::HoldExpired;
        }

        const int64_t now_ms = TimeUtils::toEpochMs(now);
        SQLite::Statement book(*database_, R"(
            UPDATE seats
            SET status = 'BOOKED', hold_expires_at = NULL, hold_token = NULL, held_by = NULL,
                booked_by = ?, booked_at = ?
            WHERE show_id = ? AND label = ? AND status = 'HELD' AND hold_token = ?
        )");
        book.bind(1, customer);
        book.bind(2, now_ms);
        book.bind(3, show_id);
        book.bind(4, label);
        book.bind(5, token);
        if (book.exec() != 1) {
            std::cerr << "[Store] Confirm: seat " << label << " no longer held under " << token << std::endl;
            return ReservationOutcome::HoldNotFound;
        }

        SQLite::Statement done(*database_,
            "UPDATE bookings SET status = 'CONFIRMED', confirmed_at = ? WHERE token = ? AND status = 'HELD'");
        done.bind(1, now_ms);
        done.bind(2, token);
        if (done.exec() != 1) {
            return ReservationOutcome::HoldNotFound;
        }

        transaction.commit();
        std::cout << "[Store] Seat " << label << " booked by " << customer << std::endl;
        return ReservationOutcome::Ok;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Confirm failed: " << e.what() << std::endl;
        return ReservationOutcome::StorageFailure;
    }
}

ReservationOutcome ReservationDatabase::release(const std::string& token) {
    if (token.empty()) return ReservationOutcome::HoldNotFound;

    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        WriteTransaction transaction(*database_);
        if (!releaseHeldLocked(token)) {
            // Normal "nothing to do"
            std::cout << "[Store] Release: no live hold for " << token << std::endl;
            return ReservationOutcome::HoldNotFound;
        }
        transaction.commit();
        return ReservationOutcome::Ok;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Release failed: " << e.what() << std::endl;
        return ReservationOutcome::StorageFailure;
    }
}

bool ReservationDatabase::releaseHeldLocked(const std::string& token) {
    SQLite::Statement query(*database_,
        "SELECT show_id, seat_label FROM bookings WHERE token = ? AND status = 'HELD'");
    query.bind(1, token);
    if (!query.executeStep()) {
        return false;
    }
    const std::string show_id = query.getColumn(0).getString();
    const std::string label = query.getColumn(1).getString();
    query.reset();

    SQLite::Statement freeSeat(*database_, R"(
        UPDATE seats
        SET status = 'AVAILABLE', hold_expires_at = NULL, hold_token = NULL, held_by = NULL
        WHERE show_id = ? AND label = ? AND status = 'HELD' AND hold_token = ?
    )");
    freeSeat.bind(1, show_id);
    freeSeat.bind(2, label);
    freeSeat.bind(3, token);
    if (freeSeat.exec() != 1) {
        std::cerr << "[Store] Seat " << label << " did not carry token " << token
                  << ", cancelling the transaction alone" << std::endl;
    }

    SQLite::Statement cancel(*database_,
        "UPDATE bookings SET status = 'CANCELLED' WHERE token = ? AND status = 'HELD'");
    cancel.bind(1, token);
    const bool cancelled = cancel.exec() == 1;
    if (cancelled) {
        std::cout << "[Store] Seat " << label << " released (" << token << ")" << std::endl;
    }
    return cancelled;
}

ReservationResult<std::vector<Seat>> ReservationDatabase::listSeats(const std::string& show_id) {
    using Result = ReservationResult<std::vector<Seat>>;
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<Seat> seats;

    try {
        SQLite::Statement query(*database_,
            std::string("SELECT ") + SEAT_COLUMNS + " FROM seats WHERE show_id = ?");
        query.bind(1, show_id);
        while (query.executeStep()) {
            seats.push_back(readSeat(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[Store] List seats failed: " << e.what() << std::endl;
        return Result::failure(ReservationOutcome::StorageFailure);
    }

    SeatLabels::sortNatural(seats, [](const Seat& s) -> const std::string& { return s.label; });
    return Result::success(std::move(seats));
}

ReservationResult<std::optional<BookingTransaction>> ReservationDatabase::lookupHold(const std::string& token) {
    using Result = ReservationResult<std::optional<BookingTransaction>>;
    std::lock_guard<std::mutex> lock(db_mutex_);

    try {
        SQLite::Statement query(*database_, R"(
            SELECT token, show_id, seat_label, customer_name, status, hold_expires_at, confirmed_at, created_at
            FROM bookings WHERE token = ?
        )");
        query.bind(1, token);
        if (!query.executeStep()) {
            return Result::success(std::nullopt);
        }

        BookingTransaction booking;
        booking.token = query.getColumn(0).getString();
        booking.show_id = query.getColumn(1).getString();
        booking.seat_label = query.getColumn(2).getString();
        booking.customer_name = query.getColumn(3).getString();
        booking.status = bookingStatusFromString(query.getColumn(4).getString()).value_or(BookingStatus::Cancelled);
        booking.hold_expires_at = TimeUtils::fromEpochMs(query.getColumn(5).getInt64());
        booking.confirmed_at = optionalTime(query.getColumn(6));
        booking.created_at = TimeUtils::fromEpochMs(query.getColumn(7).getInt64());
        return Result::success(booking);
    } catch (const std::exception& e) {
        std::cerr << "[Store] Lookup hold failed: " << e.what() << std::endl;
        return Result::failure(ReservationOutcome::StorageFailure);
    }
}

ReservationResult<std::vector<ReclaimedHold>> ReservationDatabase::reclaimExpired(TimePoint now) {
    using Result = ReservationResult<std::vector<ReclaimedHold>>;
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<ReclaimedHold> reclaimed;

    try {
        WriteTransaction transaction(*database_);
        const int64_t now_ms = TimeUtils::toEpochMs(now);

        std::vector<ReclaimedHold> expired;
        {
            SQLite::Statement query(*database_, R"(
                SELECT show_id, label, hold_token FROM seats
                WHERE status = 'HELD' AND hold_expires_at <= ?
            )");
            query.bind(1, now_ms);
            while (query.executeStep()) {
                ReclaimedHold hold;
                hold.show_id = query.getColumn(0).getString();
                hold.seat_label = query.getColumn(1).getString();
                hold.token = query.getColumn(2).getString();
                expired.push_back(hold);
            }
        }

        for (const auto& hold : expired) {
            if (releaseHeldLocked(hold.token)) {
                reclaimed.push_back(hold);
                continue;
            }
            // Seat held under a token with no live transaction
            SQLite::Statement freeSeat(*database_, R"(
                UPDATE seats
                SET status = 'AVAILABLE', hold_expires_at = NULL, hold_token = NULL, held_by = NULL
                WHERE show_id = ? AND label = ? AND status = 'HELD' AND hold_token = ?
            )");
            freeSeat.bind(1, hold.show_id);
            freeSeat.bind(2, hold.seat_label);
            freeSeat.bind(3, hold.token);
            if (freeSeat.exec() == 1) {
                std::cerr << "[Store] Reclaimed orphan hold on " << hold.seat_label << std::endl;
                reclaimed.push_back(hold);
            }
        }

        // Transactions still HELD past their deadline whose seat lost the token
        SQLite::Statement orphans(*database_, R"(
            UPDATE bookings SET status = 'CANCELLED'
            WHERE status = 'HELD' AND hold_expires_at <= ?
              AND token NOT IN (SELECT hold_token FROM seats WHERE hold_token IS NOT NULL)
        )");
        orphans.bind(1, now_ms);
        const int orphan_count = orphans.exec();
        if (orphan_count > 0) {
            std::cerr << "[Store] Cancelled " << orphan_count << " orphan transaction(s)" << std::endl;
        }

        transaction.commit();
    } catch (const std::exception& e) {
        std::cerr << "[Store] Reclaim expired holds failed: " << e.what() << std::endl;
        return Result::failure(ReservationOutcome::StorageFailure);
    }

    return Result::success(std::move(reclaimed));
}

ReservationResult<std::vector<std::string>> ReservationDatabase::verifyConsistency() {
    using Result = ReservationResult<std::vector<std::string>>;
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<std::string> problems;

    try {
        SQLite::Statement heldSeats(*database_, R"(
            SELECT s.show_id, s.label, s.hold_token FROM seats s
            WHERE s.status = 'HELD' AND NOT EXISTS (
                SELECT 1 FROM bookings b
                WHERE b.token = s.hold_token AND b.status = 'HELD'
                  AND b.show_id = s.show_id AND b.seat_label = s.label)
        )");
        while (heldSeats.executeStep()) {
            problems.push_back("seat " + heldSeats.getColumn(1).getString() + " of show " +
                               heldSeats.getColumn(0).getString() + " is HELD under " +
                               heldSeats.getColumn(2).getString() + " without a HELD transaction");
        }

        SQLite::Statement heldBookings(*database_, R"(
            SELECT b.token, b.show_id, b.seat_label FROM bookings b
            WHERE b.status = 'HELD' AND NOT EXISTS (
                SELECT 1 FROM seats s
                WHERE s.hold_token = b.token AND s.status = 'HELD'
                  AND s.show_id = b.show_id AND s.label = b.seat_label)
        )");
        while (heldBookings.executeStep()) {
            problems.push_back("transaction " + heldBookings.getColumn(0).getString() +
                               " is HELD but seat " + heldBookings.getColumn(2).getString() +
                               " does not carry its token");
        }

        SQLite::Statement booked(*database_, R"(
            SELECT s.show_id, s.label, s.status,
                   (SELECT COUNT(*) FROM bookings b
                    WHERE b.show_id = s.show_id AND b.seat_label = s.label AND b.status = 'CONFIRMED')
            FROM seats s
        )");
        while (booked.executeStep()) {
            const bool is_booked = booked.getColumn(2).getString() == toString(SeatStatus::Booked);
            const int confirmed = booked.getColumn(3).getInt();
            if (confirmed != (is_booked ? 1 : 0)) {
                problems.push_back("seat " + booked.getColumn(1).getString() + " is " +
                                   booked.getColumn(2).getString() + " with " +
                                   std::to_string(confirmed) + " CONFIRMED transaction(s)");
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[Store] Consistency check failed: " << e.what() << std::endl;
        return Result::failure(ReservationOutcome::StorageFailure);
    }

    return Result::success(std::move(problems));
}

bool ReservationDatabase::clearAll() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        WriteTransaction transaction(*database_);
        database_->exec("DELETE FROM bookings");
        database_->exec("DELETE FROM seats");
        database_->exec("DELETE FROM shows");
        transaction.commit();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Failed to clear existing data: " << e.what() << std::endl;
        return false;
    }
}
