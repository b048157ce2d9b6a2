#ifndef DATA_TYPES_H
#define DATA_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <utility>

#include "TimeUtils.h"

// Seat status as stored in seats.status
enum class SeatStatus : int {
    Available = 0,
    Held      = 1,
    Booked    = 2
};

// Booking transaction status as stored in bookings.status
enum class BookingStatus : int {
    Held      = 0,
    Confirmed = 1,   // terminal
    Cancelled = 2    // terminal
};

// Outcome of every store operation. Rejections are ordinary values;
// only StorageFailure signals an operational fault.
enum class ReservationOutcome : int {
    Ok = 0,
    SeatUnavailable,   // seat not AVAILABLE at hold time
    SeatNotFound,      // no such (show, label)
    HoldNotFound,      // token unknown or transaction already terminal
    HoldExpired,       // deadline passed at confirm time
    InvalidArgument,
    StorageFailure     // retryable, nothing was committed
};

// One row of the seats relation
struct Seat {
    std::string show_id;
    std::string label;
    SeatStatus status = SeatStatus::Available;

    // set iff Held
    std::optional<TimePoint> hold_expires_at;
    std::optional<std::string> hold_token;
    std::optional<std::string> held_by;

    // set iff Booked
    std::optional<std::string> booked_by;
    std::optional<TimePoint> booked_at;
};

// One row of the bookings relation, keyed by the hold token
struct BookingTransaction {
    std::string token;
    std::string show_id;
    std::string seat_label;
    std::string customer_name;
    BookingStatus status = BookingStatus::Held;
    TimePoint hold_expires_at;
    std::optional<TimePoint> confirmed_at;
    TimePoint created_at;
};

struct ShowInfo {
    std::string show_id;
    std::string name;
    int seat_count = 0;
    TimePoint created_at;
};

// What a client needs to resume or release a hold after reconnecting
struct HoldGrant {
    std::string token;
    std::string show_id;
    std::string seat_label;
    TimePoint hold_expires_at;
};

struct ReclaimedHold {
    std::string show_id;
    std::string seat_label;
    std::string token;
};

template <typename T>
struct ReservationResult {
    ReservationOutcome outcome = ReservationOutcome::Ok;
    std::optional<T> value;

    bool ok() const { return outcome == ReservationOutcome::Ok; }

    static ReservationResult success(T v) {
        ReservationResult r;
        r.value = std::move(v);
        return r;
    }

    static ReservationResult failure(ReservationOutcome o) {
        ReservationResult r;
        r.outcome = o;
        return r;
    }
};

// ------ string forms used by the database and the wire ------
inline const char* toString(SeatStatus s) {
    switch (s) {
        case SeatStatus::Available: return "AVAILABLE";
        case SeatStatus::Held:      return "HELD";
        case SeatStatus::Booked:    return "BOOKED";
    }
    return "AVAILABLE";
}

inline std::optional<SeatStatus> seatStatusFromString(const std::string& s) {
    if (s == "AVAILABLE") return SeatStatus::Available;
    if (s == "HELD") return SeatStatus::Held;
    if (s == "BOOKED") return SeatStatus::Booked;
    return std::nullopt;
}

inline const char* toString(BookingStatus s) {
    switch (s) {
        case BookingStatus::Held:      return "HELD";
        case BookingStatus::Confirmed: return "CONFIRMED";
        case BookingStatus::Cancelled: return "CANCELLED";
    }
    return "HELD";
}

inline std::optional<BookingStatus> bookingStatusFromString(const std::string& s) {
    if (s == "HELD") return BookingStatus::Held;
    if (s == "CONFIRMED") return BookingStatus::Confirmed;
    if (s == "CANCELLED") return BookingStatus::Cancelled;
    return std::nullopt;
}

inline const char* toString(ReservationOutcome o) {
    switch (o) {
        case ReservationOutcome::Ok:              return "Ok";
        case ReservationOutcome::SeatUnavailable: return "SeatUnavailable";
        case ReservationOutcome::SeatNotFound:    return "SeatNotFound";
        case ReservationOutcome::HoldNotFound:    return "HoldNotFound";
        case ReservationOutcome::HoldExpired:     return "HoldExpired";
        case ReservationOutcome::InvalidArgument: return "InvalidArgument";
        case ReservationOutcome::StorageFailure:  return "StorageFailure";
    }
    return "StorageFailure";
}

inline bool isRetryable(ReservationOutcome o) {
    return o == ReservationOutcome::StorageFailure;
}

#endif // DATA_TYPES_H
