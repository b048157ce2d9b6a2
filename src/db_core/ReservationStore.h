#ifndef RESERVATION_STORE_H
#define RESERVATION_STORE_H

#include <chrono>
#include <string>
#include <vector>

#include "DataTypes.h"

// Request/response surface of the reservation core. Callers (hub, reclaimer,
// client sessions, CLI) depend on this rather than on the storage engine.
class ReservationStore {
public:
    virtual ~ReservationStore() = default;

    // Provision a show with seats A1..A<seat_count>, all AVAILABLE
    virtual ReservationResult<std::string> createShow(int seat_count,
                                                      const std::string& name,
                                                      TimePoint now) = 0;
    virtual ReservationResult<std::vector<ShowInfo>> listShows() = 0;

    // AVAILABLE -> HELD as a single conditional update, paired with a new
    // HELD booking transaction
    virtual ReservationResult<HoldGrant> tryHold(const std::string& show_id,
                                                 const std::string& label,
                                                 const std::string& requester_name,
                                                 TimePoint now) = 0;

    // HELD -> BOOKED; HoldExpired once now >= hold_expires_at
    virtual ReservationOutcome confirm(const std::string& token, TimePoint now) = 0;

    // HELD -> AVAILABLE; HoldNotFound when already terminal
    virtual ReservationOutcome release(const std::string& token) = 0;

    // Seats in natural label order
    virtual ReservationResult<std::vector<Seat>> listSeats(const std::string& show_id) = 0;

    // Empty value when the token is unknown
    virtual ReservationResult<std::optional<BookingTransaction>> lookupHold(const std::string& token) = 0;

    // Release every hold whose deadline is at or before now
    virtual ReservationResult<std::vector<ReclaimedHold>> reclaimExpired(TimePoint now) = 0;

    virtual std::chrono::seconds holdDuration() const = 0;
};

#endif // RESERVATION_STORE_H
