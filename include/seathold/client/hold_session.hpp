#pragma once
// Consumer side of a hold: countdown, local expiry, draft persistence and
// reconciliation with the store after a reconnect. The store stays the
// final arbiter; this only decides what the caller may still offer.

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTimer>
#include <optional>
#include <string>

#include "../../../src/db_core/ReservationStore.h"
#include "../../../src/db_core/TimeUtils.h"

namespace seathold {

// What survives a reload: enough to find, resume or release the hold
struct HoldDraft {
    std::string token;
    std::string show_id;
    std::string seat_label;
    std::string customer_name;
    std::optional<TimePoint> hold_expires_at;
};

class HoldSession : public QObject {
    Q_OBJECT
public:
    enum class State { Idle, Held, Confirmed, Expired };

    enum class ReconcileOutcome {
        NothingToResume,   // no hold in the draft
        Resumed,           // store still HELD under our token
        Discarded,         // store says expired, reclaimed, confirmed or unknown
        StoreUnavailable   // lookup failed; local state kept for a retry
    };

    explicit HoldSession(ReservationStore& store, ClockFn clock = &TimeUtils::now,
                         QObject* parent=nullptr);

    // At most one active hold; InvalidArgument while one is live
    ReservationOutcome hold(const std::string& show_id, const std::string& label,
                            const std::string& customer_name);
    ReservationOutcome confirm();
    ReservationOutcome cancel();

    ReconcileOutcome reconcile();

    State state() const { return state_; }
    const HoldDraft& draft() const { return draft_; }

    int remainingSeconds() const;
    bool isExpired() const;
    // Confirm/cancel are offered only while this is true
    bool canAct() const;

    bool saveDraft(const std::string& path) const;
    bool loadDraft(const std::string& path);

    // Back to Idle without touching the store
    void reset();

    static const char* toString(State s);

public slots:
    // Countdown step; the timer calls this every second
    void tick();

signals:
    void countdownChanged(int seconds_left);
    void holdLapsed(const QString& token);
    void stateChanged(seathold::HoldSession::State state);

private:
    void setState(State s);
    void startCountdown();
    void lapse();

    ReservationStore& store_;
    ClockFn clock_;
    QTimer countdown_;
    HoldDraft draft_;
    State state_ = State::Idle;
};

} // namespace seathold
