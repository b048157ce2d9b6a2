#pragma once
// Periodic sweep returning lapsed holds to AVAILABLE

#include <QtCore/QObject>
#include <QtCore/QStringList>
#include <QtCore/QTimer>
#include <vector>

#include "../../../src/db_core/ReservationStore.h"
#include "../../../src/db_core/TimeUtils.h"

namespace seathold {

class ExpiryReclaimer : public QObject {
    Q_OBJECT
public:
    ExpiryReclaimer(ReservationStore& store, int interval_ms,
                    ClockFn clock = &TimeUtils::now, QObject* parent=nullptr);

    void start();
    void stop();
    bool isRunning() const { return timer_.isActive(); }
    int intervalMs() const { return timer_.interval(); }

    // One sweep at clock(); safe to call while the timer runs
    ReservationResult<std::vector<ReclaimedHold>> sweepOnce();

    quint64 sweepsRun() const { return sweeps_run_; }
    quint64 holdsReclaimed() const { return holds_reclaimed_; }
    quint64 sweepsFailed() const { return sweeps_failed_; }

signals:
    // Shows that had at least one hold reclaimed in the last sweep
    void holdsReclaimedIn(const QStringList& show_ids);
    void sweepFailed();

private slots:
    void onTick();

private:
    ReservationStore& store_;
    ClockFn clock_;
    QTimer timer_;

    quint64 sweeps_run_ = 0;
    quint64 holds_reclaimed_ = 0;
    quint64 sweeps_failed_ = 0;
};

} // namespace seathold
