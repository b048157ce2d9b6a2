#include "seathold/reclaim/expiry_reclaimer.hpp"

#include <QtCore/QDebug>
#include <QtCore/QSet>

namespace seathold {

ExpiryReclaimer::ExpiryReclaimer(ReservationStore& store, int interval_ms, ClockFn clock, QObject* parent)
    : QObject(parent), store_(store), clock_(std::move(clock))
{
    timer_.setInterval(interval_ms);
    connect(&timer_, &QTimer::timeout, this, &ExpiryReclaimer::onTick);
}

void ExpiryReclaimer::start() {
    if (timer_.isActive()) return;
    timer_.start();
    qInfo() << "[Reclaim] Sweeping every" << timer_.interval() << "ms";
}

void ExpiryReclaimer::stop() {
    timer_.stop();
}

ReservationResult<std::vector<ReclaimedHold>> ExpiryReclaimer::sweepOnce() {
    ++sweeps_run_;
    auto result = store_.reclaimExpired(clock_());
    if (!result.ok()) {
        // a missed sweep only delays reclaiming; confirm() still checks the deadline
        ++sweeps_failed_;
        qWarning() << "[Reclaim] Sweep failed:" << toString(result.outcome);
        emit sweepFailed();
        return result;
    }

    const auto& reclaimed = *result.value;
    if (reclaimed.empty()) return result;

    holds_reclaimed_ += reclaimed.size();
    QSet<QString> shows;
    for (const auto& hold : reclaimed) {
        qInfo() << "[Reclaim] Seat" << QString::fromStdString(hold.seat_label)
                << "returned to AVAILABLE";
        shows.insert(QString::fromStdString(hold.show_id));
    }
    emit holdsReclaimedIn(shows.values());
    return result;
}

void ExpiryReclaimer::onTick() {
    sweepOnce();
}

} // namespace seathold
