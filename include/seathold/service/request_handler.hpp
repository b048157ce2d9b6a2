#pragma once
// JSON request -> store call -> JSON reply, shared by the WS hub and tests

#include <QtCore/QJsonObject>
#include <QtCore/QString>

#include "seathold/Config.h"
#include "../../../src/db_core/ReservationStore.h"
#include "../../../src/db_core/TimeUtils.h"

namespace seathold {

struct HandlerReply {
    QJsonObject body;
    QString     changed_show;   // show whose seats changed, empty if none
};

class RequestHandler {
public:
    RequestHandler(ReservationStore& store, const ReservationConfig& config,
                   ClockFn clock = &TimeUtils::now);

    HandlerReply handle(const QJsonObject& request);

    // {"type":"seat_update","show_id":..,"seats":[..]}
    QJsonObject seatUpdate(const QString& show_id);

    static QJsonObject error(const QString& message);
    static QJsonObject rejected(const QString& op, ReservationOutcome outcome);

private:
    HandlerReply onCreateShow(const QJsonObject& request);
    HandlerReply onListShows();
    HandlerReply onListSeats(const QJsonObject& request);
    HandlerReply onHold(const QJsonObject& request);
    HandlerReply onConfirm(const QJsonObject& request);
    HandlerReply onRelease(const QJsonObject& request);
    HandlerReply onLookup(const QJsonObject& request);

    ReservationStore& store_;
    ReservationConfig config_;
    ClockFn clock_;
};

} // namespace seathold
