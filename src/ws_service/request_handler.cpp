#include "seathold/service/request_handler.hpp"
#include "seathold/models.hpp"
#include "seathold/net_types.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QDebug>

namespace seathold {

RequestHandler::RequestHandler(ReservationStore& store, const ReservationConfig& config, ClockFn clock)
    : store_(store), config_(config), clock_(std::move(clock)) {}

HandlerReply RequestHandler::handle(const QJsonObject& request) {
    const auto type = request.value("type").toString();

    if (type == "create_show") return onCreateShow(request);
    if (type == "list_shows")  return onListShows();
    if (type == "list_seats")  return onListSeats(request);
    if (type == "hold")        return onHold(request);
    if (type == "confirm")     return onConfirm(request);
    if (type == "release")     return onRelease(request);
    if (type == "lookup")      return onLookup(request);

    qDebug() << "[WS] Received unknown message type:" << type;
    return {error(QString("unknown message type '%1'").arg(type)), QString()};
}

QJsonObject RequestHandler::error(const QString& message) {
    QJsonObject reply;
    reply["type"] = "error";
    reply["message"] = message;
    return reply;
}

QJsonObject RequestHandler::rejected(const QString& op, ReservationOutcome outcome) {
    QJsonObject reply;
    reply["type"] = "rejected";
    reply["op"] = op;
    reply["reason"] = QString::fromLatin1(toString(outcome));
    reply["retryable"] = isRetryable(outcome);
    return reply;
}

QJsonObject RequestHandler::seatUpdate(const QString& show_id) {
    auto seats = store_.listSeats(show_id.toStdString());
    if (!seats.ok()) {
        return rejected("list_seats", seats.outcome);
    }

    QJsonObject root;
    root["type"] = "seat_update";
    root["show_id"] = show_id;
    root["seats"] = toJson(*seats.value);
    root["timestamp"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    return root;
}

HandlerReply RequestHandler::onCreateShow(const QJsonObject& request) {
    const auto req = CreateShowRequest::fromJson(request, config_.default_seat_count);
    QString err;
    if (!req.isValid(config_.max_seats_per_show, &err)) {
        return {error(err), QString()};
    }

    auto created = store_.createShow(req.seat_count, req.name.toStdString(), clock_());
    if (!created.ok()) {
        return {rejected("create_show", created.outcome), QString()};
    }

    QJsonObject reply;
    reply["type"] = "show_created";
    reply["show_id"] = QString::fromStdString(*created.value);
    reply["seat_count"] = req.seat_count;
    return {reply, QString()};
}

HandlerReply RequestHandler::onListShows() {
    auto shows = store_.listShows();
    if (!shows.ok()) {
        return {rejected("list_shows", shows.outcome), QString()};
    }

    QJsonArray items;
    for (const auto& show : *shows.value) items.append(toJson(show));

    QJsonObject reply;
    reply["type"] = "shows";
    reply["items"] = items;
    return {reply, QString()};
}

HandlerReply RequestHandler::onListSeats(const QJsonObject& request) {
    const auto show_id = request.value("show_id").toString();
    if (show_id.isEmpty()) {
        return {error("show_id is required"), QString()};
    }

    auto seats = store_.listSeats(show_id.toStdString());
    if (!seats.ok()) {
        return {rejected("list_seats", seats.outcome), QString()};
    }

    QJsonObject reply;
    reply["type"] = "seats";
    reply["show_id"] = show_id;
    reply["seats"] = toJson(*seats.value);
    return {reply, QString()};
}

HandlerReply RequestHandler::onHold(const QJsonObject& request) {
    const auto req = HoldRequest::fromJson(request);
    QString err;
    if (!req.isValid(&err)) {
        return {error(err), QString()};
    }

    auto held = store_.tryHold(req.show_id.toStdString(), req.seat.toStdString(),
                               req.name.toStdString(), clock_());
    if (!held.ok()) {
        return {rejected("hold", held.outcome), QString()};
    }

    QJsonObject reply = toJson(*held.value);
    reply["type"] = "hold_ok";
    reply["hold_seconds"] = static_cast<int>(store_.holdDuration().count());
    return {reply, req.show_id};
}

HandlerReply RequestHandler::onConfirm(const QJsonObject& request) {
    const auto req = TokenRequest::fromJson(request);
    QString err;
    if (!req.isValid(&err)) {
        return {error(err), QString()};
    }

    // Look up first so the reply can name the seat and the pushed show
    auto before = store_.lookupHold(req.token.toStdString());
    const auto outcome = store_.confirm(req.token.toStdString(), clock_());
    if (outcome != ReservationOutcome::Ok) {
        return {rejected("confirm", outcome), QString()};
    }

    QJsonObject reply;
    reply["type"] = "confirm_ok";
    reply["token"] = req.token;
    QString show_id;
    if (before.ok() && *before.value) {
        const auto& booking = **before.value;
        show_id = QString::fromStdString(booking.show_id);
        reply["show_id"] = show_id;
        reply["seat"] = QString::fromStdString(booking.seat_label);
        reply["booked_by"] = QString::fromStdString(booking.customer_name);
    }
    return {reply, show_id};
}

HandlerReply RequestHandler::onRelease(const QJsonObject& request) {
    const auto req = TokenRequest::fromJson(request);
    QString err;
    if (!req.isValid(&err)) {
        return {error(err), QString()};
    }

    auto before = store_.lookupHold(req.token.toStdString());
    const auto outcome = store_.release(req.token.toStdString());
    if (outcome != ReservationOutcome::Ok) {
        return {rejected("release", outcome), QString()};
    }

    QJsonObject reply;
    reply["type"] = "release_ok";
    reply["token"] = req.token;
    QString show_id;
    if (before.ok() && *before.value) {
        show_id = QString::fromStdString((*before.value)->show_id);
        reply["show_id"] = show_id;
        reply["seat"] = QString::fromStdString((*before.value)->seat_label);
    }
    return {reply, show_id};
}

HandlerReply RequestHandler::onLookup(const QJsonObject& request) {
    const auto req = TokenRequest::fromJson(request);
    QString err;
    if (!req.isValid(&err)) {
        return {error(err), QString()};
    }

    auto found = store_.lookupHold(req.token.toStdString());
    if (!found.ok()) {
        return {rejected("lookup", found.outcome), QString()};
    }

    QJsonObject reply;
    reply["type"] = "hold_state";
    reply["token"] = req.token;
    reply["found"] = found.value->has_value();
    if (found.value->has_value()) {
        const auto& booking = **found.value;
        reply["booking"] = toJson(booking);
        // A HELD row past its deadline is already dead to confirm()
        reply["expired"] = booking.status == BookingStatus::Held &&
                           TimeUtils::isExpired(booking.hold_expires_at, clock_());
    }
    return {reply, QString()};
}

} // namespace seathold
