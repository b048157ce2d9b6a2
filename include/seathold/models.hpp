#pragma once
// Wire forms of the store's records (hub replies and pushes)

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QString>
#include <vector>

#include "../../src/db_core/DataTypes.h"
#include "../../src/db_core/TimeUtils.h"

namespace seathold {

inline QString toIso(TimePoint t) {
    return QString::fromStdString(TimeUtils::toIso8601Utc(t));
}

inline QJsonValue toJsonValue(const std::optional<std::string>& s) {
    return s ? QJsonValue(QString::fromStdString(*s)) : QJsonValue(QJsonValue::Null);
}

inline QJsonValue toJsonValue(const std::optional<TimePoint>& t) {
    return t ? QJsonValue(toIso(*t)) : QJsonValue(QJsonValue::Null);
}

// The token is not published; only the holder learns it from hold_ok
inline QJsonObject toJson(const Seat& s) {
    return {
        {"show_id", QString::fromStdString(s.show_id)},
        {"seat", QString::fromStdString(s.label)},
        {"status", QString::fromLatin1(toString(s.status))},
        {"hold_expires_at", toJsonValue(s.hold_expires_at)},
        {"held_by", toJsonValue(s.held_by)},
        {"booked_by", toJsonValue(s.booked_by)},
        {"booked_at", toJsonValue(s.booked_at)}
    };
}

inline QJsonArray toJson(const std::vector<Seat>& seats) {
    QJsonArray arr;
    for (const auto& s : seats) arr.append(toJson(s));
    return arr;
}

inline QJsonObject toJson(const BookingTransaction& b) {
    return {
        {"token", QString::fromStdString(b.token)},
        {"show_id", QString::fromStdString(b.show_id)},
        {"seat", QString::fromStdString(b.seat_label)},
        {"customer_name", QString::fromStdString(b.customer_name)},
        {"status", QString::fromLatin1(toString(b.status))},
        {"hold_expires_at", toIso(b.hold_expires_at)},
        {"confirmed_at", toJsonValue(b.confirmed_at)},
        {"created_at", toIso(b.created_at)}
    };
}

inline QJsonObject toJson(const ShowInfo& show) {
    return {
        {"show_id", QString::fromStdString(show.show_id)},
        {"name", QString::fromStdString(show.name)},
        {"seat_count", show.seat_count},
        {"created_at", toIso(show.created_at)}
    };
}

inline QJsonObject toJson(const HoldGrant& g) {
    return {
        {"token", QString::fromStdString(g.token)},
        {"show_id", QString::fromStdString(g.show_id)},
        {"seat", QString::fromStdString(g.seat_label)},
        {"hold_expires_at", toIso(g.hold_expires_at)}
    };
}

} // namespace seathold
