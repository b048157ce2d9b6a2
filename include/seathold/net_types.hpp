#pragma once
// Inbound WS payloads

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace seathold {

struct HoldRequest {
    QString show_id;
    QString seat;
    QString name;      // display name of the requesting party

    bool isValid(QString* err=nullptr) const {
        if (show_id.trimmed().isEmpty()) { if (err) *err = "show_id is required"; return false; }
        if (seat.trimmed().isEmpty()) { if (err) *err = "seat is required"; return false; }
        if (name.trimmed().isEmpty()) { if (err) *err = "name is required"; return false; }
        return true;
    }

    static HoldRequest fromJson(const QJsonObject& o) {
        HoldRequest r;
        r.show_id = o.value("show_id").toString();
        r.seat    = o.value("seat").toString().trimmed();
        r.name    = o.value("name").toString().trimmed();
        return r;
    }
};

struct CreateShowRequest {
    int     seat_count = 0;
    QString name;

    bool isValid(int max_seats, QString* err=nullptr) const {
        if (seat_count <= 0 || seat_count > max_seats) {
            if (err) *err = QString("seat_count must be within 1..%1").arg(max_seats);
            return false;
        }
        return true;
    }

    static CreateShowRequest fromJson(const QJsonObject& o, int default_seat_count) {
        CreateShowRequest r;
        r.seat_count = o.value("seat_count").toInt(default_seat_count);
        r.name       = o.value("name").toString("Show");
        return r;
    }
};

// confirm / release / lookup
struct TokenRequest {
    QString token;

    bool isValid(QString* err=nullptr) const {
        if (token.trimmed().isEmpty()) { if (err) *err = "token is required"; return false; }
        return true;
    }

    static TokenRequest fromJson(const QJsonObject& o) {
        TokenRequest r;
        r.token = o.value("token").toString().trimmed();
        return r;
    }
};

} // namespace seathold
