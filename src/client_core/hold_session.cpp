#include "seathold/client/hold_session.hpp"

#include <QtCore/QDebug>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace seathold {

HoldSession::HoldSession(ReservationStore& store, ClockFn clock, QObject* parent)
    : QObject(parent), store_(store), clock_(std::move(clock))
{
    countdown_.setInterval(1000);
    connect(&countdown_, &QTimer::timeout, this, &HoldSession::tick);
}

const char* HoldSession::toString(State s) {
    switch (s) {
        case State::Idle:      return "IDLE";
        case State::Held:      return "HELD";
        case State::Confirmed: return "CONFIRMED";
        case State::Expired:   return "EXPIRED";
    }
    return "IDLE";
}

ReservationOutcome HoldSession::hold(const std::string& show_id, const std::string& label,
                                     const std::string& customer_name) {
    if (state_ == State::Held) {
        if (!isExpired()) {
            qWarning() << "[Session] Already holding" << QString::fromStdString(draft_.seat_label);
            return ReservationOutcome::InvalidArgument;
        }
        lapse();
    }

    auto held = store_.tryHold(show_id, label, customer_name, clock_());
    if (!held.ok()) {
        qInfo() << "[Session] Hold on" << QString::fromStdString(label) << "rejected:"
                << ::toString(held.outcome);
        return held.outcome;
    }

    draft_.token = held.value->token;
    draft_.show_id = held.value->show_id;
    draft_.seat_label = held.value->seat_label;
    draft_.customer_name = customer_name;
    draft_.hold_expires_at = held.value->hold_expires_at;

    setState(State::Held);
    startCountdown();
    return ReservationOutcome::Ok;
}

ReservationOutcome HoldSession::confirm() {
    if (state_ != State::Held) {
        return ReservationOutcome::HoldNotFound;
    }
    if (isExpired()) {
        lapse();
        return ReservationOutcome::HoldExpired;
    }

    const auto outcome = store_.confirm(draft_.token, clock_());
    switch (outcome) {
        case ReservationOutcome::Ok:
            countdown_.stop();
            setState(State::Confirmed);
            qInfo() << "[Session] Seat" << QString::fromStdString(draft_.seat_label) << "booked";
            break;
        case ReservationOutcome::HoldExpired:
            lapse();
            break;
        case ReservationOutcome::StorageFailure:
            // keep the hold; the caller may retry before the deadline
            qWarning() << "[Session] Confirm failed, store unavailable";
            break;
        default:
            qInfo() << "[Session] Confirm rejected:" << ::toString(outcome);
            reset();
            break;
    }
    return outcome;
}

ReservationOutcome HoldSession::cancel() {
    if (state_ == State::Held && isExpired()) {
        lapse();
        return ReservationOutcome::HoldNotFound;
    }
    if (!canAct()) {
        return ReservationOutcome::HoldNotFound;
    }

    const auto outcome = store_.release(draft_.token);
    if (outcome == ReservationOutcome::StorageFailure) {
        qWarning() << "[Session] Release failed, store unavailable";
        return outcome;
    }
    // Ok or already gone: either way nothing is held any more
    reset();
    return outcome;
}

HoldSession::ReconcileOutcome HoldSession::reconcile() {
    if (state_ != State::Held || draft_.token.empty()) {
        return ReconcileOutcome::NothingToResume;
    }

    auto found = store_.lookupHold(draft_.token);
    if (!found.ok()) {
        qWarning() << "[Session] Cannot reconcile, store unavailable";
        return ReconcileOutcome::StoreUnavailable;
    }

    const auto& booking = *found.value;
    if (!booking || booking->status != BookingStatus::Held ||
        TimeUtils::isExpired(booking->hold_expires_at, clock_())) {
        qInfo() << "[Session] Stored hold on" << QString::fromStdString(draft_.seat_label)
                << "is no longer live, discarding";
        reset();
        return ReconcileOutcome::Discarded;
    }

    // Trust the store's copy over the cached one
    draft_.show_id = booking->show_id;
    draft_.seat_label = booking->seat_label;
    draft_.customer_name = booking->customer_name;
    draft_.hold_expires_at = booking->hold_expires_at;
    startCountdown();
    qInfo() << "[Session] Resumed hold on" << QString::fromStdString(draft_.seat_label)
            << remainingSeconds() << "s left";
    return ReconcileOutcome::Resumed;
}

int HoldSession::remainingSeconds() const {
    if (state_ != State::Held || !draft_.hold_expires_at) return 0;
    return TimeUtils::secondsUntil(*draft_.hold_expires_at, clock_());
}

bool HoldSession::isExpired() const {
    if (state_ == State::Expired) return true;
    if (!draft_.hold_expires_at) return false;
    return TimeUtils::isExpired(*draft_.hold_expires_at, clock_());
}

bool HoldSession::canAct() const {
    return state_ == State::Held && !isExpired();
}

void HoldSession::tick() {
    if (state_ != State::Held) return;

    emit countdownChanged(remainingSeconds());
    if (isExpired()) {
        lapse();
    }
}

void HoldSession::lapse() {
    countdown_.stop();
    const std::string token = draft_.token;
    setState(State::Expired);
    emit holdLapsed(QString::fromStdString(token));

    // Give the seat back now instead of waiting for the next sweep
    const auto outcome = store_.release(token);
    if (outcome == ReservationOutcome::Ok) {
        qInfo() << "[Session] Released lapsed hold on" << QString::fromStdString(draft_.seat_label);
    } else {
        qDebug() << "[Session] Lapsed hold release:" << ::toString(outcome);
    }
}

void HoldSession::reset() {
    countdown_.stop();
    draft_ = HoldDraft();
    setState(State::Idle);
}

void HoldSession::setState(State s) {
    if (state_ == s) return;
    state_ = s;
    emit stateChanged(s);
}

void HoldSession::startCountdown() {
    countdown_.start();
    emit countdownChanged(remainingSeconds());
}

bool HoldSession::saveDraft(const std::string& path) const {
    // Only a live hold is worth resuming
    if (state_ != State::Held) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            qWarning() << "[Session] Cannot remove draft" << QString::fromStdString(path)
                       << QString::fromStdString(ec.message());
            return false;
        }
        return true;
    }

    json j;
    j["token"] = draft_.token;
    j["show_id"] = draft_.show_id;
    j["seat_label"] = draft_.seat_label;
    j["customer_name"] = draft_.customer_name;
    j["status"] = toString(state_);
    j["hold_expires_at"] = draft_.hold_expires_at
        ? json(TimeUtils::toIso8601Utc(*draft_.hold_expires_at))
        : json(nullptr);

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        qWarning() << "[Session] Cannot write draft" << QString::fromStdString(path);
        return false;
    }
    ofs << j.dump(2) << std::endl;
    return static_cast<bool>(ofs);
}

bool HoldSession::loadDraft(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return false;
    }

    try {
        json j; ifs >> j;
        if (j.value("status", std::string()) != toString(State::Held)) {
            return false;
        }

        HoldDraft d;
        d.token = j.value("token", std::string());
        d.show_id = j.value("show_id", std::string());
        d.seat_label = j.value("seat_label", std::string());
        d.customer_name = j.value("customer_name", std::string());
        if (j.contains("hold_expires_at") && j["hold_expires_at"].is_string()) {
            d.hold_expires_at = TimeUtils::parseIso8601Utc(j["hold_expires_at"].get<std::string>());
        }
        if (d.token.empty()) {
            return false;
        }

        countdown_.stop();
        draft_ = d;
        // Countdown resumes only after reconcile() has asked the store
        setState(State::Held);
        return true;
    } catch (const json::exception& e) {
        qWarning() << "[Session] Corrupt draft" << QString::fromStdString(path) << e.what();
        return false;
    }
}

} // namespace seathold
