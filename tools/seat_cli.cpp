#include "seathold/Config.h"
#include "../src/db_core/ReservationDatabase.h"
#include "../src/db_core/TimeUtils.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout <<
        "usage: seat_cli [--config FILE] [--db PATH] <command> [args]\n"
        "  create-show N [NAME]    provision a show with seats A1..AN\n"
        "  shows                   list shows, newest first\n"
        "  seats SHOW              list seats of a show\n"
        "  hold SHOW LABEL NAME    hold a seat, prints the token\n"
        "  confirm TOKEN           book a held seat\n"
        "  release TOKEN           cancel a hold\n"
        "  lookup TOKEN            show a booking transaction\n"
        "  sweep                   reclaim expired holds once\n"
        "  check                   audit seat/transaction consistency\n";
}

std::string orDash(const std::optional<std::string>& s) {
    return s ? *s : std::string("-");
}

int exitCodeFor(ReservationOutcome outcome) {
    if (outcome == ReservationOutcome::Ok) return 0;
    std::cerr << "[CLI] " << toString(outcome) << std::endl;
    return isRetryable(outcome) ? 75 : 1;
}

bool parseCount(const std::string& text, int& out) {
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return false;
    if (errno == ERANGE || value < INT_MIN || value > INT_MAX) return false;
    out = static_cast<int>(value);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    seathold::ReservationConfig config;
    std::string db_override;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config = seathold::ReservationConfig::fromFile(args[++i]);
        } else if (args[i] == "--db" && i + 1 < args.size()) {
            db_override = args[++i];
        } else if (args[i] == "-h" || args[i] == "--help") {
            printUsage();
            return 0;
        } else {
            break;
        }
    }
    if (!db_override.empty()) config.db_path = db_override;
    if (i >= args.size()) {
        printUsage();
        return 2;
    }

    const std::string command = args[i];
    const std::vector<std::string> rest(args.begin() + static_cast<long>(i) + 1, args.end());

    StoreOptions options;
    options.hold_duration = std::chrono::seconds(config.hold_duration_sec);
    options.busy_timeout_ms = config.busy_timeout_ms;
    options.max_seats_per_show = config.max_seats_per_show;

    ReservationDatabase* db = nullptr;
    try {
        db = &ReservationDatabase::getInstance(config.db_path, options);
    } catch (const std::exception& e) {
        std::cerr << "[CLI] Cannot open " << config.db_path << ": " << e.what() << std::endl;
        return 1;
    }
    if (!db->initialize()) return 1;

    const TimePoint now = TimeUtils::now();

    if (command == "create-show" && !rest.empty()) {
        int count = 0;
        if (!parseCount(rest[0], count)) {
            std::cerr << "[CLI] Seat count must be a number within int range: " << rest[0] << std::endl;
            return 2;
        }
        auto created = db->createShow(count, rest.size() > 1 ? rest[1] : "Show", now);
        if (!created.ok()) return exitCodeFor(created.outcome);
        std::cout << *created.value << std::endl;
        return 0;
    }

    if (command == "shows") {
        auto shows = db->listShows();
        if (!shows.ok()) return exitCodeFor(shows.outcome);
        for (const auto& show : *shows.value) {
            std::cout << show.show_id << "  " << std::setw(4) << show.seat_count << "  "
                      << TimeUtils::toIso8601Utc(show.created_at) << "  " << show.name << std::endl;
        }
        return 0;
    }

    if (command == "seats" && rest.size() == 1) {
        auto seats = db->listSeats(rest[0]);
        if (!seats.ok()) return exitCodeFor(seats.outcome);
        for (const auto& seat : *seats.value) {
            std::cout << std::left << std::setw(6) << seat.label << std::setw(10) << toString(seat.status);
            if (seat.status == SeatStatus::Held) {
                std::cout << orDash(seat.held_by) << " until "
                          << TimeUtils::toIso8601Utc(*seat.hold_expires_at);
            } else if (seat.status == SeatStatus::Booked) {
                std::cout << orDash(seat.booked_by) << " at "
                          << TimeUtils::toIso8601Utc(*seat.booked_at);
            }
            std::cout << std::endl;
        }
        return 0;
    }

    if (command == "hold" && rest.size() == 3) {
        auto held = db->tryHold(rest[0], rest[1], rest[2], now);
        if (!held.ok()) return exitCodeFor(held.outcome);
        std::cout << held.value->token << "  " << held.value->seat_label << "  expires "
                  << TimeUtils::toIso8601Utc(held.value->hold_expires_at) << std::endl;
        return 0;
    }

    if (command == "confirm" && rest.size() == 1) {
        return exitCodeFor(db->confirm(rest[0], now));
    }

    if (command == "release" && rest.size() == 1) {
        return exitCodeFor(db->release(rest[0]));
    }

    if (command == "lookup" && rest.size() == 1) {
        auto found = db->lookupHold(rest[0]);
        if (!found.ok()) return exitCodeFor(found.outcome);
        if (!*found.value) return exitCodeFor(ReservationOutcome::HoldNotFound);
        const auto& booking = **found.value;
        std::cout << booking.token << "  " << booking.seat_label << "  " << toString(booking.status)
                  << "  " << booking.customer_name << "  hold until "
                  << TimeUtils::toIso8601Utc(booking.hold_expires_at) << std::endl;
        return 0;
    }

    if (command == "sweep") {
        auto reclaimed = db->reclaimExpired(now);
        if (!reclaimed.ok()) return exitCodeFor(reclaimed.outcome);
        std::cout << "reclaimed " << reclaimed.value->size() << " hold(s)" << std::endl;
        return 0;
    }

    if (command == "check") {
        auto problems = db->verifyConsistency();
        if (!problems.ok()) return exitCodeFor(problems.outcome);
        for (const auto& p : *problems.value) std::cout << p << std::endl;
        return problems.value->empty() ? 0 : 3;
    }

    printUsage();
    return 2;
}
