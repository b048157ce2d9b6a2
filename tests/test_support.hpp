#pragma once
// Helpers shared by the test executables

#include <chrono>
#include <filesystem>
#include <random>
#include <string>

#include "../src/db_core/ReservationStore.h"
#include "../src/db_core/TimeUtils.h"

namespace seathold_test {

// Clock the test moves by hand
class ManualClock {
public:
    explicit ManualClock(int64_t start_ms = 1700000000000LL) : now_(TimeUtils::fromEpochMs(start_ms)) {}

    TimePoint now() const { return now_; }
    void advance(std::chrono::milliseconds d) { now_ += d; }
    ClockFn fn() { return [this] { return now_; }; }

private:
    TimePoint now_;
};

// Store whose backend is always down
class FailingStore : public ReservationStore {
public:
    ReservationResult<std::string> createShow(int, const std::string&, TimePoint) override {
        return ReservationResult<std::string>::failure(ReservationOutcome::StorageFailure);
    }
    ReservationResult<std::vector<ShowInfo>> listShows() override {
        return ReservationResult<std::vector<ShowInfo>>::failure(ReservationOutcome::StorageFailure);
    }
    ReservationResult<HoldGrant> tryHold(const std::string&, const std::string&,
                                         const std::string&, TimePoint) override {
        return ReservationResult<HoldGrant>::failure(ReservationOutcome::StorageFailure);
    }
    ReservationOutcome confirm(const std::string&, TimePoint) override {
        return ReservationOutcome::StorageFailure;
    }
    ReservationOutcome release(const std::string&) override {
        return ReservationOutcome::StorageFailure;
    }
    ReservationResult<std::vector<Seat>> listSeats(const std::string&) override {
        return ReservationResult<std::vector<Seat>>::failure(ReservationOutcome::StorageFailure);
    }
    ReservationResult<std::optional<BookingTransaction>> lookupHold(const std::string&) override {
        return ReservationResult<std::optional<BookingTransaction>>::failure(ReservationOutcome::StorageFailure);
    }
    ReservationResult<std::vector<ReclaimedHold>> reclaimExpired(TimePoint) override {
        return ReservationResult<std::vector<ReclaimedHold>>::failure(ReservationOutcome::StorageFailure);
    }
    std::chrono::seconds holdDuration() const override { return std::chrono::seconds(20); }
};

// Fresh path under the system temp dir; the file itself is not created
inline std::string tempPath(const std::string& stem, const std::string& ext) {
    std::random_device rd;
    return (std::filesystem::temp_directory_path() /
            (stem + "_" + std::to_string(rd()) + ext)).string();
}

// SQLite leaves -wal / -shm beside a WAL database
inline void removeDatabaseFiles(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path + "-wal", ec);
    std::filesystem::remove(path + "-shm", ec);
}

} // namespace seathold_test
