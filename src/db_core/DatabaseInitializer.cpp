#include "DatabaseInitializer.h"
#include "TimeUtils.h"
#include <iostream>
#include <vector>

DatabaseInitializer::DatabaseInitializer(ReservationDatabase& db) : database_(db) {}

bool DatabaseInitializer::initializeSampleData(int seat_count, const std::string& show_name) {
    auto shows = database_.listShows();
    if (!shows.ok()) {
        std::cerr << "[Store] Sample data initialization failed: cannot list shows" << std::endl;
        return false;
    }

    // Newest show first
    if (!shows.value->empty()) {
        default_show_id_ = shows.value->front().show_id;
        std::cout << "[Store] Using existing show " << default_show_id_ << std::endl;
        return true;
    }

    auto created = database_.createShow(seat_count, show_name, TimeUtils::now());
    if (!created.ok()) {
        std::cerr << "[Store] Sample data initialization failed: "
                  << toString(created.outcome) << std::endl;
        return false;
    }

    default_show_id_ = *created.value;
    std::cout << "[Store] Sample data initialized successfully." << std::endl;
    return true;
}

bool DatabaseInitializer::clearExistingData() {
    default_show_id_.clear();
    return database_.clearAll();
}
