#ifndef DATABASE_INITIALIZER_H
#define DATABASE_INITIALIZER_H

#include "ReservationDatabase.h"
#include "TimeUtils.h"
#include <string>

class DatabaseInitializer {
public:
    DatabaseInitializer(ReservationDatabase& db);

    // Create the default show when the database holds none
    bool initializeSampleData(int seat_count, const std::string& show_name = "Show");

    // Clear existing data
    bool clearExistingData();

    // Id of the show created or found by initializeSampleData
    const std::string& defaultShowId() const { return default_show_id_; }

private:
    ReservationDatabase& database_;
    std::string default_show_id_;
};

#endif // DATABASE_INITIALIZER_H
