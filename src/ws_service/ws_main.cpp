#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>

#include <ws/ws_hub.hpp>
#include "seathold/Config.h"
#include "seathold/reclaim/expiry_reclaimer.hpp"
#include "seathold/service/request_handler.hpp"
#include "../db_core/DatabaseInitializer.h"
#include "../db_core/ReservationDatabase.h"

#include <exception>
#include <iostream>

int main(int argc, char* argv[]){
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("reservation_server");

    QCommandLineParser parser;
    parser.setApplicationDescription("Seat reservation WebSocket service");
    parser.addHelpOption();
    QCommandLineOption configOption({"c", "config"}, "YAML or JSON config file.", "file");
    QCommandLineOption dbOption("db", "SQLite database path (overrides config).", "path");
    QCommandLineOption portOption({"p", "port"}, "WebSocket port (overrides config).", "port");
    parser.addOption(configOption);
    parser.addOption(dbOption);
    parser.addOption(portOption);
    parser.process(app);

    seathold::ReservationConfig config;
    if (parser.isSet(configOption)) {
        config = seathold::ReservationConfig::fromFile(parser.value(configOption).toStdString());
    }
    if (parser.isSet(dbOption)) config.db_path = parser.value(dbOption).toStdString();
    if (parser.isSet(portOption)) config.ws_port = parser.value(portOption).toInt();

    const std::string problem = config.validate();
    if (!problem.empty()) {
        std::cerr << "[Config] " << problem << std::endl;
        return 2;
    }

    StoreOptions options;
    options.hold_duration = std::chrono::seconds(config.hold_duration_sec);
    options.busy_timeout_ms = config.busy_timeout_ms;
    options.max_seats_per_show = config.max_seats_per_show;

    ReservationDatabase* db = nullptr;
    try {
        db = &ReservationDatabase::getInstance(config.db_path, options);
    } catch (const std::exception& e) {
        std::cerr << "[Store] Cannot open " << config.db_path << ": " << e.what() << std::endl;
        return 1;
    }
    if (!db->initialize()) return 1;

    if (config.seed_default_show) {
        DatabaseInitializer dbInit(*db);
        if (!dbInit.initializeSampleData(config.default_seat_count)) {
            std::cerr << "[Store] Failed to seed the default show." << std::endl;
        }
    }

    seathold::RequestHandler handler(*db, config);
    WsHub hub(handler, config.broadcast_interval_ms);
    seathold::ExpiryReclaimer reclaimer(*db, config.reclaim_interval_ms);
    QObject::connect(&reclaimer, &seathold::ExpiryReclaimer::holdsReclaimedIn,
                     &hub, &WsHub::pushSeatUpdates);

    const QHostAddress host(QString::fromStdString(config.ws_host));
    if (!hub.start(static_cast<quint16>(config.ws_port), host)) return 1;

    // Clear anything that lapsed while the service was down
    reclaimer.sweepOnce();
    reclaimer.start();

    return app.exec();
}
