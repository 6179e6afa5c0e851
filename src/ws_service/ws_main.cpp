#include <QCoreApplication>
#include <gatesense/ws/ws_hub.hpp>
#include "gatesense/config/ServiceConfig.h"
#include "gatesense/pipeline/GateService.h"
#include "../db_core/GateDatabase.h"

#include <filesystem>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]){
    QCoreApplication app(argc, argv);

    const std::string config_path = argc > 1 ? argv[1] : "config/gatesense.yml";
    const auto config = gatesense::ServiceConfig::fromYaml(config_path);

    std::unique_ptr<gatesense::GateDatabase> db;
    try {
        if (config.db_path != ":memory:") {
            const auto parent = std::filesystem::path(config.db_path).parent_path();
            if (!parent.empty()) std::filesystem::create_directories(parent);
        }
        db = std::make_unique<gatesense::GateDatabase>(config.db_path);
    } catch (const std::exception& e) {
        std::cerr << "[WS] Cannot open database " << config.db_path << ": " << e.what() << std::endl;
        return 1;
    }
    if (!db->initialize()) return 1;

    gatesense::GateService service(*db, config);
    service.start();
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&service] { service.stop(); });

    WsHub hub(service, config.tick_interval_ms);
    if (!hub.start(static_cast<quint16>(config.ws_port), QHostAddress(QString::fromStdString(config.ws_host)))) return 1;
    return app.exec();
}
