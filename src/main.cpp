#include "../include/admin_api.hpp"
#include "../include/auth.hpp"
#include "../include/central_authority.hpp"
#include "../include/config.hpp"
#include "../include/database.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/transport.hpp"
#include "httplib.h"
#include <csignal>
#include <iostream>
#include <pthread.h>
#include <thread>

int main(int argc, char* argv[]) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";

    CentralConfig config;
    try {
        config = loadCentralConfig(configPath);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    Logger::setLogFile(config.logFile);
    Logger::setLevel(Logger::parseLevel(config.logLevel));

    // 所有线程继承屏蔽的信号，统一由主线程 sigwait 处理
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        Database db(config.dataDir);
        CentralAuthority central(db, Tariff{config.ratePerMinute, config.minimumFee});
        central.restore(db.loadParkedVehicles());
        Auth auth(db);

        TcpLineServer lanes([&central](const std::string& line) { return central.handleRequest(line); },
                            config.connectionTimeout);
        lanes.bind(config.ip, config.port);

        httplib::Server admin;
        setupAdminRoutes(admin, central, auth, lanes);
        if (!admin.bind_to_port(config.ip.c_str(), config.adminPort)) {
            Logger::logSystem(Logger::Level::Error, "central",
                              "Failed to bind admin API on port " + std::to_string(config.adminPort));
            return 1;
        }

        std::thread laneThread([&lanes] { lanes.serve(); });
        std::thread adminThread([&admin] { admin.listen_after_bind(); });
        Logger::logSystem(Logger::Level::Info, "central",
                          "Central authority running, lanes on " + std::to_string(lanes.port()) +
                          ", admin API on " + std::to_string(config.adminPort));

        int received = 0;
        sigwait(&signals, &received);
        Logger::logSystem(Logger::Level::Info, "central", "Signal " + std::to_string(received) + " received, shutting down");

        lanes.stop();
        admin.stop();
        laneThread.join();
        adminThread.join();
    } catch (const std::exception& e) {
        Logger::logSystem(Logger::Level::Error, "central", std::string("Fatal: ") + e.what());
        return 1;
    }
    Logger::logSystem(Logger::Level::Info, "central", "Central authority stopped");
    return 0;
}
