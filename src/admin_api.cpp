#include "../include/admin_api.hpp"
#include "../include/auth.hpp"
#include "../include/central_authority.hpp"
#include "../include/logger.hpp"
#include "../include/transport.hpp"
#include "../include/utils.hpp"
#include "httplib.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void sendError(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", message}}.dump(), "application/json");
}

// 校验 Authorization 头中的令牌，失败时已写好 401 答复
bool authorize(Auth& auth, const httplib::Request& req, httplib::Response& res, std::string& role,
               std::string& username) {
    std::string token = req.get_header_value("Authorization");
    if (!auth.validateToken(token, role, username)) {
        sendError(res, 401, "Unauthorized");
        return false;
    }
    return true;
}

json flagsToJson(const AdminFlags& flags) {
    json j = {{"garage_closed", flags.garageClosed}, {"blocked_floor", nullptr}};
    if (flags.blockedFloor) j["blocked_floor"] = *flags.blockedFloor;
    return j;
}

}

void setupAdminRoutes(httplib::Server& svr, CentralAuthority& central, Auth& auth, const TcpLineServer& lanes) {
    // 状态检测
    svr.Get("/api/alive", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status": "ok"})", "application/json");
    });

    // 用户登录
    svr.Post("/api/auth/login", [&auth](const httplib::Request& req, httplib::Response& res) {
        try {
            auto body = json::parse(req.body);
            std::string user = body.at("username");
            std::string pass = body.at("password");

            std::string token, role;
            if (auth.loginUser(user, pass, token, role)) {
                res.set_content(json{{"token", token}, {"role", role}}.dump(), "application/json");
                Logger::logAdmin(user, "login", "Login success");
            } else {
                Logger::logAdmin(user, "login", "Invalid credentials");
                sendError(res, 401, "Invalid credentials");
            }
        } catch (const json::exception&) {
            sendError(res, 400, "Bad request");
        }
    });

    // 退出登入
    svr.Post("/api/auth/logout", [&auth](const httplib::Request& req, httplib::Response& res) {
        try {
            auto body = json::parse(req.body);
            std::string token = body.at("token");
            auth.removeToken(token);
            res.set_content(json{{"result", "Logged out successfully"}}.dump(), "application/json");
        } catch (const json::exception&) {
            sendError(res, 400, "Bad request");
        }
    });

    // 当日统计与运行状态
    svr.Get("/api/stats", [&central, &auth, &lanes](const httplib::Request& req, httplib::Response& res) {
        std::string role, username;
        if (!authorize(auth, req, res, role, username)) return;

        std::string today = utils::dateOf(utils::getCurrentTimeISO());
        AuthorityStats stats = central.stats(today);
        json response = {
            {"date", today},
            {"parked_vehicles", stats.parkedVehicles},
            {"flags", flagsToJson(stats.flags)},
            {"entries", stats.today.entries},
            {"exits", stats.today.exits},
            {"revenue", stats.today.revenue},
            {"active_connections", lanes.activeConnections()}
        };
        res.set_content(response.dump(), "application/json");
    });

    // 在场车辆
    svr.Get("/api/vehicles_inside", [&central, &auth](const httplib::Request& req, httplib::Response& res) {
        std::string role, username;
        if (!authorize(auth, req, res, role, username)) return;

        json plates = json::array();
        json vehicles = json::array();
        for (const auto& vehicle : central.parkedVehicles()) {
            plates.push_back(vehicle.plate);
            vehicles.push_back(vehicle);
        }
        res.set_content(json{{"plates", plates}, {"vehicles", vehicles}}.dump(), "application/json");
    });

    // 管理员开关
    svr.Post("/api/admin/garage", [&central, &auth](const httplib::Request& req, httplib::Response& res) {
        std::string role, username;
        if (!authorize(auth, req, res, role, username)) return;
        if (role != "admin") {
            sendError(res, 403, "Forbidden: Admin access required");
            return;
        }

        try {
            auto body = json::parse(req.body);
            std::string action = body.at("action");

            if (action == "close") {
                central.closeGarage();
            } else if (action == "open") {
                central.openGarage();
            } else if (action == "block_floor") {
                std::string floor = body.value("floor", std::string());
                if (floor.empty()) {
                    sendError(res, 400, "floor is required");
                    return;
                }
                central.blockFloor(floor);
            } else if (action == "unblock_floor") {
                central.unblockFloor();
            } else {
                sendError(res, 400, "Invalid action");
                return;
            }

            Logger::logAdmin(username, action, body.value("floor", std::string()));
            res.set_content(json{{"result", "success"}, {"flags", flagsToJson(central.flags())}}.dump(),
                            "application/json");
        } catch (const json::exception&) {
            sendError(res, 400, "Bad request");
        }
    });
}
