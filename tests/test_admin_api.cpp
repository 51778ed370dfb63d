#include "../include/admin_api.hpp"
#include "../include/auth.hpp"
#include "../include/central_authority.hpp"
#include "../include/database.hpp"
#include "../include/transport.hpp"
#include "../include/utils.hpp"
#include "test_helpers.hpp"
#include "httplib.h"
#include <gtest/gtest.h>
#include <thread>

class AdminApiTest : public ::testing::Test {
protected:
    AdminApiTest()
        : db(tmp.path()),
          central(db, Tariff{}),
          auth(db),
          lanes([](const std::string& line) { return line; }) {}

    void SetUp() override {
        json users = json::array({
            {{"username", "boss"}, {"auth", utils::sha256("secret")}, {"role", "admin"}},
            {{"username", "desk"}, {"auth", utils::sha256("desk123")}, {"role", "operator"}},
            {{"username", "robot"}, {"auth", "plainkey"}, {"role", "bot"}}
        });
        ASSERT_TRUE(db.saveUsers(users));

        setupAdminRoutes(svr, central, auth, lanes);
        port = svr.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        serverThread = std::thread([this] { svr.listen_after_bind(); });
        while (!svr.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void TearDown() override {
        svr.stop();
        if (serverThread.joinable()) serverThread.join();
    }

    std::string login(const std::string& user, const std::string& pass) {
        httplib::Client cli("127.0.0.1", port);
        auto res = cli.Post("/api/auth/login", json{{"username", user}, {"password", pass}}.dump(),
                            "application/json");
        if (!res || res->status != 200) return "";
        return json::parse(res->body).value("token", std::string());
    }

    httplib::Result postGarage(const std::string& token, const json& body) {
        httplib::Client cli("127.0.0.1", port);
        return cli.Post("/api/admin/garage", httplib::Headers{{"Authorization", token}}, body.dump(),
                        "application/json");
    }

    TempDir tmp;
    Database db;
    CentralAuthority central;
    Auth auth;
    TcpLineServer lanes;
    httplib::Server svr;
    std::thread serverThread;
    int port = 0;
};

TEST_F(AdminApiTest, Alive) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/api/alive");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["status"], "ok");
}

TEST_F(AdminApiTest, LoginChecksPasswordHash) {
    EXPECT_FALSE(login("boss", "secret").empty());
    EXPECT_TRUE(login("boss", "wrong").empty());
    EXPECT_TRUE(login("nobody", "secret").empty());
    EXPECT_TRUE(login("robot", "plainkey").empty());
}

TEST_F(AdminApiTest, LoginRejectsBadBody) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/api/auth/login", "not json", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(AdminApiTest, StatsRequireToken) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/api/stats");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 401);

    std::string token = login("desk", "desk123");
    res = cli.Get("/api/stats", httplib::Headers{{"Authorization", token}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json body = json::parse(res->body);
    EXPECT_EQ(body["parked_vehicles"], 0);
    EXPECT_EQ(body["flags"]["garage_closed"], false);
    EXPECT_EQ(body["active_connections"], 0);
}

TEST_F(AdminApiTest, VehiclesInside) {
    central.processEvent(makeEvent("ABC1234", EventKind::Entry, "2024-01-15T10:00:00"));
    std::string token = login("desk", "desk123");
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/api/vehicles_inside", httplib::Headers{{"Authorization", token}});
    ASSERT_TRUE(res);
    json body = json::parse(res->body);
    ASSERT_EQ(body["plates"].size(), 1u);
    EXPECT_EQ(body["plates"][0], "ABC1234");
}

TEST_F(AdminApiTest, OperatorCannotChangeFlags) {
    std::string token = login("desk", "desk123");
    auto res = postGarage(token, {{"action", "close"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
    EXPECT_FALSE(central.flags().garageClosed);
}

TEST_F(AdminApiTest, AdminTogglesFlags) {
    std::string token = login("boss", "secret");

    auto res = postGarage(token, {{"action", "close"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(central.flags().garageClosed);

    postGarage(token, {{"action", "open"}});
    EXPECT_FALSE(central.flags().garageClosed);

    res = postGarage(token, {{"action", "block_floor"}, {"floor", "piso1"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(json::parse(res->body)["flags"]["blocked_floor"], "piso1");
    EXPECT_EQ(central.flags().blockedFloor, std::optional<std::string>("piso1"));

    postGarage(token, {{"action", "unblock_floor"}});
    EXPECT_FALSE(central.flags().blockedFloor.has_value());
}

TEST_F(AdminApiTest, AdminRejectsInvalidActions) {
    std::string token = login("boss", "secret");
    auto res = postGarage(token, {{"action", "demolish"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = postGarage(token, {{"action", "block_floor"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_FALSE(central.flags().blockedFloor.has_value());
}

TEST_F(AdminApiTest, LogoutInvalidatesToken) {
    std::string token = login("boss", "secret");
    EXPECT_EQ(auth.activeSessions(), 1u);

    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/api/auth/logout", json{{"token", token}}.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(auth.activeSessions(), 0u);

    res = postGarage(token, {{"action", "close"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 401);
}
