#include "../include/database.hpp"
#include "../include/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <fstream>

class DatabaseTest : public ::testing::Test {
protected:
    TempDir tmp;
};

TEST_F(DatabaseTest, EventIdsAreSequential) {
    Database db(tmp.path());
    EXPECT_EQ(db.saveEvent(makeEvent("ABC1234", EventKind::Entry, "2024-01-15T10:00:00")), "1");
    EXPECT_EQ(db.saveEvent(makeEvent("DEF5678", EventKind::Entry, "2024-01-15T10:01:00")), "2");

    auto events = db.getEvents();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].plate, "DEF5678");
    EXPECT_EQ(events[1].id, std::optional<std::string>("2"));
}

TEST_F(DatabaseTest, EventIdsContinueAfterReopen) {
    {
        Database db(tmp.path());
        db.saveEvent(makeEvent("ABC1234", EventKind::Entry, "2024-01-15T10:00:00"));
        db.saveEvent(makeEvent("ABC1234", EventKind::Exit, "2024-01-15T10:30:00"));
    }
    Database reopened(tmp.path());
    EXPECT_EQ(reopened.saveEvent(makeEvent("DEF5678", EventKind::Entry, "2024-01-15T11:00:00")), "3");
}

TEST_F(DatabaseTest, CorruptedEventLinesAreSkipped) {
    {
        std::ofstream file(tmp.file("events.jsonl"));
        file << "{broken\n";
    }
    Database db(tmp.path());
    EXPECT_EQ(db.saveEvent(makeEvent("ABC1234", EventKind::Entry, "2024-01-15T10:00:00")), "1");
    EXPECT_EQ(db.getEvents().size(), 1u);
}

TEST_F(DatabaseTest, VehicleSaveAndUpdate) {
    Database db(tmp.path());
    Vehicle v("ABC1234", "2024-01-15T10:00:00", "terreo");
    db.saveVehicle(v);
    ASSERT_EQ(db.loadParkedVehicles().size(), 1u);

    v.checkout("2024-01-15T10:30:00", Tariff{});
    db.updateVehicle(v);
    EXPECT_TRUE(db.loadParkedVehicles().empty());

    json vehicles = db.getVehicles();
    ASSERT_EQ(vehicles.size(), 1u);
    EXPECT_EQ(vehicles[0]["status"], "saiu");
    EXPECT_DOUBLE_EQ(vehicles[0]["valor_calculado"].get<double>(), 4.50);
}

TEST_F(DatabaseTest, UpdateMatchesPlateAndEntryTime) {
    Database db(tmp.path());
    Vehicle first("ABC1234", "2024-01-15T08:00:00", "terreo");
    first.checkout("2024-01-15T09:00:00", Tariff{});
    db.saveVehicle(first);
    Vehicle second("ABC1234", "2024-01-15T10:00:00", "terreo");
    db.saveVehicle(second);

    second.checkout("2024-01-15T10:30:00", Tariff{});
    db.updateVehicle(second);

    json vehicles = db.getVehicles();
    EXPECT_EQ(vehicles[0]["tempo_permanencia_minutos"], 60);
    EXPECT_EQ(vehicles[1]["tempo_permanencia_minutos"], 30);
}

TEST_F(DatabaseTest, UpdateWithoutRecordThrows) {
    Database db(tmp.path());
    Vehicle v("ABC1234", "2024-01-15T10:00:00", "terreo");
    EXPECT_THROW(db.updateVehicle(v), PersistenceError);
}

TEST_F(DatabaseTest, DailyStatsCountCompletedEventsOfThatDay) {
    Database db(tmp.path());
    Event entry = makeEvent("ABC1234", EventKind::Entry, "2024-01-15T10:00:00");
    entry.status = EventStatus::Completed;
    db.saveEvent(entry);

    Event exit = makeEvent("ABC1234", EventKind::Exit, "2024-01-15T10:30:00");
    exit.status = EventStatus::Completed;
    exit.fee = 4.50;
    exit.durationMinutes = 30;
    db.saveEvent(exit);

    Event denied = makeEvent("DEF5678", EventKind::Exit, "2024-01-15T11:00:00");
    denied.status = EventStatus::Error;
    denied.errorDescription = "Vehicle not parked";
    db.saveEvent(denied);

    Event otherDay = makeEvent("GHI9012", EventKind::Entry, "2024-01-16T09:00:00");
    otherDay.status = EventStatus::Completed;
    db.saveEvent(otherDay);

    DailyStats stats = db.queryDailyStats("2024-01-15");
    EXPECT_EQ(stats.entries, 1);
    EXPECT_EQ(stats.exits, 1);
    EXPECT_DOUBLE_EQ(stats.revenue, 4.50);
    EXPECT_EQ(db.queryDailyStats("2024-01-17").entries, 0);
}

TEST_F(DatabaseTest, UsersFile) {
    Database db(tmp.path());
    EXPECT_TRUE(db.getUsers().empty());
    json users = json::array({{{"username", "admin"}, {"auth", "x"}, {"role", "admin"}}});
    EXPECT_TRUE(db.saveUsers(users));
    EXPECT_EQ(db.getUsers()[0]["username"], "admin");
}

TEST_F(DatabaseTest, NonArrayVehicleFileRaisesPersistenceError) {
    {
        std::ofstream file(tmp.file("vehicles.json"));
        file << "{}";
    }
    Database db(tmp.path());
    Vehicle v("ABC1234", "2024-01-15T10:00:00", "terreo");
    EXPECT_THROW(db.saveVehicle(v), PersistenceError);
    EXPECT_THROW(db.updateVehicle(v), PersistenceError);
    EXPECT_TRUE(db.loadParkedVehicles().empty());
}

TEST_F(DatabaseTest, NonObjectVehicleRecordsAreSkipped) {
    {
        std::ofstream file(tmp.file("vehicles.json"));
        file << "[5, \"text\"]";
    }
    Database db(tmp.path());
    Vehicle v("ABC1234", "2024-01-15T10:00:00", "terreo");
    db.saveVehicle(v);
    v.checkout("2024-01-15T10:30:00", Tariff{});
    EXPECT_NO_THROW(db.updateVehicle(v));
    EXPECT_TRUE(db.loadParkedVehicles().empty());
    EXPECT_EQ(db.getVehicles().size(), 3u);
}
