#include "../include/vehicle.hpp"
#include <gtest/gtest.h>

TEST(TariffTest, MinimumFeeApplies) {
    Tariff tariff;
    EXPECT_DOUBLE_EQ(tariff.feeFor(0), 2.00);
    EXPECT_DOUBLE_EQ(tariff.feeFor(10), 2.00);
}

TEST(TariffTest, PerMinuteRate) {
    Tariff tariff;
    EXPECT_DOUBLE_EQ(tariff.feeFor(20), 3.00);
    EXPECT_DOUBLE_EQ(tariff.feeFor(30), 4.50);
    EXPECT_DOUBLE_EQ(tariff.feeFor(66), 9.90);
}

TEST(TariffTest, CustomRates) {
    Tariff tariff{0.10, 5.00};
    EXPECT_DOUBLE_EQ(tariff.feeFor(30), 5.00);
    EXPECT_DOUBLE_EQ(tariff.feeFor(75), 7.50);
}

TEST(VehicleTest, CheckoutComputesDurationAndFee) {
    Vehicle v("ABC1234", "2024-01-15T10:00:00", "terreo");
    v.checkout("2024-01-15T10:30:00", Tariff{});
    EXPECT_EQ(v.status, VehicleStatus::Departed);
    EXPECT_EQ(v.exitTime, std::optional<std::string>("2024-01-15T10:30:00"));
    EXPECT_EQ(v.durationMinutes, std::optional<int>(30));
    ASSERT_TRUE(v.fee.has_value());
    EXPECT_DOUBLE_EQ(*v.fee, 4.50);
}

TEST(VehicleTest, PartialMinuteIsBilledAsFullMinute) {
    Vehicle v("ABC1234", "2024-01-15T10:00:00", "terreo");
    v.checkout("2024-01-15T11:05:30", Tariff{});
    EXPECT_EQ(v.durationMinutes, std::optional<int>(66));
    EXPECT_DOUBLE_EQ(*v.fee, 9.90);
}

TEST(VehicleTest, ExitBeforeEntryIsClamped) {
    Vehicle v("ABC1234", "2024-01-15T10:00:00", "terreo");
    v.checkout("2024-01-15T09:00:00", Tariff{});
    EXPECT_EQ(v.exitTime, std::optional<std::string>("2024-01-15T10:00:00"));
    EXPECT_EQ(v.durationMinutes, std::optional<int>(0));
    EXPECT_DOUBLE_EQ(*v.fee, 2.00);
}

TEST(VehicleTest, JsonUsesWireFieldNames) {
    Vehicle v("ABC1234", "2024-01-15T10:00:00", "piso1");
    nlohmann::json j = v;
    EXPECT_EQ(j["placa"], "ABC1234");
    EXPECT_EQ(j["andar"], "piso1");
    EXPECT_EQ(j["status"], "estacionado");
    EXPECT_TRUE(j["timestamp_saida"].is_null());

    Vehicle back = j.get<Vehicle>();
    EXPECT_EQ(back.plate, v.plate);
    EXPECT_EQ(back.status, VehicleStatus::Parked);
    EXPECT_FALSE(back.fee.has_value());
}

TEST(VehicleTest, UnknownStatusRejected) {
    nlohmann::json j = {{"placa", "ABC1234"}, {"timestamp_entrada", "2024-01-15T10:00:00"}, {"status", "gone"}};
    EXPECT_THROW(j.get<Vehicle>(), std::invalid_argument);
}
