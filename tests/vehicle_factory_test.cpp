/**
 * @file vehicle_factory_test.cpp
 * @brief VehicleFactory的单元测试
 */
#include "vehicle_factory.h"
#include "parking_error.h"
#include <gtest/gtest.h>
#include <functional>

namespace {

void expectError(ParkingErrorCode code, const std::function<void()>& action) {
    try {
        action();
        FAIL() << "expected " << parkingErrorName(code);
    } catch (const ParkingException& e) {
        EXPECT_EQ(e.code(), code) << e.what();
    }
}

}  // namespace

TEST(VehicleFactoryTest, SelectsKindFromFlags) {
    VehicleFactory factory;

    for (bool electric : {false, true}) {
        for (bool motorcycle : {false, true}) {
            Vehicle vehicle = factory.create("R1", "Make", "Model", "Grey", electric, motorcycle);
            EXPECT_EQ(vehicle.isElectric(), electric);
            EXPECT_EQ(vehicle.isMotorcycle(), motorcycle);
        }
    }

    EXPECT_EQ(factory.create("R", "", "", "", true, true).getKind(), VehicleKind::ElectricBike);
    EXPECT_EQ(factory.create("R", "", "", "", true, false).getKind(), VehicleKind::ElectricCar);
    EXPECT_EQ(factory.create("R", "", "", "", false, true).getKind(), VehicleKind::Motorcycle);
    EXPECT_EQ(factory.create("R", "", "", "", false, false).getKind(), VehicleKind::Car);
}

TEST(VehicleFactoryTest, ElectricStartsFullyCharged) {
    VehicleFactory factory;
    Vehicle vehicle = factory.create("EV1", "Tesla", "Model Y", "Red", true, false);
    EXPECT_DOUBLE_EQ(vehicle.getCharge(), VehicleFactory::DEFAULT_CHARGE);
}

TEST(VehicleFactoryTest, CreatesExplicitKinds) {
    VehicleFactory factory;

    Vehicle truck = factory.create(VehicleKind::Truck, "T1", "MAN", "TGX", "White");
    EXPECT_EQ(truck.getKind(), VehicleKind::Truck);
    EXPECT_FALSE(truck.isElectric());

    Vehicle bike = factory.create(VehicleKind::ElectricBike, "E1", "Niu", "NQi", "Black", 42.0);
    EXPECT_DOUBLE_EQ(bike.getCharge(), 42.0);
}

TEST(VehicleFactoryTest, RejectsEmptyRegistration) {
    VehicleFactory factory;
    expectError(ParkingErrorCode::InvalidInput,
                [&] { factory.create("", "Ford", "Focus", "Blue", false, false); });
    expectError(ParkingErrorCode::InvalidInput,
                [&] { factory.create(VehicleKind::Bus, "", "Volvo", "7900", "Yellow"); });
}

TEST(VehicleFactoryTest, ParsesKindNames) {
    EXPECT_EQ(parseVehicleKind("truck"), VehicleKind::Truck);
    EXPECT_EQ(parseVehicleKind("Electric_Car"), VehicleKind::ElectricCar);
    EXPECT_EQ(parseVehicleKind("BUS"), VehicleKind::Bus);
    expectError(ParkingErrorCode::InvalidInput, [] { parseVehicleKind("tram"); });
}
