/**
 * @file vehicle_factory.cpp
 * @brief VehicleFactory类的实现
 */
#include "vehicle_factory.h"
#include "parking_error.h"
#include <algorithm>
#include <cctype>

Vehicle VehicleFactory::create(const std::string& registration,
                               const std::string& make,
                               const std::string& model,
                               const std::string& color,
                               bool isElectric,
                               bool isMotorcycle) const {
    return create(selectKind(isElectric, isMotorcycle), registration, make, model, color);
}

Vehicle VehicleFactory::create(VehicleKind kind,
                               const std::string& registration,
                               const std::string& make,
                               const std::string& model,
                               const std::string& color,
                               double charge) const {
    if (registration.empty()) {
        throw ParkingException(ParkingErrorCode::InvalidInput,
                               "Registration number must not be empty");
    }
    return Vehicle(registration, make, model, color, kind, charge);
}

VehicleKind VehicleFactory::selectKind(bool isElectric, bool isMotorcycle) {
    if (isElectric) {
        return isMotorcycle ? VehicleKind::ElectricBike : VehicleKind::ElectricCar;
    }
    return isMotorcycle ? VehicleKind::Motorcycle : VehicleKind::Car;
}

VehicleKind parseVehicleKind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const VehicleKind kinds[] = {
        VehicleKind::Car, VehicleKind::Motorcycle, VehicleKind::Truck,
        VehicleKind::Bus, VehicleKind::ElectricCar, VehicleKind::ElectricBike
    };
    for (VehicleKind kind : kinds) {
        if (vehicleKindName(kind) == lower) {
            return kind;
        }
    }
    throw ParkingException(ParkingErrorCode::InvalidInput, "Unknown vehicle kind: " + name);
}
