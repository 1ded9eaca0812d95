/**
 * @file vehicle.cpp
 * @brief Vehicle类的实现文件
 */
#include "vehicle.h"
#include <algorithm>

namespace {

double clampCharge(double level) {
    return std::clamp(level, 0.0, 100.0);
}

}  // namespace

std::string vehicleKindName(VehicleKind kind) {
    switch (kind) {
        case VehicleKind::Car: return "car";
        case VehicleKind::Motorcycle: return "motorcycle";
        case VehicleKind::Truck: return "truck";
        case VehicleKind::Bus: return "bus";
        case VehicleKind::ElectricCar: return "electric_car";
        case VehicleKind::ElectricBike: return "electric_bike";
        default: return "unknown";
    }
}

bool isElectricKind(VehicleKind kind) {
    return kind == VehicleKind::ElectricCar || kind == VehicleKind::ElectricBike;
}

Vehicle::Vehicle(const std::string& reg,
                 const std::string& vMake,
                 const std::string& vModel,
                 const std::string& vColor,
                 VehicleKind vKind,
                 double chargeLevel)
    : registration(reg)
    , make(vMake)
    , model(vModel)
    , color(vColor)
    , kind(vKind)
    , charge(isElectricKind(vKind) ? clampCharge(chargeLevel) : 0.0)
    , entryTime(std::time(nullptr))  // 当前系统时间作为入场时间
{
}

bool Vehicle::isElectric() const {
    return isElectricKind(kind);
}

bool Vehicle::isMotorcycle() const {
    return kind == VehicleKind::Motorcycle || kind == VehicleKind::ElectricBike;
}

void Vehicle::setCharge(double level) {
    // 非电动车没有电量
    if (!isElectric()) {
        return;
    }
    charge = clampCharge(level);
}

void Vehicle::setEntryTime(time_t time) {
    entryTime = time;
}

bool Vehicle::operator==(const Vehicle& other) const {
    return registration == other.registration
        && make == other.make
        && model == other.model
        && color == other.color
        && kind == other.kind
        && charge == other.charge
        && entryTime == other.entryTime;
}
