/**
 * @file parking_slot.cpp
 * @brief ParkingSlot类的实现
 */
#include "parking_slot.h"
#include <utility>

bool ParkingSlot::occupy(Vehicle v) {
    if (vehicle) {
        return false;
    }
    vehicle = std::move(v);
    return true;
}

std::optional<Vehicle> ParkingSlot::vacate() {
    std::optional<Vehicle> removed;
    removed.swap(vehicle);  // 交换后车位为空
    return removed;
}

bool ParkingSlot::setCharge(double level) {
    if (!vehicle) {
        return false;
    }
    vehicle->setCharge(level);
    return true;
}
