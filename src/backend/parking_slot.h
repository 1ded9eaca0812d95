/**
 * @file parking_slot.h
 * @brief 单个车位
 */
#pragma once
#include "vehicle.h"
#include <optional>

/**
 * @class ParkingSlot
 * @brief 一个可寻址的车位，普通车位或充电车位
 *
 * 车位最多容纳一辆车，且独占该车辆；
 * 当且仅当持有车辆时车位为占用状态
 */
class ParkingSlot {
private:
    int slotId;                      // 车位编号，从1开始
    bool electric;                   // 是否充电车位
    std::optional<Vehicle> vehicle;  // 停放的车辆

public:
    ParkingSlot(int id, bool isElectric) : slotId(id), electric(isElectric) {}

    int getId() const { return slotId; }
    bool isElectric() const { return electric; }
    bool isOccupied() const { return vehicle.has_value(); }

    /**
     * @brief 获取停放的车辆
     * @return 空车位返回 std::nullopt
     */
    const std::optional<Vehicle>& getVehicle() const { return vehicle; }

    /**
     * @brief 停入车辆
     * @param v 车辆
     * @return 车位已被占用时返回false，车位状态不变
     */
    bool occupy(Vehicle v);

    /**
     * @brief 清空车位
     * @return 被移走的车辆，空车位返回 std::nullopt
     */
    std::optional<Vehicle> vacate();

    /**
     * @brief 更新所停车辆的电量
     * @return 空车位返回false
     */
    bool setCharge(double level);
};
