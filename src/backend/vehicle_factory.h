/**
 * @file vehicle_factory.h
 * @brief 车辆工厂：创建车辆的唯一入口
 */
#pragma once
#include "vehicle.h"
#include <string>

/**
 * @class VehicleFactory
 * @brief 根据判别参数选择具体的车辆种类并构造车辆
 *
 * 新增车辆种类时只需修改 VehicleKind 和本类
 */
class VehicleFactory {
public:
    // 电动车未指定电量时的初始电量
    static constexpr double DEFAULT_CHARGE = 100.0;

    /**
     * @brief 根据两个布尔判别量创建车辆
     * @param registration 车牌号，不能为空
     * @param make 品牌
     * @param model 型号
     * @param color 颜色
     * @param isElectric 是否电动
     * @param isMotorcycle 是否两轮车
     * @return 构造好的车辆
     * @throws ParkingException(InvalidInput) 车牌号为空
     *
     * 对应关系：
     * - 电动 + 两轮 → ElectricBike
     * - 电动 + 非两轮 → ElectricCar
     * - 非电动 + 两轮 → Motorcycle
     * - 非电动 + 非两轮 → Car
     */
    Vehicle create(const std::string& registration,
                   const std::string& make,
                   const std::string& model,
                   const std::string& color,
                   bool isElectric,
                   bool isMotorcycle) const;

    /**
     * @brief 按指定种类创建车辆（卡车、大巴等）
     * @param charge 电量，非电动种类忽略
     * @throws ParkingException(InvalidInput) 车牌号为空
     */
    Vehicle create(VehicleKind kind,
                   const std::string& registration,
                   const std::string& make,
                   const std::string& model,
                   const std::string& color,
                   double charge = DEFAULT_CHARGE) const;

    /**
     * @brief 根据两个布尔判别量选择种类
     */
    static VehicleKind selectKind(bool isElectric, bool isMotorcycle);
};

/**
 * @brief 将种类名称解析为 VehicleKind（不区分大小写）
 * @throws ParkingException(InvalidInput) 名称无法识别
 */
VehicleKind parseVehicleKind(const std::string& name);
