/**
 * @file vehicle.h
 * @brief 车辆类的声明，描述停放在车位上的车辆
 */
#pragma once
#include <string>
#include <ctime>

/**
 * @brief 车辆种类
 *
 * 电动是种类上的标记，而不是独立的类层次：
 * 所有种类共用同一个 Vehicle 类型
 */
enum class VehicleKind {
    Car,
    Motorcycle,
    Truck,
    Bus,
    ElectricCar,
    ElectricBike
};

/**
 * @brief 获取种类名称（car / motorcycle / truck / bus / electric_car / electric_bike）
 */
std::string vehicleKindName(VehicleKind kind);

/**
 * @brief 判断种类是否为电动
 */
bool isElectricKind(VehicleKind kind);

/**
 * @class Vehicle
 * @brief 表示一辆停在停车场中的车辆
 *
 * 车牌号是车辆的身份标识，在场期间在整个停车场内唯一。
 * 车辆创建后除电量外不再修改；电量始终被限制在 [0,100]
 */
class Vehicle {
private:
    std::string registration;  // 车牌号（非空）
    std::string make;          // 品牌
    std::string model;         // 型号
    std::string color;         // 颜色
    VehicleKind kind;          // 车辆种类
    double charge;             // 电量百分比，非电动车恒为0
    time_t entryTime;          // 入场时间（Unix时间戳）

public:
    /**
     * @brief 构造函数
     * @param reg 车牌号
     * @param vMake 品牌
     * @param vModel 型号
     * @param vColor 颜色
     * @param vKind 车辆种类
     * @param chargeLevel 电量，仅对电动种类有效，超出范围时截断
     *
     * 创建时自动记录当前时间为入场时间。
     * 车牌号的合法性由 VehicleFactory 检查
     */
    Vehicle(const std::string& reg,
            const std::string& vMake,
            const std::string& vModel,
            const std::string& vColor,
            VehicleKind vKind,
            double chargeLevel = 0.0);

    const std::string& getRegistration() const { return registration; }
    const std::string& getMake() const { return make; }
    const std::string& getModel() const { return model; }
    const std::string& getColor() const { return color; }
    VehicleKind getKind() const { return kind; }
    time_t getEntryTime() const { return entryTime; }

    /**
     * @brief 获取电量
     * @return 电动车返回 [0,100] 内的电量，其他车辆返回0
     */
    double getCharge() const { return charge; }

    /**
     * @brief 是否电动车（决定停入普通车位还是充电车位）
     */
    bool isElectric() const;

    /**
     * @brief 是否两轮车（摩托车或电动自行车）
     */
    bool isMotorcycle() const;

    /**
     * @brief 设置电量
     * @param level 新电量，超出 [0,100] 时截断
     *
     * 对非电动车无效果
     */
    void setCharge(double level);

    /**
     * @brief 设置入场时间
     * @param time Unix时间戳格式的入场时间
     */
    void setEntryTime(time_t time);

    bool operator==(const Vehicle& other) const;
    bool operator!=(const Vehicle& other) const { return !(*this == other); }
};
