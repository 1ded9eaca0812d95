/**
 * @file parking_lot.h
 * @brief 停车场管理类 - 线程安全实现
 */
#pragma once
#include "parking_level.h"
#include "search_strategy.h"
#include "vehicle_factory.h"
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

/**
 * @brief 车位位置
 */
struct SlotLocation {
    int levelNumber;
    int slotId;
    bool electric;

    bool operator==(const SlotLocation& other) const {
        return levelNumber == other.levelNumber
            && slotId == other.slotId
            && electric == other.electric;
    }
    bool operator!=(const SlotLocation& other) const { return !(*this == other); }
};

/**
 * @brief 单层的占用概况
 */
struct LevelStatus {
    int levelNumber;
    size_t regularFree;
    size_t regularTotal;
    size_t evFree;
    size_t evTotal;
};

/**
 * @brief 整个停车场的占用概况
 */
struct LotStatus {
    std::vector<LevelStatus> levels;  // 按楼层号升序
    size_t totalRegularOccupied = 0;
    size_t totalRegularCapacity = 0;
    size_t totalEvOccupied = 0;
    size_t totalEvCapacity = 0;
};

/**
 * @brief 在场车辆及其位置
 */
struct ParkedVehicle {
    SlotLocation location;
    Vehicle vehicle;
};

/**
 * @class ParkingLot
 * @brief 线程安全的多层停车场
 *
 * 并发安全保证：
 * 1. 使用读写锁(shared_mutex)保护所有楼层和车牌索引
 * 2. 停车、取车、增加楼层、修改电量持有写锁
 * 3. 搜索、状态查询持有读锁，可以并发执行
 * 4. 搜索策略每次调用时新建，读操作之间不共享可变状态
 */
class ParkingLot {
private:
    std::map<int, ParkingLevel> levels;              // 楼层表，按楼层号升序
    std::map<std::string, SlotLocation> locations;   // 车牌号 -> 车位位置
    VehicleFactory factory;

    mutable std::shared_mutex mutex;                 // 读写锁

    ParkingLevel& levelAt(int levelNumber);
    const ParkingLevel& levelAt(int levelNumber) const;

    // 调用者必须持有写锁
    int addLevelLocked(int levelNumber, int regularCapacity, int evCapacity);
    SlotLocation parkLocked(std::optional<int> levelNumber, Vehicle vehicle);
    Vehicle removeLocked(int levelNumber, int slotId, bool isElectric);

public:
    ParkingLot() = default;

    // 禁止拷贝构造和赋值，避免并发安全问题
    ParkingLot(const ParkingLot&) = delete;
    ParkingLot& operator=(const ParkingLot&) = delete;

    /**
     * @brief 增加楼层（线程安全）
     * @param levelNumber 楼层号
     * @param regularCapacity 普通车位数量
     * @param evCapacity 充电车位数量
     * @return 楼层号
     * @throws ParkingException(InvalidInput) 容量为负数或楼层号已存在
     */
    int addLevel(int levelNumber, int regularCapacity, int evCapacity);

    /**
     * @brief 增加楼层，楼层号自动取当前最大楼层号加1（第一层为1）
     * @throws ParkingException(InvalidInput) 最大楼层号已是INT_MAX
     */
    int addLevel(int regularCapacity, int evCapacity);

    /**
     * @brief 车辆入场（线程安全）
     * @param levelNumber 楼层号；为空时按楼层号升序找第一个有空位的楼层
     * @param registration 车牌号
     * @param make 品牌
     * @param model 型号
     * @param color 颜色
     * @param isElectric 是否电动
     * @param isMotorcycle 是否两轮车
     * @return 分配到的车位位置
     * @throws ParkingException
     *   - InvalidInput：车牌号为空或该车已在场
     *   - LevelNotFound：指定的楼层不存在
     *   - Full：没有对应类型的空闲车位
     *
     * 先由工厂构造车辆，再绑定车位；失败时不会留下半绑定的车位
     */
    SlotLocation park(std::optional<int> levelNumber,
                      const std::string& registration,
                      const std::string& make,
                      const std::string& model,
                      const std::string& color,
                      bool isElectric,
                      bool isMotorcycle);

    /**
     * @brief 停入已构造好的车辆（卡车、大巴等）
     */
    SlotLocation park(std::optional<int> levelNumber, Vehicle vehicle);

    /**
     * @brief 车辆出场（线程安全）
     * @return 被移走的车辆
     * @throws ParkingException(LevelNotFound / NotFound)
     */
    Vehicle remove(int levelNumber, int slotId, bool isElectric);

    /**
     * @brief 按车牌号出场
     * @throws ParkingException(NotFound) 该车不在场
     */
    Vehicle removeByRegistration(const std::string& registration);

    /**
     * @brief 按车牌号查询车位位置（线程安全）
     */
    std::optional<SlotLocation> locate(const std::string& registration) const;

    /**
     * @brief 按车牌号查询车辆及其位置（线程安全）
     * @return 该车不在场时返回 std::nullopt
     *
     * 索引和车位在同一把读锁下读取，不会与并发的取车、停车交错
     */
    std::optional<ParkedVehicle> query(const std::string& registration) const;

    /**
     * @brief 查看车位上的车辆（线程安全）
     * @throws ParkingException(LevelNotFound / NotFound)
     */
    Vehicle vehicleAt(int levelNumber, int slotId, bool isElectric) const;

    /**
     * @brief 更新充电车位上车辆的电量，超出 [0,100] 时截断
     * @return 更新后的车辆
     * @throws ParkingException(LevelNotFound / NotFound)
     */
    Vehicle setCharge(int levelNumber, int slotId, double charge);

    /**
     * @brief 搜索车辆（线程安全）
     * @param criterion 搜索条件
     * @param value 条件值
     * @param isElectric 只搜索充电车位还是只搜索普通车位
     * @return 匹配的位置，按楼层号升序，同层按车位编号升序；没有匹配时为空
     */
    std::vector<SlotLocation> find(SearchCriterion criterion,
                                   const std::string& value,
                                   bool isElectric) const;

    /**
     * @brief 按条件名称搜索
     * @throws ParkingException(UnknownCriterion) 条件名称不支持
     */
    std::vector<SlotLocation> find(const std::string& criterionName,
                                   const std::string& value,
                                   bool isElectric) const;

    /**
     * @brief 获取停车场状态（线程安全）
     */
    LotStatus status() const;

    /**
     * @brief 获取当前在场车辆列表（线程安全）
     * @return 按楼层、普通/充电、车位编号排序
     */
    std::vector<ParkedVehicle> currentVehicles() const;

    size_t getLevelCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex);
        return levels.size();
    }
};
