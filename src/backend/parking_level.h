/**
 * @file parking_level.h
 * @brief 停车场楼层：普通车位与充电车位的管理
 */
#pragma once
#include "parking_slot.h"
#include <vector>
#include <cstddef>

/**
 * @class ParkingLevel
 * @brief 停车场的一层，拥有固定数量的普通车位和充电车位
 *
 * 两组车位在创建时确定数量，之后不再改变；
 * 每组车位编号从1开始连续分配。
 * 本类不加锁，并发控制由 ParkingLot 负责
 */
class ParkingLevel {
private:
    int levelNumber;                        // 楼层号
    std::vector<ParkingSlot> regularSlots;  // 普通车位
    std::vector<ParkingSlot> evSlots;       // 充电车位

    std::vector<ParkingSlot>& slotsFor(bool isElectric) {
        return isElectric ? evSlots : regularSlots;
    }

    // 编号越界时抛出 NotFound
    template <typename Slots>
    static auto& slotIn(Slots& slots, int levelNumber, int slotId, bool isElectric);

    ParkingSlot& slotAt(int slotId, bool isElectric);
    const ParkingSlot& slotAt(int slotId, bool isElectric) const;

public:
    /**
     * @brief 构造函数
     * @param number 楼层号
     * @param regularCapacity 普通车位数量
     * @param evCapacity 充电车位数量
     * @throws ParkingException(InvalidInput) 任一容量为负数
     */
    ParkingLevel(int number, int regularCapacity, int evCapacity);

    int getLevelNumber() const { return levelNumber; }

    /**
     * @brief 为车辆分配车位
     * @param vehicle 待停放的车辆
     * @return 分配到的车位编号（从1开始）
     * @throws ParkingException(Full) 对应类型没有空闲车位
     *
     * 分配策略：首次适配，选择编号最小的空闲车位。
     * 电动车只停充电车位，其他车辆只停普通车位，不会跨类型分配
     */
    int allocate(Vehicle vehicle);

    /**
     * @brief 释放车位
     * @param slotId 车位编号
     * @param isElectric 是否充电车位
     * @return 被移走的车辆
     * @throws ParkingException(NotFound) 编号越界或车位为空
     */
    Vehicle release(int slotId, bool isElectric);

    /**
     * @brief 查看车位上的车辆
     * @throws ParkingException(NotFound) 编号越界或车位为空
     */
    const Vehicle& vehicleAt(int slotId, bool isElectric) const;

    /**
     * @brief 更新充电车位上车辆的电量
     * @throws ParkingException(NotFound) 编号越界或车位为空
     */
    const Vehicle& setCharge(int slotId, double charge);

    /**
     * @brief 是否还有对应类型的空闲车位
     */
    bool hasFreeSlot(bool isElectric) const;

    const std::vector<ParkingSlot>& getSlots(bool isElectric) const {
        return isElectric ? evSlots : regularSlots;
    }

    size_t getRegularTotal() const { return regularSlots.size(); }
    size_t getEvTotal() const { return evSlots.size(); }
    size_t getRegularFree() const;
    size_t getEvFree() const;
};
