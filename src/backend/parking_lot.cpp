/**
 * @file parking_lot.cpp
 * @brief ParkingLot类的线程安全实现
 */
#include "parking_lot.h"
#include "logger.h"
#include "parking_error.h"
#include <initializer_list>
#include <limits>
#include <mutex>
#include <utility>

namespace {

std::string describe(const SlotLocation& location) {
    return std::string("level ") + std::to_string(location.levelNumber)
         + (location.electric ? " EV slot " : " regular slot ")
         + std::to_string(location.slotId);
}

}  // namespace

ParkingLevel& ParkingLot::levelAt(int levelNumber) {
    auto it = levels.find(levelNumber);
    if (it == levels.end()) {
        throw ParkingException(ParkingErrorCode::LevelNotFound,
                               "Level " + std::to_string(levelNumber) + " does not exist");
    }
    return it->second;
}

const ParkingLevel& ParkingLot::levelAt(int levelNumber) const {
    auto it = levels.find(levelNumber);
    if (it == levels.end()) {
        throw ParkingException(ParkingErrorCode::LevelNotFound,
                               "Level " + std::to_string(levelNumber) + " does not exist");
    }
    return it->second;
}

int ParkingLot::addLevel(int levelNumber, int regularCapacity, int evCapacity) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    return addLevelLocked(levelNumber, regularCapacity, evCapacity);
}

int ParkingLot::addLevel(int regularCapacity, int evCapacity) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    int next = 1;
    if (!levels.empty()) {
        int highest = levels.rbegin()->first;
        if (highest == std::numeric_limits<int>::max()) {
            Logger::warning("Add level rejected: no level number after " + std::to_string(highest));
            throw ParkingException(ParkingErrorCode::InvalidInput,
                                   "No level number left after " + std::to_string(highest));
        }
        next = highest + 1;
    }
    return addLevelLocked(next, regularCapacity, evCapacity);
}

int ParkingLot::addLevelLocked(int levelNumber, int regularCapacity, int evCapacity) {
    if (levels.count(levelNumber) != 0) {
        Logger::warning("Add level rejected: level " + std::to_string(levelNumber) + " already exists");
        throw ParkingException(ParkingErrorCode::InvalidInput,
                               "Level " + std::to_string(levelNumber) + " already exists");
    }

    // 构造函数负责检查容量
    levels.emplace(levelNumber, ParkingLevel(levelNumber, regularCapacity, evCapacity));

    Logger::info("Added level " + std::to_string(levelNumber) + " with "
                 + std::to_string(regularCapacity) + " regular and "
                 + std::to_string(evCapacity) + " EV slots");
    return levelNumber;
}

SlotLocation ParkingLot::park(std::optional<int> levelNumber,
                              const std::string& registration,
                              const std::string& make,
                              const std::string& model,
                              const std::string& color,
                              bool isElectric,
                              bool isMotorcycle) {
    // 1. 先构造车辆，构造失败时不触碰任何车位
    Vehicle vehicle = factory.create(registration, make, model, color, isElectric, isMotorcycle);
    return park(levelNumber, std::move(vehicle));
}

SlotLocation ParkingLot::park(std::optional<int> levelNumber, Vehicle vehicle) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    try {
        return parkLocked(levelNumber, std::move(vehicle));
    } catch (const ParkingException& e) {
        Logger::warning(std::string("Park rejected (") + parkingErrorName(e.code()) + "): " + e.what());
        throw;
    }
}

SlotLocation ParkingLot::parkLocked(std::optional<int> levelNumber, Vehicle vehicle) {
    const std::string registration = vehicle.getRegistration();
    const bool electric = vehicle.isElectric();

    if (registration.empty()) {
        throw ParkingException(ParkingErrorCode::InvalidInput,
                               "Registration number must not be empty");
    }

    // 2. 检查车辆是否已在场
    if (locations.count(registration) != 0) {
        throw ParkingException(ParkingErrorCode::InvalidInput,
                               "Vehicle " + registration + " is already parked");
    }

    // 3. 确定楼层
    ParkingLevel* target = nullptr;
    if (levelNumber) {
        target = &levelAt(*levelNumber);
    } else {
        // 按楼层号升序找第一个有对应类型空位的楼层
        for (auto& [number, level] : levels) {
            if (level.hasFreeSlot(electric)) {
                target = &level;
                break;
            }
        }
        if (target == nullptr) {
            throw ParkingException(ParkingErrorCode::Full,
                std::string("No free ") + (electric ? "EV" : "regular") + " slot on any level");
        }
    }

    // 4. 绑定车位并登记车牌索引
    int slotId = target->allocate(std::move(vehicle));
    SlotLocation location{target->getLevelNumber(), slotId, electric};
    try {
        locations.emplace(registration, location);
    } catch (...) {
        // 索引登记失败时撤销绑定，保证全有或全无
        target->release(slotId, electric);
        throw;
    }

    Logger::info("Parked " + registration + " at " + describe(location));
    return location;
}

Vehicle ParkingLot::remove(int levelNumber, int slotId, bool isElectric) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    try {
        return removeLocked(levelNumber, slotId, isElectric);
    } catch (const ParkingException& e) {
        Logger::warning(std::string("Remove rejected (") + parkingErrorName(e.code()) + "): " + e.what());
        throw;
    }
}

Vehicle ParkingLot::removeLocked(int levelNumber, int slotId, bool isElectric) {
    Vehicle vehicle = levelAt(levelNumber).release(slotId, isElectric);
    locations.erase(vehicle.getRegistration());

    Logger::info("Removed " + vehicle.getRegistration() + " from "
                 + describe(SlotLocation{levelNumber, slotId, isElectric}));
    return vehicle;
}

Vehicle ParkingLot::removeByRegistration(const std::string& registration) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    auto it = locations.find(registration);
    if (it == locations.end()) {
        Logger::warning("Remove rejected (NotFound): vehicle " + registration + " is not parked");
        throw ParkingException(ParkingErrorCode::NotFound,
                               "Vehicle " + registration + " is not parked");
    }
    SlotLocation location = it->second;
    return removeLocked(location.levelNumber, location.slotId, location.electric);
}

std::optional<SlotLocation> ParkingLot::locate(const std::string& registration) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto it = locations.find(registration);
    if (it == locations.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ParkedVehicle> ParkingLot::query(const std::string& registration) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto it = locations.find(registration);
    if (it == locations.end()) {
        return std::nullopt;
    }
    const SlotLocation& location = it->second;
    return ParkedVehicle{location,
                         levelAt(location.levelNumber).vehicleAt(location.slotId, location.electric)};
}

Vehicle ParkingLot::vehicleAt(int levelNumber, int slotId, bool isElectric) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return levelAt(levelNumber).vehicleAt(slotId, isElectric);
}

Vehicle ParkingLot::setCharge(int levelNumber, int slotId, double charge) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    const Vehicle& vehicle = levelAt(levelNumber).setCharge(slotId, charge);
    Logger::debug("Charge of " + vehicle.getRegistration() + " set to "
                  + std::to_string(vehicle.getCharge()));
    return vehicle;
}

std::vector<SlotLocation> ParkingLot::find(SearchCriterion criterion,
                                           const std::string& value,
                                           bool isElectric) const {
    // 每次调用新建搜索器，读锁下并发的搜索互不干扰
    VehicleSearcher searcher(makeSearchStrategy(criterion));

    std::shared_lock<std::shared_mutex> lock(mutex);

    std::vector<SlotLocation> results;
    for (const auto& [number, level] : levels) {
        for (int slotId : searcher.search(level.getSlots(isElectric), value)) {
            results.push_back(SlotLocation{number, slotId, isElectric});
        }
    }
    return results;
}

std::vector<SlotLocation> ParkingLot::find(const std::string& criterionName,
                                           const std::string& value,
                                           bool isElectric) const {
    return find(parseSearchCriterion(criterionName), value, isElectric);
}

LotStatus ParkingLot::status() const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    LotStatus result;
    result.levels.reserve(levels.size());
    for (const auto& [number, level] : levels) {
        LevelStatus entry{number,
                          level.getRegularFree(), level.getRegularTotal(),
                          level.getEvFree(), level.getEvTotal()};

        result.totalRegularCapacity += entry.regularTotal;
        result.totalRegularOccupied += entry.regularTotal - entry.regularFree;
        result.totalEvCapacity += entry.evTotal;
        result.totalEvOccupied += entry.evTotal - entry.evFree;
        result.levels.push_back(entry);
    }
    return result;
}

std::vector<ParkedVehicle> ParkingLot::currentVehicles() const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    std::vector<ParkedVehicle> current;
    current.reserve(locations.size());

    for (const auto& [number, level] : levels) {
        for (bool electric : {false, true}) {
            for (const auto& slot : level.getSlots(electric)) {
                if (slot.isOccupied()) {
                    current.push_back(ParkedVehicle{SlotLocation{number, slot.getId(), electric},
                                                    *slot.getVehicle()});
                }
            }
        }
    }
    return current;
}
