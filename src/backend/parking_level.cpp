/**
 * @file parking_level.cpp
 * @brief ParkingLevel类的实现
 */
#include "parking_level.h"
#include "parking_error.h"
#include <algorithm>
#include <string>
#include <utility>

namespace {

size_t countFree(const std::vector<ParkingSlot>& slots) {
    return static_cast<size_t>(std::count_if(slots.begin(), slots.end(),
        [](const ParkingSlot& slot) { return !slot.isOccupied(); }));
}

std::string slotName(int levelNumber, int slotId, bool isElectric) {
    return std::string(isElectric ? "EV" : "regular") + " slot " + std::to_string(slotId)
         + " on level " + std::to_string(levelNumber);
}

}  // namespace

ParkingLevel::ParkingLevel(int number, int regularCapacity, int evCapacity)
    : levelNumber(number) {
    if (regularCapacity < 0 || evCapacity < 0) {
        throw ParkingException(ParkingErrorCode::InvalidInput,
                               "Capacity must not be negative");
    }

    // 编号从1开始连续分配
    regularSlots.reserve(regularCapacity);
    for (int id = 1; id <= regularCapacity; ++id) {
        regularSlots.emplace_back(id, false);
    }
    evSlots.reserve(evCapacity);
    for (int id = 1; id <= evCapacity; ++id) {
        evSlots.emplace_back(id, true);
    }
}

template <typename Slots>
auto& ParkingLevel::slotIn(Slots& slots, int levelNumber, int slotId, bool isElectric) {
    if (slotId < 1 || static_cast<size_t>(slotId) > slots.size()) {
        throw ParkingException(ParkingErrorCode::NotFound,
                               slotName(levelNumber, slotId, isElectric) + " does not exist");
    }
    return slots[slotId - 1];
}

ParkingSlot& ParkingLevel::slotAt(int slotId, bool isElectric) {
    return slotIn(slotsFor(isElectric), levelNumber, slotId, isElectric);
}

const ParkingSlot& ParkingLevel::slotAt(int slotId, bool isElectric) const {
    return slotIn(getSlots(isElectric), levelNumber, slotId, isElectric);
}

int ParkingLevel::allocate(Vehicle vehicle) {
    auto& slots = slotsFor(vehicle.isElectric());

    // 首次适配：按编号升序找第一个空闲车位
    auto it = std::find_if(slots.begin(), slots.end(),
        [](const ParkingSlot& slot) { return !slot.isOccupied(); });
    if (it == slots.end()) {
        throw ParkingException(ParkingErrorCode::Full,
            std::string("No free ") + (vehicle.isElectric() ? "EV" : "regular")
            + " slot on level " + std::to_string(levelNumber));
    }

    it->occupy(std::move(vehicle));
    return it->getId();
}

Vehicle ParkingLevel::release(int slotId, bool isElectric) {
    auto removed = slotAt(slotId, isElectric).vacate();
    if (!removed) {
        throw ParkingException(ParkingErrorCode::NotFound,
                               slotName(levelNumber, slotId, isElectric) + " is empty");
    }
    return std::move(*removed);
}

const Vehicle& ParkingLevel::vehicleAt(int slotId, bool isElectric) const {
    const auto& vehicle = slotAt(slotId, isElectric).getVehicle();
    if (!vehicle) {
        throw ParkingException(ParkingErrorCode::NotFound,
                               slotName(levelNumber, slotId, isElectric) + " is empty");
    }
    return *vehicle;
}

const Vehicle& ParkingLevel::setCharge(int slotId, double charge) {
    ParkingSlot& slot = slotAt(slotId, true);
    if (!slot.setCharge(charge)) {
        throw ParkingException(ParkingErrorCode::NotFound,
                               slotName(levelNumber, slotId, true) + " is empty");
    }
    return *slot.getVehicle();
}

bool ParkingLevel::hasFreeSlot(bool isElectric) const {
    const auto& slots = getSlots(isElectric);
    return std::any_of(slots.begin(), slots.end(),
        [](const ParkingSlot& slot) { return !slot.isOccupied(); });
}

size_t ParkingLevel::getRegularFree() const {
    return countFree(regularSlots);
}

size_t ParkingLevel::getEvFree() const {
    return countFree(evSlots);
}
