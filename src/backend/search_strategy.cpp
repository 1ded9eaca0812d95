/**
 * @file search_strategy.cpp
 * @brief 搜索策略与搜索器的实现
 */
#include "search_strategy.h"
#include "parking_error.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

}  // namespace

std::string searchCriterionName(SearchCriterion criterion) {
    switch (criterion) {
        case SearchCriterion::Color: return "color";
        case SearchCriterion::Make: return "make";
        case SearchCriterion::Model: return "model";
        case SearchCriterion::Registration: return "registration";
        default: return "unknown";
    }
}

SearchCriterion parseSearchCriterion(const std::string& name) {
    static const SearchCriterion criteria[] = {
        SearchCriterion::Color, SearchCriterion::Make,
        SearchCriterion::Model, SearchCriterion::Registration
    };
    for (SearchCriterion criterion : criteria) {
        if (equalsIgnoreCase(searchCriterionName(criterion), name)) {
            return criterion;
        }
    }
    throw ParkingException(ParkingErrorCode::UnknownCriterion,
                           "Unknown search criterion: " + name);
}

bool ColorStrategy::match(const Vehicle& vehicle, const std::string& criterion) const {
    return equalsIgnoreCase(vehicle.getColor(), criterion);
}

bool MakeStrategy::match(const Vehicle& vehicle, const std::string& criterion) const {
    return equalsIgnoreCase(vehicle.getMake(), criterion);
}

bool ModelStrategy::match(const Vehicle& vehicle, const std::string& criterion) const {
    return equalsIgnoreCase(vehicle.getModel(), criterion);
}

bool RegistrationStrategy::match(const Vehicle& vehicle, const std::string& criterion) const {
    return vehicle.getRegistration() == criterion;
}

std::unique_ptr<SearchStrategy> makeSearchStrategy(SearchCriterion criterion) {
    switch (criterion) {
        case SearchCriterion::Color:
            return std::make_unique<ColorStrategy>();
        case SearchCriterion::Make:
            return std::make_unique<MakeStrategy>();
        case SearchCriterion::Model:
            return std::make_unique<ModelStrategy>();
        case SearchCriterion::Registration:
            return std::make_unique<RegistrationStrategy>();
    }
    throw ParkingException(ParkingErrorCode::UnknownCriterion, "Unknown search criterion");
}

VehicleSearcher::VehicleSearcher(std::unique_ptr<SearchStrategy> initial) {
    setStrategy(std::move(initial));
}

void VehicleSearcher::setStrategy(std::unique_ptr<SearchStrategy> newStrategy) {
    if (!newStrategy) {
        throw std::invalid_argument("Search strategy must not be null");
    }
    strategy = std::move(newStrategy);
}

std::vector<int> VehicleSearcher::search(const std::vector<ParkingSlot>& slots,
                                         const std::string& criterion) const {
    std::vector<int> matches;
    for (const auto& slot : slots) {
        const auto& vehicle = slot.getVehicle();
        if (vehicle && strategy->match(*vehicle, criterion)) {
            matches.push_back(slot.getId());
        }
    }
    return matches;
}
