/**
 * @file api_handler.cpp
 * @brief 停车场REST接口的实现
 *
 * 主要功能：
 * 1. 解析请求体和路径/查询参数
 * 2. 调用 ParkingLot 完成业务操作
 * 3. 把结果和错误统一序列化为JSON
 */
#include "api_handler.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;

namespace {

json toJson(const SlotLocation& location) {
    return json{
        {"levelNumber", location.levelNumber},
        {"slotId", location.slotId},
        {"electric", location.electric}
    };
}

json toJson(const Vehicle& vehicle) {
    json data{
        {"registration", vehicle.getRegistration()},
        {"make", vehicle.getMake()},
        {"model", vehicle.getModel()},
        {"color", vehicle.getColor()},
        {"kind", vehicleKindName(vehicle.getKind())},
        {"electric", vehicle.isElectric()},
        {"motorcycle", vehicle.isMotorcycle()},
        {"entryTime", static_cast<long long>(vehicle.getEntryTime())}
    };
    if (vehicle.isElectric()) {
        data["charge"] = vehicle.getCharge();
    }
    return data;
}

json toJson(const LotStatus& status) {
    json levels = json::array();
    for (const auto& level : status.levels) {
        levels.push_back(json{
            {"levelNumber", level.levelNumber},
            {"regularFree", level.regularFree},
            {"regularTotal", level.regularTotal},
            {"evFree", level.evFree},
            {"evTotal", level.evTotal}
        });
    }
    return json{
        {"levels", levels},
        {"totalRegularOccupied", status.totalRegularOccupied},
        {"totalRegularCapacity", status.totalRegularCapacity},
        {"totalEvOccupied", status.totalEvOccupied},
        {"totalEvCapacity", status.totalEvCapacity}
    };
}

json parseBody(const HttpRequest& req) {
    json body = req.body.empty() ? json::object() : json::parse(req.body);
    if (!body.is_object()) {
        throw ParkingException(ParkingErrorCode::InvalidInput, "Request body must be a JSON object");
    }
    return body;
}

// 缺少参数时抛出 InvalidInput
const std::string& requireParam(const HttpRequest& req, const std::string& name) {
    auto it = req.params.find(name);
    if (it == req.params.end()) {
        throw ParkingException(ParkingErrorCode::InvalidInput, "Missing parameter: " + name);
    }
    return it->second;
}

int intParam(const HttpRequest& req, const std::string& name) {
    const std::string& value = requireParam(req, name);
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used == value.size()) {
            return result;
        }
    } catch (const std::logic_error&) {
        // 落到下面统一报错
    }
    throw ParkingException(ParkingErrorCode::InvalidInput,
                           "Parameter " + name + " must be an integer: " + value);
}

// 未提供时为false；接受 true/false/1/0
bool boolParam(const HttpRequest& req, const std::string& name) {
    auto it = req.params.find(name);
    if (it == req.params.end()) {
        return false;
    }
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0" || value.empty()) return false;
    throw ParkingException(ParkingErrorCode::InvalidInput,
                           "Parameter " + name + " must be true or false: " + it->second);
}

// 读取整数字段，超出int范围或不是整数时抛出 InvalidInput
int intField(const json& body, const std::string& name) {
    const json& value = body.at(name);
    bool inRange = false;
    long long result = 0;
    if (value.is_number_unsigned()) {
        auto raw = value.get<json::number_unsigned_t>();
        inRange = raw <= static_cast<json::number_unsigned_t>(std::numeric_limits<int>::max());
        result = static_cast<long long>(raw);
    } else if (value.is_number_integer()) {
        auto raw = value.get<json::number_integer_t>();
        inRange = raw >= std::numeric_limits<int>::min() && raw <= std::numeric_limits<int>::max();
        result = raw;
    }
    if (!inRange) {
        throw ParkingException(ParkingErrorCode::InvalidInput,
                               "Field " + name + " must be an integer in int range: " + value.dump());
    }
    return static_cast<int>(result);
}

json envelope(bool success, const std::string& message, const json& data = json()) {
    json response{{"success", success}, {"message", message}};
    if (!data.is_null()) {
        response["data"] = data;
    }
    return response;
}

HttpResponse jsonResponse(int status, bool success, const std::string& message,
                          const json& data = json()) {
    HttpResponse response(status);
    response.body = envelope(success, message, data).dump();
    return response;
}

}  // namespace

int httpStatusFor(ParkingErrorCode code) {
    switch (code) {
        case ParkingErrorCode::InvalidInput: return 400;
        case ParkingErrorCode::UnknownCriterion: return 400;
        case ParkingErrorCode::LevelNotFound: return 404;
        case ParkingErrorCode::NotFound: return 404;
        case ParkingErrorCode::Full: return 409;
        default: return 500;
    }
}

std::string ParkingApiHandler::createJsonResponse(bool success, const std::string& message,
                                                  const std::string& data) {
    return envelope(success, message, data.empty() ? json() : json::parse(data)).dump();
}

HttpResponse ParkingApiHandler::guarded(const std::string& action,
                                        const std::function<HttpResponse()>& handler) const {
    try {
        return handler();
    } catch (const ParkingException& e) {
        HttpResponse response = jsonResponse(httpStatusFor(e.code()), false, e.what());
        response.headers["X-Error-Code"] = parkingErrorName(e.code());
        return response;
    } catch (const json::exception& e) {
        // 请求体格式错误或字段类型不符
        Logger::warning(action + ": malformed request: " + e.what());
        return jsonResponse(400, false, std::string("Malformed request: ") + e.what());
    } catch (const std::exception& e) {
        Logger::error(action + ": " + e.what());
        return jsonResponse(500, false, std::string("Internal error: ") + e.what());
    }
}

HttpResponse ParkingApiHandler::handleAddLevel(const HttpRequest& req) {
    return guarded("add level", [&] {
        json body = parseBody(req);
        int regular = intField(body, "regularCapacity");
        int ev = intField(body, "evCapacity");

        int number = body.contains("levelNumber")
            ? parkingLot.addLevel(intField(body, "levelNumber"), regular, ev)
            : parkingLot.addLevel(regular, ev);

        return jsonResponse(200, true, "Level added", json{{"levelNumber", number}});
    });
}

HttpResponse ParkingApiHandler::handleParkVehicle(const HttpRequest& req) {
    return guarded("park vehicle", [&] {
        json body = parseBody(req);
        if (!body.contains("registration")) {
            throw ParkingException(ParkingErrorCode::InvalidInput, "Missing registration in request");
        }

        std::string registration = body.at("registration").get<std::string>();
        std::string make = body.value("make", std::string());
        std::string model = body.value("model", std::string());
        std::string color = body.value("color", std::string());

        std::optional<int> level;
        if (body.contains("level") && !body.at("level").is_null()) {
            level = intField(body, "level");
        }

        SlotLocation location{};
        if (body.contains("kind")) {
            // 显式指定种类（卡车、大巴等）
            VehicleKind kind = parseVehicleKind(body.at("kind").get<std::string>());
            double charge = body.value("charge", VehicleFactory::DEFAULT_CHARGE);
            location = parkingLot.park(level, factory.create(kind, registration, make, model, color, charge));
        } else {
            location = parkingLot.park(level, registration, make, model, color,
                                       body.value("electric", false),
                                       body.value("motorcycle", false));
        }
        return jsonResponse(200, true, "Vehicle parked successfully", toJson(location));
    });
}

HttpResponse ParkingApiHandler::handleRemoveFromSlot(const HttpRequest& req) {
    return guarded("remove from slot", [&] {
        Vehicle vehicle = parkingLot.remove(intParam(req, "level"), intParam(req, "slot"),
                                            boolParam(req, "electric"));
        return jsonResponse(200, true, "Vehicle removed successfully", toJson(vehicle));
    });
}

HttpResponse ParkingApiHandler::handleRemoveVehicle(const HttpRequest& req) {
    return guarded("remove vehicle", [&] {
        Vehicle vehicle = parkingLot.removeByRegistration(requireParam(req, "registration"));
        return jsonResponse(200, true, "Vehicle removed successfully", toJson(vehicle));
    });
}

HttpResponse ParkingApiHandler::handleQueryVehicle(const HttpRequest& req) {
    return guarded("query vehicle", [&] {
        const std::string& registration = requireParam(req, "registration");
        // 位置和车辆在同一把读锁下读取
        auto parked = parkingLot.query(registration);
        if (!parked) {
            throw ParkingException(ParkingErrorCode::NotFound,
                                   "Vehicle " + registration + " is not parked");
        }
        return jsonResponse(200, true, "Vehicle found",
                            json{{"location", toJson(parked->location)},
                                 {"vehicle", toJson(parked->vehicle)}});
    });
}

HttpResponse ParkingApiHandler::handleGetCurrentVehicles(const HttpRequest&) {
    return guarded("list vehicles", [&] {
        json data = json::array();
        for (const auto& parked : parkingLot.currentVehicles()) {
            data.push_back(json{{"location", toJson(parked.location)},
                                {"vehicle", toJson(parked.vehicle)}});
        }
        return jsonResponse(200, true, "Current vehicles retrieved", data);
    });
}

HttpResponse ParkingApiHandler::handleSetCharge(const HttpRequest& req) {
    return guarded("set charge", [&] {
        json body = parseBody(req);
        Vehicle vehicle = parkingLot.setCharge(intParam(req, "level"), intParam(req, "slot"),
                                               body.at("charge").get<double>());
        return jsonResponse(200, true, "Charge updated", toJson(vehicle));
    });
}

HttpResponse ParkingApiHandler::handleSearch(const HttpRequest& req) {
    return guarded("search", [&] {
        auto matches = parkingLot.find(requireParam(req, "criterion"), requireParam(req, "value"),
                                       boolParam(req, "electric"));
        json data = json::array();
        for (const auto& location : matches) {
            data.push_back(toJson(location));
        }
        return jsonResponse(200, true, "Search completed", data);
    });
}

HttpResponse ParkingApiHandler::handleGetParkingStatus(const HttpRequest&) {
    return guarded("status", [&] {
        return jsonResponse(200, true, "Status retrieved", toJson(parkingLot.status()));
    });
}
