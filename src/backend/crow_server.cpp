/**
 * @file crow_server.cpp
 * @brief Crow服务器的路由与请求转换
 */
#include "include/crow_server.h"
#include "logger.h"
#include <initializer_list>
#include <sstream>
#include <string>

namespace {

/**
 * @brief URL解码函数
 * @param encoded URL编码的字符串
 * @return 解码后的原始字符串
 *
 * %XX 转换为对应字符，+ 转换为空格；
 * % 后不足两个字符时保持原样
 */
std::string urlDecode(const std::string& encoded) {
    std::string result;
    result.reserve(encoded.length());

    for (size_t i = 0; i < encoded.length(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.length()) {
            int value = 0;
            std::istringstream(encoded.substr(i + 1, 2)) >> std::hex >> value;
            result += static_cast<char>(value);
            i += 2;
        } else if (encoded[i] == '+') {
            result += ' ';
        } else {
            result += encoded[i];
        }
    }
    return result;
}

// 转换Crow请求，只复制接口用到的查询参数
HttpRequest fromCrow(const crow::request& req, std::initializer_list<const char*> queryKeys = {}) {
    HttpRequest request;
    request.body = req.body;
    for (const char* key : queryKeys) {
        const char* value = req.url_params.get(key);
        if (value != nullptr) {
            request.params[key] = value;
        }
    }
    return request;
}

crow::response toCrow(const HttpResponse& response) {
    crow::response res(response.status);
    for (const auto& [key, value] : response.headers) {
        res.set_header(key, value);
    }
    res.body = response.body;
    return res;
}

}  // namespace

CrowParkingServer::CrowParkingServer(const ServerConfig& config)
    : parkingLot(std::make_shared<ParkingLot>())
    , handler(*parkingLot)
    , port(config.port) {
    for (const auto& level : config.levels) {
        parkingLot->addLevel(level.levelNumber, level.regularCapacity, level.evCapacity);
    }
    setupCORS();
    setupRoutes();
}

void CrowParkingServer::setupCORS() {
    auto& cors = app.get_middleware<crow::CORSHandler>();
    cors.global()
        .origin("*")
        .headers("Content-Type")
        .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post,
                 crow::HTTPMethod::Put, crow::HTTPMethod::Delete,
                 crow::HTTPMethod::Options);
}

void CrowParkingServer::setupRoutes() {
    CROW_ROUTE(app, "/api/levels")
        .methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            return toCrow(handler.handleAddLevel(fromCrow(req)));
        });

    CROW_ROUTE(app, "/api/levels/<int>/slots/<int>")
        .methods(crow::HTTPMethod::Delete)
        ([this](const crow::request& req, int level, int slot) {
            HttpRequest request = fromCrow(req, {"electric"});
            request.params["level"] = std::to_string(level);
            request.params["slot"] = std::to_string(slot);
            return toCrow(handler.handleRemoveFromSlot(request));
        });

    CROW_ROUTE(app, "/api/levels/<int>/slots/<int>/charge")
        .methods(crow::HTTPMethod::Put)
        ([this](const crow::request& req, int level, int slot) {
            HttpRequest request = fromCrow(req);
            request.params["level"] = std::to_string(level);
            request.params["slot"] = std::to_string(slot);
            return toCrow(handler.handleSetCharge(request));
        });

    CROW_ROUTE(app, "/api/vehicles")
        .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            if (req.method == crow::HTTPMethod::Post) {
                return toCrow(handler.handleParkVehicle(fromCrow(req)));
            }
            return toCrow(handler.handleGetCurrentVehicles(fromCrow(req)));
        });

    CROW_ROUTE(app, "/api/vehicles/<string>")
        .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Delete)
        ([this](const crow::request& req, std::string registration) {
            HttpRequest request = fromCrow(req);
            request.params["registration"] = urlDecode(registration);
            if (req.method == crow::HTTPMethod::Delete) {
                return toCrow(handler.handleRemoveVehicle(request));
            }
            return toCrow(handler.handleQueryVehicle(request));
        });

    CROW_ROUTE(app, "/api/search")
        .methods(crow::HTTPMethod::Get)
        ([this](const crow::request& req) {
            return toCrow(handler.handleSearch(fromCrow(req, {"criterion", "value", "electric"})));
        });

    CROW_ROUTE(app, "/api/status")
        .methods(crow::HTTPMethod::Get)
        ([this](const crow::request& req) {
            return toCrow(handler.handleGetParkingStatus(fromCrow(req)));
        });
}

void CrowParkingServer::start() {
    Logger::info("Server started on port " + std::to_string(port));
    app.port(port).multithreaded().run();
}

void CrowParkingServer::stop() {
    app.stop();
}
