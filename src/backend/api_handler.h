/**
 * @file api_handler.h
 * @brief 与传输层无关的停车场JSON接口
 *
 * HTTP服务器只负责路由，把请求转换为 HttpRequest 后交给这里处理；
 * 这样接口逻辑可以脱离网络直接测试
 */
#pragma once
#include "parking_error.h"
#include "parking_lot.h"
#include "vehicle_factory.h"
#include <functional>
#include <map>
#include <string>

class HttpRequest {
public:
    std::string body;
    std::map<std::string, std::string> params;  // 路径参数和查询参数
};

class HttpResponse {
public:
    int status;
    std::string body;
    std::map<std::string, std::string> headers;

    HttpResponse(int s = 200) : status(s) {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
        headers["Access-Control-Allow-Methods"] = "GET, POST, PUT, DELETE, OPTIONS";
        headers["Access-Control-Allow-Headers"] = "Content-Type";
    }
};

/**
 * @brief 错误码对应的HTTP状态码
 *
 * InvalidInput / UnknownCriterion → 400，LevelNotFound / NotFound → 404，Full → 409
 */
int httpStatusFor(ParkingErrorCode code);

/**
 * @class ParkingApiHandler
 * @brief 停车场REST接口的处理函数集合
 *
 * 响应体统一为 {"success": bool, "message": string, "data": ...}
 */
class ParkingApiHandler {
private:
    ParkingLot& parkingLot;
    VehicleFactory factory;

    /**
     * @brief 执行处理函数并把异常翻译成错误响应
     * @param action 操作名称，用于日志
     * @param handler 实际的处理逻辑
     *
     * ParkingException 按错误码映射状态码，JSON解析错误为400，其他异常为500
     */
    HttpResponse guarded(const std::string& action, const std::function<HttpResponse()>& handler) const;

public:
    explicit ParkingApiHandler(ParkingLot& lot) : parkingLot(lot) {}

    // POST /api/levels
    HttpResponse handleAddLevel(const HttpRequest& req);

    // POST /api/vehicles
    HttpResponse handleParkVehicle(const HttpRequest& req);

    // DELETE /api/levels/<level>/slots/<slot>?electric=
    HttpResponse handleRemoveFromSlot(const HttpRequest& req);

    // DELETE /api/vehicles/<registration>
    HttpResponse handleRemoveVehicle(const HttpRequest& req);

    // GET /api/vehicles/<registration>
    HttpResponse handleQueryVehicle(const HttpRequest& req);

    // GET /api/vehicles
    HttpResponse handleGetCurrentVehicles(const HttpRequest& req);

    // PUT /api/levels/<level>/slots/<slot>/charge
    HttpResponse handleSetCharge(const HttpRequest& req);

    // GET /api/search?criterion=&value=&electric=
    HttpResponse handleSearch(const HttpRequest& req);

    // GET /api/status
    HttpResponse handleGetParkingStatus(const HttpRequest& req);

    /**
     * @brief 创建JSON格式的响应字符串
     * @param success 操作是否成功
     * @param message 响应消息
     * @param data 可选的数据字段（JSON文本），为空时省略
     */
    static std::string createJsonResponse(bool success, const std::string& message,
                                          const std::string& data = "");
};
