/**
 * @file crow_server.h
 * @brief 基于Crow的停车场HTTP服务器
 */
#pragma once

#include <crow.h>
#include <crow/middlewares/cors.h>
#include "api_handler.h"
#include "parking_lot.h"
#include "server_config.h"
#include <memory>

/**
 * @class CrowParkingServer
 * @brief 把HTTP路由映射到 ParkingApiHandler
 *
 * 业务逻辑全部在 ParkingApiHandler 和 ParkingLot 中，
 * 本类只负责请求转换、路由注册和CORS
 */
class CrowParkingServer {
public:
    /**
     * @brief 构造函数
     * @param config 服务器配置，按其中的楼层布局创建停车场
     * @throws ParkingException 楼层配置非法
     */
    explicit CrowParkingServer(const ServerConfig& config);

    /**
     * @brief 启动服务器（阻塞直到 stop 被调用）
     */
    void start();

    void stop();

private:
    void setupRoutes();
    void setupCORS();

    std::shared_ptr<ParkingLot> parkingLot;
    ParkingApiHandler handler;
    uint16_t port;
    crow::App<crow::CORSHandler> app;
};
