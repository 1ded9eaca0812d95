/**
 * @file main.cpp
 * @brief 停车场管理系统的主程序入口
 *
 * 该文件负责：
 * 1. 读取配置文件（默认 parking_config.json，可由第一个命令行参数指定）
 * 2. 按配置创建并启动HTTP服务器
 * 3. 处理异常情况
 */
#include "include/crow_server.h"
#include "logger.h"
#include "server_config.h"
#include <exception>
#include <string>

/**
 * @brief 程序入口点
 * @return 0表示正常退出，1表示发生错误
 */
int main(int argc, char* argv[]) {
    std::string configPath = argc > 1 ? argv[1] : "parking_config.json";

    try {
        ServerConfig config = loadServerConfig(configPath);
        Logger::setLogLevel(config.logLevel);

        Logger::info("Starting Parking Management API Server...");
        CrowParkingServer server(config);

        // 打印可用接口
        Logger::info("Available endpoints:");
        Logger::info("POST   /api/levels                         - Add a level");
        Logger::info("POST   /api/vehicles                       - Park a vehicle");
        Logger::info("GET    /api/vehicles                       - List parked vehicles");
        Logger::info("GET    /api/vehicles/:registration         - Locate a vehicle");
        Logger::info("DELETE /api/vehicles/:registration         - Remove a vehicle by registration");
        Logger::info("DELETE /api/levels/:level/slots/:slot      - Remove a vehicle from a slot");
        Logger::info("PUT    /api/levels/:level/slots/:slot/charge - Update EV charge");
        Logger::info("GET    /api/search                         - Search parked vehicles");
        Logger::info("GET    /api/status                         - Get parking lot status");

        server.start();
        return 0;

    } catch (const std::exception& e) {
        Logger::error(std::string("Server error: ") + e.what());
        return 1;
    }
}
