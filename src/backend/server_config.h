/**
 * @file server_config.h
 * @brief 服务器配置：端口、日志级别和楼层布局
 */
#pragma once
#include "logger.h"
#include <cstdint>
#include <string>
#include <vector>

struct LevelConfig {
    int levelNumber;
    int regularCapacity;
    int evCapacity;
};

/**
 * @struct ServerConfig
 * @brief 从JSON文件读取的服务器配置
 *
 * 文件格式：
 * {
 *   "port": 8080,
 *   "logLevel": "info",
 *   "levels": [ { "levelNumber": 1, "regularCapacity": 20, "evCapacity": 5 } ]
 * }
 * 所有字段都可省略，省略时使用默认值
 */
struct ServerConfig {
    uint16_t port = 8080;
    LogLevel logLevel = LogLevel::INFO;
    std::vector<LevelConfig> levels{{1, 20, 5}};
};

/**
 * @brief 解析JSON文本
 * @param text JSON文本
 * @param source 来源名称，用于错误信息
 * @throws std::runtime_error 格式错误、类型错误、端口越界或容量为负数
 */
ServerConfig parseServerConfig(const std::string& text, const std::string& source = "<string>");

/**
 * @brief 从文件加载配置
 * @param path 配置文件路径
 * @return 文件不存在时返回默认配置
 * @throws std::runtime_error 文件内容非法
 */
ServerConfig loadServerConfig(const std::string& path);
