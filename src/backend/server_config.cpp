/**
 * @file server_config.cpp
 * @brief 配置文件的读取与校验
 */
#include "server_config.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// 读取整数字段，缺省时使用fallback；超出int范围或不是整数时抛出异常
int intValue(const json& object, const std::string& name, long long fallback) {
    long long result = fallback;
    if (object.contains(name)) {
        const json& value = object.at(name);
        if (value.is_number_unsigned()) {
            auto raw = value.get<json::number_unsigned_t>();
            result = raw > static_cast<json::number_unsigned_t>(std::numeric_limits<int>::max())
                ? static_cast<long long>(std::numeric_limits<int>::max()) + 1
                : static_cast<long long>(raw);
        } else if (value.is_number_integer()) {
            result = value.get<json::number_integer_t>();
        } else {
            throw std::runtime_error(name + " must be an integer");
        }
    }
    if (result < std::numeric_limits<int>::min() || result > std::numeric_limits<int>::max()) {
        throw std::runtime_error(name + " is out of range");
    }
    return static_cast<int>(result);
}

}  // namespace

ServerConfig parseServerConfig(const std::string& text, const std::string& source) {
    ServerConfig config;

    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid config " + source + ": " + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Invalid config " + source + ": top level must be an object");
    }

    try {
        if (root.contains("port")) {
            int port = intValue(root, "port", 8080);
            if (port < 1 || port > 65535) {
                throw std::runtime_error("port must be in 1..65535");
            }
            config.port = static_cast<uint16_t>(port);
        }

        if (root.contains("logLevel")) {
            config.logLevel = parseLogLevel(root.at("logLevel").get<std::string>());
        }

        if (root.contains("levels")) {
            if (!root.at("levels").is_array()) {
                throw std::runtime_error("levels must be an array");
            }
            config.levels.clear();
            std::set<int> seen;
            long long next = 1;  // INT_MAX之后的楼层号超出范围
            for (const auto& item : root.at("levels")) {
                LevelConfig level;
                // 未写楼层号时按顺序编号
                if (!item.is_object()) {
                    throw std::runtime_error("each level must be an object");
                }
                level.levelNumber = intValue(item, "levelNumber", next);
                level.regularCapacity = intValue(item, "regularCapacity", 0);
                level.evCapacity = intValue(item, "evCapacity", 0);

                if (level.regularCapacity < 0 || level.evCapacity < 0) {
                    throw std::runtime_error("level " + std::to_string(level.levelNumber)
                                             + " has a negative capacity");
                }
                if (!seen.insert(level.levelNumber).second) {
                    throw std::runtime_error("level " + std::to_string(level.levelNumber)
                                             + " is listed twice");
                }
                next = static_cast<long long>(level.levelNumber) + 1;
                config.levels.push_back(level);
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config " + source + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid config " + source + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config " + source + ": " + e.what());
    }

    return config;
}

ServerConfig loadServerConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        Logger::info("Config file " + path + " not found, using defaults");
        return ServerConfig{};
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parseServerConfig(text, path);
}
