/**
 * @file logger.h
 * @brief 简单的线程安全日志器
 */
#pragma once
#include <string>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @class Logger
 * @brief 进程级日志器
 *
 * 输出格式：YYYY-mm-dd HH:MM:SS [LEVEL] message，写入标准错误流。
 * 低于当前级别的消息直接丢弃，输出时使用互斥锁保证行不交错
 */
class Logger {
private:
    static LogLevel currentLevel;
    static std::mutex logMutex;

    static const char* getLevelString(LogLevel level);

public:
    static void log(LogLevel level, const std::string& message);

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }

    static void setLogLevel(LogLevel level);
    static LogLevel getLogLevel();
};

/**
 * @brief 将级别名称解析为日志级别（不区分大小写）
 * @param name debug / info / warning / error
 * @throws std::invalid_argument 名称无法识别
 */
LogLevel parseLogLevel(const std::string& name);
