/**
 * @file parking_error.h
 * @brief 停车场核心的错误分类与异常类型
 */
#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief 错误码
 *
 * 所有核心操作失败时都通过 ParkingException 同步抛给直接调用者，
 * 由表现层（HTTP接口）负责翻译成用户可见的信息
 */
enum class ParkingErrorCode {
    InvalidInput,      // 参数非法（负容量、空车牌、重复楼层等）
    LevelNotFound,     // 指定的楼层不存在
    Full,              // 没有对应类型的空闲车位
    NotFound,          // 车位不存在或车位为空
    UnknownCriterion   // 不支持的搜索条件
};

/**
 * @brief 获取错误码的名称
 */
const char* parkingErrorName(ParkingErrorCode code);

/**
 * @class ParkingException
 * @brief 携带错误码的异常
 */
class ParkingException : public std::runtime_error {
private:
    ParkingErrorCode errorCode;

public:
    ParkingException(ParkingErrorCode code, const std::string& message)
        : std::runtime_error(message), errorCode(code) {}

    ParkingErrorCode code() const noexcept { return errorCode; }
};
