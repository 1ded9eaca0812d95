/**
 * @file search_strategy.h
 * @brief 车辆搜索策略与搜索器
 */
#pragma once
#include "parking_slot.h"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief 支持的搜索条件
 */
enum class SearchCriterion {
    Color,
    Make,
    Model,
    Registration
};

/**
 * @brief 获取搜索条件名称（color / make / model / registration）
 */
std::string searchCriterionName(SearchCriterion criterion);

/**
 * @brief 将名称解析为搜索条件（不区分大小写）
 * @throws ParkingException(UnknownCriterion) 不是四种条件之一
 */
SearchCriterion parseSearchCriterion(const std::string& name);

/**
 * @class SearchStrategy
 * @brief 车辆匹配谓词的抽象接口
 */
class SearchStrategy {
public:
    virtual ~SearchStrategy() = default;

    /**
     * @brief 判断车辆是否满足条件
     * @param vehicle 待检查的车辆
     * @param criterion 条件值
     */
    virtual bool match(const Vehicle& vehicle, const std::string& criterion) const = 0;

    virtual SearchCriterion criterion() const = 0;
};

// 颜色、品牌、型号按不区分大小写的完全相等匹配
class ColorStrategy : public SearchStrategy {
public:
    bool match(const Vehicle& vehicle, const std::string& criterion) const override;
    SearchCriterion criterion() const override { return SearchCriterion::Color; }
};

class MakeStrategy : public SearchStrategy {
public:
    bool match(const Vehicle& vehicle, const std::string& criterion) const override;
    SearchCriterion criterion() const override { return SearchCriterion::Make; }
};

class ModelStrategy : public SearchStrategy {
public:
    bool match(const Vehicle& vehicle, const std::string& criterion) const override;
    SearchCriterion criterion() const override { return SearchCriterion::Model; }
};

// 车牌号是标识符，区分大小写
class RegistrationStrategy : public SearchStrategy {
public:
    bool match(const Vehicle& vehicle, const std::string& criterion) const override;
    SearchCriterion criterion() const override { return SearchCriterion::Registration; }
};

/**
 * @brief 为搜索条件创建对应的策略
 */
std::unique_ptr<SearchStrategy> makeSearchStrategy(SearchCriterion criterion);

/**
 * @class VehicleSearcher
 * @brief 使用当前策略在车位序列上搜索车辆
 *
 * 策略可以在运行时替换
 */
class VehicleSearcher {
private:
    std::unique_ptr<SearchStrategy> strategy;

public:
    explicit VehicleSearcher(std::unique_ptr<SearchStrategy> initial);

    /**
     * @brief 替换当前策略
     * @throws std::invalid_argument 策略为空
     */
    void setStrategy(std::unique_ptr<SearchStrategy> newStrategy);

    const SearchStrategy& getStrategy() const { return *strategy; }

    /**
     * @brief 在车位序列中搜索
     * @param slots 按编号升序排列的车位
     * @param criterion 条件值
     * @return 匹配车位的编号（从1开始），按升序排列；空车位直接跳过
     */
    std::vector<int> search(const std::vector<ParkingSlot>& slots,
                            const std::string& criterion) const;
};
