#pragma once

#include <optional>
#include <variant>

namespace xlbind {
namespace range {

/**
 * @brief 切片，字段缺省时分别取 0 / 元素个数 / 1
 */
struct Slice {
    std::optional<long long> start;
    std::optional<long long> stop;
    std::optional<long long> step;

    Slice() = default;
    Slice(std::optional<long long> start_, std::optional<long long> stop_,
          std::optional<long long> step_ = std::nullopt)
        : start(start_), stop(stop_), step(step_) {}
};

/**
 * @brief 单个轴上的索引：一个位置或一个切片
 */
using AxisIndex = std::variant<long long, Slice>;

}} // namespace xlbind::range
