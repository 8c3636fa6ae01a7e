#pragma once

#include "xlbind/convert/ConvertedValue.hpp"
#include "xlbind/range/RangeOptions.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace xlbind {
namespace range {
class Range;
}

namespace convert {

/**
 * @brief 值转换器接口：宿主单元格 <-> 结构化值
 */
class IValueConverter {
public:
    virtual ~IValueConverter() = default;

    virtual ConvertedValue read(const range::Range& range, const range::RangeOptions& options) const = 0;

    virtual void write(const ConvertedValue& value, const range::Range& range,
                       const range::RangeOptions& options) const = 0;
};

/**
 * @brief 默认转换器
 *
 * 读取：
 * - 先逐格转换（空单元格 -> emptyValue，numberType，dateType），再按transpose转置；
 * - ndim=0：1x1返回标量，单行或单列返回Row，否则返回Matrix；
 * - ndim=1：单行或单列返回Row，否则抛 InvalidArgumentsException；
 * - ndim=2：总是返回Matrix。
 *
 * 写入（从区域左上角开始）：
 * - 标量写满整个区域；
 * - Row横向写入，transpose时纵向写入；
 * - Matrix按行写入，transpose时转置后写入；行长度不一致抛 InvalidArgumentsException。
 */
class DefaultConverter : public IValueConverter {
public:
    ConvertedValue read(const range::Range& range, const range::RangeOptions& options) const override;

    void write(const ConvertedValue& value, const range::Range& range,
               const range::RangeOptions& options) const override;

    /**
     * @brief 单个值按选项转换
     */
    static core::CellValue convertCell(const core::CellValue& value, const range::RangeOptions& options);

private:
    static Matrix transposed(const Matrix& matrix);
    static void writeMatrix(const Matrix& matrix, const range::Range& range);
};

/**
 * @brief 按名字登记的转换器，"default" 预先登记
 */
class ConverterRegistry {
public:
    ConverterRegistry();

    ConverterRegistry(const ConverterRegistry&) = delete;
    ConverterRegistry& operator=(const ConverterRegistry&) = delete;

    /**
     * @brief 登记转换器，同名时替换
     */
    void add(const std::string& name, std::unique_ptr<IValueConverter> converter);

    /**
     * @throws NotFoundException 没有该名字的转换器
     */
    const IValueConverter& get(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    std::map<std::string, std::unique_ptr<IValueConverter>> converters_;
};

}} // namespace xlbind::convert
