#pragma once

#include "xlbind/host/IAutomation.hpp"
#include <map>
#include <vector>
#include <string>
#include <utility>
#include <cstddef>

namespace xlbind {
namespace host {

/**
 * @brief 进程内的宿主实现
 *
 * 支持多个实例、多个文档、公式（只保存公式文本和给定的计算结果）、
 * 定义名称、图形以及焦点顺序。单元调用计数用于验证区域扩展的探测次数。
 * 不是线程安全的。
 */
class MemoryAutomation : public IAutomation {
public:
    MemoryAutomation() = default;
    ~MemoryAutomation() override = default;

    MemoryAutomation(const MemoryAutomation&) = delete;
    MemoryAutomation& operator=(const MemoryAutomation&) = delete;

    // ========== IAutomation ==========

    std::vector<ApplicationInstance> listInstances() const override;
    std::vector<DocumentHandle> listDocuments(const ApplicationInstance& instance) const override;
    std::optional<ApplicationInstance> activeInstance() const override;
    std::optional<DocumentHandle> activeDocument(const ApplicationInstance& instance) const override;
    ApplicationInstance startInstance() override;
    DocumentHandle open(const ApplicationInstance& instance, const std::string& path) override;
    DocumentHandle create(const ApplicationInstance& instance) override;
    bool isAlive(const DocumentHandle& document) const override;

    std::vector<SheetRef> listSheets(const DocumentHandle& document) const override;
    SheetRef activeSheet(const DocumentHandle& document) const override;
    SheetRef addSheet(const DocumentHandle& document, const std::string& name,
                      const SheetPlacement& placement) override;
    bool isAlive(const SheetRef& sheet) const override;

    core::CellValue cellValue(const SheetRef& sheet, int32_t row, int32_t column) const override;
    std::string cellFormula(const SheetRef& sheet, int32_t row, int32_t column) const override;
    void setCellValue(const SheetRef& sheet, int32_t row, int32_t column,
                      const core::CellValue& value) override;
    int32_t rowCount(const SheetRef& sheet) const override;
    int32_t columnCount(const SheetRef& sheet) const override;

    std::optional<NamedReference> definedName(const DocumentHandle& document,
                                              const std::optional<SheetRef>& scope,
                                              const std::string& name) const override;
    std::vector<ShapeRef> listShapes(const SheetRef& sheet) const override;

    core::CellCoordinate endOf(const SheetRef& sheet, const core::CellCoordinate& from,
                               Direction direction) const override;

    // ========== 模拟宿主侧的操作 ==========

    /**
     * @brief 让实例获得焦点
     */
    void activate(const ApplicationInstance& instance);

    /**
     * @brief 让文档获得焦点（其所属实例同时成为活动实例）
     */
    void activate(const DocumentHandle& document);

    void activate(const SheetRef& sheet);

    /**
     * @brief 关闭文档，之后该文档及其工作表的句柄都失效
     */
    void close(const DocumentHandle& document);

    /**
     * @brief 退出实例，关闭其全部文档
     */
    void quit(const ApplicationInstance& instance);

    void deleteSheet(const SheetRef& sheet);

    /**
     * @brief 写入公式及其计算结果
     */
    void setCellFormula(const SheetRef& sheet, int32_t row, int32_t column,
                        const std::string& formula, const core::CellValue& computed);

    /**
     * @brief 定义名称
     * @param scope 为空时是文档级名称
     */
    void defineName(const DocumentHandle& document, const std::string& name,
                    const SheetRef& target, const core::Region& region,
                    const std::optional<SheetRef>& scope = std::nullopt);

    ShapeRef addShape(const SheetRef& sheet, ShapeKind kind, const std::string& name);

    // ========== 探测计数 ==========

    size_t cellReadCount() const { return cell_reads_; }
    size_t endOfCallCount() const { return end_of_calls_; }
    void resetCounters() const { cell_reads_ = 0; end_of_calls_ = 0; }

private:
    struct Cell {
        core::CellValue value;
        std::string formula;
    };

    struct Sheet {
        uint64_t id = 0;
        std::string name;
        std::map<std::pair<int32_t, int32_t>, Cell> cells;
        std::vector<std::pair<ShapeKind, std::string>> shapes;
    };

    struct Name {
        std::string name;
        std::optional<uint64_t> scope_sheet;
        uint64_t target_sheet = 0;
        core::Region region;
    };

    struct Document {
        uint64_t id = 0;
        std::string name;
        std::string full_path;
        std::vector<Sheet> sheets;
        uint64_t active_sheet = 0;
        std::vector<Name> names;
    };

    struct Instance {
        uint64_t id = 0;
        std::vector<Document> documents;
        std::vector<uint64_t> focus;  ///< 文档id，最近获得焦点的在末尾
    };

    Instance* findInstance(uint64_t id);
    const Instance* findInstance(uint64_t id) const;
    Document* findDocument(const DocumentHandle& handle);
    const Document* findDocument(const DocumentHandle& handle) const;
    Sheet* findSheet(const SheetRef& ref);
    const Sheet* findSheet(const SheetRef& ref) const;

    Instance& requireInstance(const ApplicationInstance& instance);
    const Instance& requireInstance(const ApplicationInstance& instance) const;
    Document& requireDocument(const DocumentHandle& handle);
    const Document& requireDocument(const DocumentHandle& handle) const;
    Sheet& requireSheet(const SheetRef& ref);
    const Sheet& requireSheet(const SheetRef& ref) const;

    DocumentHandle makeHandle(const Instance& instance, const Document& document) const;
    SheetRef makeRefAt(const DocumentHandle& handle, const Document& document, size_t position) const;
    SheetRef makeRefById(const DocumentHandle& handle, const Document& document, uint64_t sheet_id) const;
    Document& addDocument(Instance& instance, const std::string& name, const std::string& full_path);
    Sheet makeSheet(const std::string& name);

    static void touch(std::vector<uint64_t>& focus, uint64_t id);
    static void forget(std::vector<uint64_t>& focus, uint64_t id);

    std::vector<Instance> instances_;
    std::vector<uint64_t> instance_focus_;  ///< 实例id，最近获得焦点的在末尾
    uint64_t next_id_ = 1;
    int book_counter_ = 0;

    mutable size_t cell_reads_ = 0;
    mutable size_t end_of_calls_ = 0;
};

}} // namespace xlbind::host
