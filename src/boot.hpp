#pragma once

#include "boot_config.hpp"
#include "console.hpp"
#include "device_tree.hpp"
#include "hart.hpp"
#include "page_alloc.hpp"
#include "physical_mem.hpp"
#include "sv_pagetable.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/logger.h>
#include <vector>

enum class BootState {
    UNINITIALIZED,
    WINDOW_REGISTERED,
    ROOT_TABLE_ALLOCATED,
    MAPPINGS_INSTALLED,
    TRANSLATION_ACTIVE,
    SERVING,
};

const char *boot_state_name(BootState state);

/**
 * @brief 启动流程：登记物理窗口 -> 分配根页表 -> 建立内核映射 -> 切换satp -> 回显循环
 * @note 状态只能线性前进，任何一步在错误的状态下调用都会panic
 */
template <typename Trait> class BootSequencer {
public:
    using paddr_t = PhysicalMemoryInterface::paddr_t;
    using pfn_t = PhysicalMemoryInterface::pfn_t;
    using vaddr_t = typename Trait::vaddr_t;
    static constexpr size_t PAGESIZE = PhysicalMemoryInterface::PAGESIZE;
    static constexpr int LEVELS = Trait::LEVELS;

    // 每个映射实际填写的叶子项个数
    struct MappingStats {
        size_t identity = 0;
        size_t phys_map = 0;
        size_t mmio = 0;
        size_t kimage = 0;
    };

    BootSequencer(
        BootConfig config, std::shared_ptr<PhysicalMemoryInterface> pmem,
        std::shared_ptr<BuddyPageAlloc> alloc, std::shared_ptr<ConsoleInterface> console,
        std::shared_ptr<spdlog::logger> logger = nullptr
    );

    // 把[window_start, window_end)交给buddy分配器
    void register_window();

    void allocate_root_table();

    /**
     * @brief 建立切换satp之后立即需要的全部映射
     * @note 叶子项属性为R|W|X|G|V，UART页不可执行
     */
    void install_mappings();

    /**
     * @brief 写satp并刷新TLB，此后不可回退
     * @note 当前执行代码的地址(boot_pc)未被映射时panic
     */
    void activate_translation(TranslationControl &hart);

    /**
     * @brief 启动其他hart：安装同一个根页表并刷新它的TLB
     * @note 只能在activate_translation()之后调用
     */
    void start_secondary(TranslationControl &hart);

    /**
     * @brief 回显循环：读一行，经虚拟地址上的行缓冲区转一遍后打印
     * @param hart 已经开启分页的hart
     * @note 输入不是合法UTF-8时panic；控制台关闭时返回
     */
    void serve(SimHart &hart);

    /**
     * @brief 从设备树统计hart个数，没有设备树时为1
     */
    size_t count_harts(DeviceTreeQuery *dt) const;

    // 完整的启动流程，最后进入serve()
    void run(SimHart &boot_hart, const std::vector<TranslationControl *> &secondaries = {});

    BootState state() const { return m_state; }
    const BootConfig &config() const { return m_config; }
    const MappingStats &mapping_stats() const { return m_stats; }
    // 行缓冲区的虚拟地址：内核镜像高地址映射的最后几页
    vaddr_t line_buffer_vaddr() const;

    SV_pagetable<Trait> &page_table();

private:
    BootConfig m_config;
    std::shared_ptr<PhysicalMemoryInterface> m_pmem;
    std::shared_ptr<BuddyPageAlloc> m_alloc;
    std::shared_ptr<ConsoleInterface> m_console;
    std::shared_ptr<spdlog::logger> m_logger;
    BootState m_state = BootState::UNINITIALIZED;
    std::optional<SV_pagetable<Trait>> m_table;
    MappingStats m_stats;

    void expect_state(BootState expected, const char *step) const;
    void advance(BootState next);

    /**
     * @brief 以第depth级的页大小映射range，第i个页映射到first_pfn + i * 每页页框数
     * @return 填写的页表项个数
     */
    size_t map_range(VRange range, size_t depth, pfn_t first_pfn, PageAttribute attr);
};
