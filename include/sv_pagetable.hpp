#pragma once

#include "address.hpp"
#include "page_alloc.hpp"
#include "physical_mem.hpp"
#include "sv_pte.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <spdlog/logger.h>

/**
 * @brief SVxx 页表管理器（软件）
 * @note 利用页框分配器按需分配中间级页表，按给定粒度返回需要填写的页表项
 */
template <typename Trait> class SV_pagetable;

// 遍历结果：需要填写的页表项及其对应的虚拟地址
template <typename Trait> struct PteRef {
    uint64_t vaddr;
    PteSlot<Trait> pte;
};

/**
 * @brief 单向、惰性的页表项迭代器：解引用时才会分配缺失的中间级页表
 */
template <typename Trait> class PteIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = PteRef<Trait>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = PteRef<Trait>;

    PteIterator() = default;
    PteIterator(
        SV_pagetable<Trait> *table, uint64_t vaddr, uint64_t remaining, size_t depth,
        TableAttribute table_attr
    );

    PteRef<Trait> operator*() const;
    PteIterator &operator++();

    bool operator==(const PteIterator &other) const { return m_remaining == other.m_remaining; }
    bool operator!=(const PteIterator &other) const { return m_remaining != other.m_remaining; }

private:
    SV_pagetable<Trait> *m_table = nullptr;
    uint64_t m_vaddr = 0;
    uint64_t m_remaining = 0;
    size_t m_depth = 0;
    TableAttribute m_table_attr;
};

template <typename Trait> class PteRange {
public:
    PteRange(
        SV_pagetable<Trait> *table, uint64_t first, uint64_t count, size_t depth,
        TableAttribute table_attr
    )
        : m_table(table), m_first(first), m_count(count), m_depth(depth), m_table_attr(table_attr) {}

    PteIterator<Trait> begin() const {
        return PteIterator<Trait>(m_table, m_first, m_count, m_depth, m_table_attr);
    }
    PteIterator<Trait> end() const { return PteIterator<Trait>(); }

    // 需要填写的页表项个数，不会触发遍历
    uint64_t size() const { return m_count; }
    bool empty() const { return m_count == 0; }
    uint64_t page_size() const { return Trait::LEVEL[m_depth - 1].page_size(); }

private:
    SV_pagetable<Trait> *m_table;
    uint64_t m_first;
    uint64_t m_count;
    size_t m_depth;
    TableAttribute m_table_attr;
};

template <typename Trait> class SV_pagetable {
public:
    using paddr_t = PhysicalMemoryInterface::paddr_t;
    using pfn_t = PhysicalMemoryInterface::pfn_t;
    using vaddr_t = typename Trait::vaddr_t;
    using pte_t = typename Trait::pte_t;
    static constexpr int LEVELS = Trait::LEVELS;
    static constexpr size_t PAGESIZE = PhysicalMemoryInterface::PAGESIZE;
    // 内核页表的中间级页表项属性
    static constexpr TableAttribute KERNEL_TABLE_ATTR = TableFlag::PRESENT | TableFlag::GLOBAL;

    /**
     * @brief 创建根页表
     * @param alloc 用于分配根页表与各级中间页表的分配器
     * @param pmem 页表所在的物理内存
     * @note 分配失败时panic
     */
    static SV_pagetable create(
        std::shared_ptr<PageAllocInterface> alloc, std::shared_ptr<PhysicalMemoryInterface> pmem,
        std::shared_ptr<spdlog::logger> logger = nullptr
    );

    // root会被清零
    SV_pagetable(
        Page root, std::shared_ptr<PageAllocInterface> alloc,
        std::shared_ptr<PhysicalMemoryInterface> pmem,
        std::shared_ptr<spdlog::logger> logger = nullptr
    );
    SV_pagetable(SV_pagetable &&other) noexcept = default;
    SV_pagetable &operator=(SV_pagetable &&) = delete;
    SV_pagetable(const SV_pagetable &) = delete;
    SV_pagetable &operator=(const SV_pagetable &) = delete;
    ~SV_pagetable();

    paddr_t addr() const { return m_root.start(); }
    pfn_t root_pfn() const { return m_root.pfn(); }
    bool valid() const { return m_root.valid(); }

    /**
     * @brief 以最小粒度（4KiB）遍历range
     */
    PteRange<Trait> iter_kernel(VRange range) { return iter_kernel_levels(range, LEVELS); }

    /**
     * @brief 遍历range，只下降Trait::LEVEL的前depth级
     * @param range 要映射的虚拟地址区间，向外对齐到第depth级的页大小
     * @param depth 下降的级数(1..LEVELS)，越小得到的页越大
     * @return 每个大小为LEVEL[depth-1].page_size()的页对应一个页表项，区间为空时不返回任何项
     */
    PteRange<Trait> iter_kernel_levels(VRange range, size_t depth);

    /**
     * @brief 为vaddr下降depth级，缺失的中间级页表会被分配、清零并以table_attr安装
     * @return 第depth级中vaddr对应的页表项
     * @note 中间级页表分配失败时panic
     */
    PteSlot<Trait> walk(vaddr_t vaddr, size_t depth, TableAttribute table_attr = KERNEL_TABLE_ATTR);

    /**
     * @brief 销毁所有中间级页表与根页表，归还给分配器；不释放叶子项映射的页
     */
    void destroy();

    // 当前持有的中间级页表页数（不含根页表）
    size_t table_pages() const { return m_table_pages; }

private:
    Page m_root;
    std::shared_ptr<PageAllocInterface> m_alloc;
    std::shared_ptr<PhysicalMemoryInterface> m_pmem;
    std::shared_ptr<spdlog::logger> m_logger;
    size_t m_table_pages = 0;

    // 销毁一个页表，递归销毁所有下级页表；level为Trait::LEVEL中的下标
    void destroy_one_level(paddr_t ptaddr, int level);
};
