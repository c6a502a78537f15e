#pragma once
#include "physical_mem.hpp"
#include "raw_page.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <spdlog/logger.h>
#include <vector>

/**
 * @brief 基于页元数据数组的buddy页框分配器
 * @note 本身不加锁，由BuddyPageAlloc通过Locked<>串行化访问
 */
template <uint32_t max_order_ = 10> class BuddyAllocator {
public:
    using paddr_t = PhysicalMemoryInterface::paddr_t;
    using pfn_t = PhysicalMemoryInterface::pfn_t;
    static constexpr uint32_t MAX_ORDER = max_order_;
    static constexpr size_t MAX_PAGES = size_t(1) << MAX_ORDER;
    static constexpr size_t PAGESIZE = PhysicalMemoryInterface::PAGESIZE;

    explicit BuddyAllocator(std::shared_ptr<spdlog::logger> logger = nullptr);
    BuddyAllocator(const BuddyAllocator &) = delete;
    BuddyAllocator &operator=(const BuddyAllocator &) = delete;

    /**
     * @brief 登记由本分配器管理的物理地址窗口，只能调用一次
     * @param start 窗口起始物理地址（页对齐）
     * @param end 窗口结束物理地址（不含，页对齐）
     * @note 每个页框按能对齐且不越过end的最大阶放入空闲链表
     */
    void create_pages(paddr_t start, paddr_t end);

    /**
     * @brief 分配一个2^order页大小的块
     * @param order 指定块的阶（页数为2^order）
     * @return 成功时返回块首页的句柄，没有足够大的空闲块时返回std::nullopt
     * @note 不修改引用计数
     */
    std::optional<RawPageHandle> alloc_order(uint32_t order);

    /**
     * @brief 释放一个已分配的块，并与空闲的buddy块合并
     * @param page 块首页的句柄，必须由alloc_order返回且未被释放
     */
    void dealloc(RawPageHandle page);

    /**
     * @brief 句柄指向的页框是否位于本分配器管理的窗口内
     */
    bool has_management_over(RawPageHandle page) const {
        return m_registered && page.index < m_window_pages;
    }

    pfn_t to_pfn(RawPageHandle page) const {
        BOOTMM_ASSERT(has_management_over(page), "Page index out of range: {}", page.index);
        return m_base_pfn + page.index;
    }
    RawPageHandle from_pfn(pfn_t pfn) const {
        BOOTMM_ASSERT(
            m_registered && pfn >= m_base_pfn && pfn - m_base_pfn < m_window_pages,
            "PFN out of range: 0x{:x}", pfn
        );
        return RawPageHandle{static_cast<uint32_t>(pfn - m_base_pfn)};
    }

    RawPage &page(RawPageHandle page) { return m_pages.at(page.index); }
    const RawPage &page(RawPageHandle page) const { return m_pages.at(page.index); }

    bool is_registered() const { return m_registered; }
    size_t window_pages() const { return m_window_pages; }

    /**
     * @brief 获取已分配出的内存大小
     * @return 已分配出的物理内存大小，单位为字节
     */
    size_t get_usage() const { return m_elem_usage * PAGESIZE; }

    // 某一阶空闲链表上各块的首页PFN，按链表顺序
    std::vector<pfn_t> free_blocks(uint32_t order) const;

private:
    PageMetadataStore<MAX_PAGES> m_pages;
    // m_free_lists[i] 存放大小为2^i页的空闲块
    FreeList<MAX_PAGES> m_free_lists[MAX_ORDER + 1];
    std::shared_ptr<spdlog::logger> m_logger;

    bool m_registered = false;
    pfn_t m_base_pfn = 0;
    uint32_t m_window_pages = 0;
    size_t m_elem_usage = 0;

    void push_free(uint32_t index, uint32_t order);

    /**
     * @brief 根据 buddy 系统规则，计算 buddy 块的PFN
     */
    static pfn_t get_buddy_pfn(pfn_t pfn, uint32_t order) { return pfn ^ (pfn_t(1) << order); }
};
