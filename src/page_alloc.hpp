#pragma once

#include "buddy.hpp"
#include "physical_mem.hpp"
#include "raw_page.hpp"
#include "spin_lock.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <spdlog/logger.h>

/**
 * @brief 页框分配器能力，页表遍历与启动流程只依赖这个接口
 */
class PageAllocInterface {
public:
    using paddr_t = PhysicalMemoryInterface::paddr_t;
    using pfn_t = PhysicalMemoryInterface::pfn_t;

    virtual ~PageAllocInterface() = default;

    /**
     * @brief 分配2^order个连续页框
     * @return 块首页句柄，内存不足时返回std::nullopt
     */
    virtual std::optional<RawPageHandle> alloc_order(uint32_t order) = 0;
    // 句柄在此之后失效
    virtual void dealloc(RawPageHandle page) = 0;
    virtual bool has_management_over(RawPageHandle page) const = 0;

    // 句柄与绝对页框号之间的转换，窗口外的页框号会触发panic
    virtual pfn_t to_pfn(RawPageHandle page) const = 0;
    virtual RawPageHandle from_pfn(pfn_t pfn) const = 0;

    virtual std::atomic<size_t> &refcount(RawPageHandle page) = 0;
    virtual uint32_t order(RawPageHandle page) const = 0;
};

/**
 * @brief 全局buddy分配器：所有操作都在同一把锁内完成
 */
class BuddyPageAlloc : public PageAllocInterface {
public:
    using Buddy = BuddyAllocator<>;
    static constexpr uint32_t MAX_ORDER = Buddy::MAX_ORDER;

    explicit BuddyPageAlloc(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief 登记物理窗口[start, end)，必须在任何分配之前调用且只能调用一次
     */
    void create_pages(paddr_t start, paddr_t end);

    std::optional<RawPageHandle> alloc_order(uint32_t order) override;
    void dealloc(RawPageHandle page) override;
    bool has_management_over(RawPageHandle page) const override;
    pfn_t to_pfn(RawPageHandle page) const override;
    RawPageHandle from_pfn(pfn_t pfn) const override;
    std::atomic<size_t> &refcount(RawPageHandle page) override;
    uint32_t order(RawPageHandle page) const override;

    size_t get_usage() const;
    std::vector<pfn_t> free_blocks(uint32_t order) const;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    mutable Locked<Buddy> m_buddy;
};

/**
 * @brief 拥有一个已分配块的页句柄，引用计数归零时归还给分配器
 */
class Page {
public:
    using paddr_t = PhysicalMemoryInterface::paddr_t;
    using pfn_t = PhysicalMemoryInterface::pfn_t;
    static constexpr size_t PAGESIZE = PhysicalMemoryInterface::PAGESIZE;

    // 分配失败时panic
    static Page alloc_in(std::shared_ptr<PageAllocInterface> alloc, uint32_t order = 0);
    static std::optional<Page> try_alloc_in(
        std::shared_ptr<PageAllocInterface> alloc, uint32_t order = 0
    );

    /**
     * @brief 重新接管一个之前由into_raw()交出的页，不修改引用计数
     */
    static Page from_raw(std::shared_ptr<PageAllocInterface> alloc, RawPageHandle raw);

    Page(Page &&other) noexcept;
    Page &operator=(Page &&other) noexcept;
    Page(const Page &) = delete;
    Page &operator=(const Page &) = delete;
    ~Page();

    // 共享同一块内存，引用计数加一
    Page clone() const;

    /**
     * @brief 交出所有权，返回的句柄需要之后用from_raw()接管
     */
    RawPageHandle into_raw();

    RawPageHandle raw() const { return *m_raw; }
    pfn_t pfn() const { return m_alloc->to_pfn(*m_raw); }
    paddr_t start() const { return PhysicalMemoryInterface::addr_of(pfn()); }
    uint32_t order() const { return m_alloc->order(*m_raw); }
    size_t size() const { return PAGESIZE << order(); }
    size_t refcount() const { return m_alloc->refcount(*m_raw).load(); }
    bool valid() const { return m_raw.has_value(); }

private:
    Page(std::shared_ptr<PageAllocInterface> alloc, RawPageHandle raw)
        : m_alloc(std::move(alloc)), m_raw(raw) {}
    void release();

    std::shared_ptr<PageAllocInterface> m_alloc;
    std::optional<RawPageHandle> m_raw;
};
