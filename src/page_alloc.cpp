#include "page_alloc.hpp"
#include "panic.hpp"
#include <spdlog/spdlog.h>
#include <utility>

BuddyPageAlloc::BuddyPageAlloc(std::shared_ptr<spdlog::logger> logger)
    : m_logger(logger ? logger : spdlog::default_logger()), m_buddy(m_logger) {}

void BuddyPageAlloc::create_pages(paddr_t start, paddr_t end) {
    m_buddy.lock()->create_pages(start, end);
}

std::optional<RawPageHandle> BuddyPageAlloc::alloc_order(uint32_t order) {
    std::optional<RawPageHandle> page = m_buddy.lock()->alloc_order(order);
    if (page) {
        SPDLOG_LOGGER_DEBUG(m_logger, "allocated: {} (order {})", page->index, order);
    } else {
        SPDLOG_LOGGER_DEBUG(m_logger, "allocation of order {} failed", order);
    }
    return page;
}

void BuddyPageAlloc::dealloc(RawPageHandle page) {
    m_buddy.lock()->dealloc(page);
    SPDLOG_LOGGER_DEBUG(m_logger, "freed: {}", page.index);
}

bool BuddyPageAlloc::has_management_over(RawPageHandle page) const {
    return m_buddy.lock()->has_management_over(page);
}

BuddyPageAlloc::pfn_t BuddyPageAlloc::to_pfn(RawPageHandle page) const {
    return m_buddy.lock()->to_pfn(page);
}

RawPageHandle BuddyPageAlloc::from_pfn(pfn_t pfn) const { return m_buddy.lock()->from_pfn(pfn); }

std::atomic<size_t> &BuddyPageAlloc::refcount(RawPageHandle page) {
    // the record itself never moves, only its free-list links are guarded
    return m_buddy.lock()->page(page).refcount;
}

uint32_t BuddyPageAlloc::order(RawPageHandle page) const {
    return m_buddy.lock()->page(page).order;
}

size_t BuddyPageAlloc::get_usage() const { return m_buddy.lock()->get_usage(); }

std::vector<BuddyPageAlloc::pfn_t> BuddyPageAlloc::free_blocks(uint32_t order) const {
    return m_buddy.lock()->free_blocks(order);
}

Page Page::alloc_in(std::shared_ptr<PageAllocInterface> alloc, uint32_t order) {
    std::optional<Page> page = try_alloc_in(std::move(alloc), order);
    BOOTMM_ASSERT(page.has_value(), "Out of memory allocating a page of order {}", order);
    return std::move(*page);
}

std::optional<Page> Page::try_alloc_in(std::shared_ptr<PageAllocInterface> alloc, uint32_t order) {
    std::optional<RawPageHandle> raw = alloc->alloc_order(order);
    if (!raw) {
        return std::nullopt;
    }
    alloc->refcount(*raw).store(1);
    return Page(std::move(alloc), *raw);
}

Page Page::from_raw(std::shared_ptr<PageAllocInterface> alloc, RawPageHandle raw) {
    BOOTMM_ASSERT(
        alloc->refcount(raw).load() > 0, "Taking over page {} that has no owner", raw.index
    );
    return Page(std::move(alloc), raw);
}

Page::Page(Page &&other) noexcept
    : m_alloc(std::move(other.m_alloc)), m_raw(std::exchange(other.m_raw, std::nullopt)) {}

Page &Page::operator=(Page &&other) noexcept {
    if (this != &other) {
        release();
        m_alloc = std::move(other.m_alloc);
        m_raw = std::exchange(other.m_raw, std::nullopt);
    }
    return *this;
}

Page::~Page() { release(); }

Page Page::clone() const {
    BOOTMM_ASSERT(m_raw.has_value(), "Cloning an empty page");
    m_alloc->refcount(*m_raw).fetch_add(1);
    return Page(m_alloc, *m_raw);
}

RawPageHandle Page::into_raw() {
    BOOTMM_ASSERT(m_raw.has_value(), "Releasing an empty page");
    return *std::exchange(m_raw, std::nullopt);
}

void Page::release() {
    if (!m_raw) {
        return;
    }
    RawPageHandle raw = *std::exchange(m_raw, std::nullopt);
    if (m_alloc->refcount(raw).fetch_sub(1) == 1 && m_alloc->has_management_over(raw)) {
        m_alloc->dealloc(raw);
    }
}
