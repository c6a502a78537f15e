#include "buddy.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

template <uint32_t max_order_>
BuddyAllocator<max_order_>::BuddyAllocator(std::shared_ptr<spdlog::logger> logger)
    : m_logger(logger ? logger : spdlog::default_logger()) {}

template <uint32_t max_order_>
void BuddyAllocator<max_order_>::push_free(uint32_t index, uint32_t order) {
    RawPage &raw = m_pages.at(index);
    raw.free = true;
    raw.buddy = true;
    raw.order = order;
    m_free_lists[order].push_front(m_pages, index);
}

template <uint32_t max_order_>
void BuddyAllocator<max_order_>::create_pages(paddr_t start, paddr_t end) {
    BOOTMM_ASSERT(!m_registered, "create_pages called twice");
    BOOTMM_ASSERT(
        start % PAGESIZE == 0 && end % PAGESIZE == 0 && start < end,
        "Invalid physical window [0x{:x}, 0x{:x})", start, end
    );
    const pfn_t start_pfn = PhysicalMemoryInterface::pfn_of(start);
    const pfn_t end_pfn = PhysicalMemoryInterface::pfn_of(end);
    BOOTMM_ASSERT(
        end_pfn - start_pfn <= MAX_PAGES, "Physical window of {} pages exceeds capacity {}",
        end_pfn - start_pfn, MAX_PAGES
    );

    m_registered = true;
    m_base_pfn = start_pfn;
    m_window_pages = static_cast<uint32_t>(end_pfn - start_pfn);

    pfn_t pfn = start_pfn;
    while (pfn < end_pfn) {
        uint32_t order = MAX_ORDER;
        while (pfn % (pfn_t(1) << order) != 0 || pfn + (pfn_t(1) << order) > end_pfn) {
            order--;
        }
        push_free(static_cast<uint32_t>(pfn - m_base_pfn), order);
        pfn += pfn_t(1) << order;
    }
    m_logger->debug(
        "buddy: managing [0x{:x}, 0x{:x}), {} pages", start, end, m_window_pages
    );
}

template <uint32_t max_order_>
std::optional<RawPageHandle> BuddyAllocator<max_order_>::alloc_order(const uint32_t order) {
    BOOTMM_ASSERT(m_registered, "alloc_order called before create_pages");
    if (order > MAX_ORDER) return std::nullopt;

    uint32_t current_order = order;
    while (current_order <= MAX_ORDER && m_free_lists[current_order].empty()) {
        current_order++;
    }
    if (current_order > MAX_ORDER) return std::nullopt;

    std::optional<uint32_t> block = m_free_lists[current_order].pop_front(m_pages);
    BOOTMM_ASSERT(block.has_value(), "Free list of order {} is corrupted", current_order);
    RawPage &head = m_pages.at(*block);
    BOOTMM_ASSERT(
        head.free && head.buddy && head.order == current_order,
        "Free list of order {} holds a non-free page {}", current_order, *block
    );
    while (current_order > order) {
        current_order--;
        push_free(*block + (1u << current_order), current_order);
    }
    head.free = false;
    head.order = order;
    m_elem_usage += (size_t(1) << order);
    return RawPageHandle{*block};
}

template <uint32_t max_order_> void BuddyAllocator<max_order_>::dealloc(RawPageHandle page) {
    BOOTMM_ASSERT(has_management_over(page), "Page index out of range: {}", page.index);
    RawPage &raw = m_pages.at(page.index);
    BOOTMM_ASSERT(raw.buddy, "Page {} is not the head of a block", page.index);
    BOOTMM_ASSERT(!raw.free, "Double free of page {}", page.index);
    BOOTMM_ASSERT(
        raw.refcount.load() == 0, "Page {} freed with refcount {}", page.index, raw.refcount.load()
    );

    const uint32_t order = raw.order;
    uint32_t cur_order = order;
    pfn_t pfn = m_base_pfn + page.index;
    while (cur_order < MAX_ORDER) {
        pfn_t buddy_pfn = get_buddy_pfn(pfn, cur_order);
        if (buddy_pfn < m_base_pfn || buddy_pfn - m_base_pfn >= m_window_pages) {
            break;
        }
        uint32_t buddy = static_cast<uint32_t>(buddy_pfn - m_base_pfn);
        RawPage &buddy_raw = m_pages.at(buddy);
        if (!buddy_raw.free || !buddy_raw.buddy || buddy_raw.order != cur_order) {
            break;
        }
        m_free_lists[cur_order].remove(m_pages, buddy);
        // the higher half stops being a head
        RawPage &upper = m_pages.at(static_cast<uint32_t>(std::max(pfn, buddy_pfn) - m_base_pfn));
        upper.free = false;
        upper.buddy = false;
        if (buddy_pfn < pfn) pfn = buddy_pfn;
        cur_order++;
    }
    push_free(static_cast<uint32_t>(pfn - m_base_pfn), cur_order);
    BOOTMM_ASSERT(m_elem_usage >= (size_t(1) << order), "Buddy usage counter underflow");
    m_elem_usage -= (size_t(1) << order);
}

template <uint32_t max_order_>
std::vector<typename BuddyAllocator<max_order_>::pfn_t>
BuddyAllocator<max_order_>::free_blocks(uint32_t order) const {
    std::vector<pfn_t> blocks;
    if (order > MAX_ORDER) return blocks;
    m_free_lists[order].for_each(m_pages, [&](uint32_t index) {
        blocks.push_back(m_base_pfn + index);
    });
    return blocks;
}

template class BuddyAllocator<>;
