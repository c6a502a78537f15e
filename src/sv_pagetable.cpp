#include "sv_pagetable.hpp"
#include "panic.hpp"
#include "sv39.hpp"
#include "sv48.hpp"
#include <spdlog/spdlog.h>
#include <utility>

template <typename Trait>
PteIterator<Trait>::PteIterator(
    SV_pagetable<Trait> *table, uint64_t vaddr, uint64_t remaining, size_t depth,
    TableAttribute table_attr
)
    : m_table(table), m_vaddr(vaddr), m_remaining(remaining), m_depth(depth),
      m_table_attr(table_attr) {}

template <typename Trait> PteRef<Trait> PteIterator<Trait>::operator*() const {
    BOOTMM_ASSERT(m_remaining > 0, "Dereferencing an exhausted {} PTE iterator", Trait::NAME);
    return PteRef<Trait>{m_vaddr, m_table->walk(m_vaddr, m_depth, m_table_attr)};
}

template <typename Trait> PteIterator<Trait> &PteIterator<Trait>::operator++() {
    BOOTMM_ASSERT(m_remaining > 0, "Advancing an exhausted {} PTE iterator", Trait::NAME);
    m_vaddr += Trait::LEVEL[m_depth - 1].page_size();
    m_remaining--;
    return *this;
}

template <typename Trait>
SV_pagetable<Trait> SV_pagetable<Trait>::create(
    std::shared_ptr<PageAllocInterface> alloc, std::shared_ptr<PhysicalMemoryInterface> pmem,
    std::shared_ptr<spdlog::logger> logger
) {
    Page root = Page::alloc_in(alloc);
    return SV_pagetable(std::move(root), std::move(alloc), std::move(pmem), std::move(logger));
}

template <typename Trait>
SV_pagetable<Trait>::SV_pagetable(
    Page root, std::shared_ptr<PageAllocInterface> alloc,
    std::shared_ptr<PhysicalMemoryInterface> pmem, std::shared_ptr<spdlog::logger> logger
)
    : m_root(std::move(root)), m_alloc(std::move(alloc)), m_pmem(std::move(pmem)),
      m_logger(logger ? logger : spdlog::default_logger()) {
    BOOTMM_ASSERT(
        m_pmem->fill(m_root.start(), 0, PAGESIZE) == 0,
        "Failed to reset {} root pagetable at PMEM 0x{:x}", Trait::NAME, m_root.start()
    );
    SPDLOG_LOGGER_DEBUG(m_logger, "{} root pagetable at 0x{:x}", Trait::NAME, m_root.start());
}

template <typename Trait> SV_pagetable<Trait>::~SV_pagetable() {
    if (m_root.valid()) {
        destroy();
    }
}

template <typename Trait>
PteRange<Trait> SV_pagetable<Trait>::iter_kernel_levels(VRange range, size_t depth) {
    BOOTMM_ASSERT(
        depth >= 1 && depth <= static_cast<size_t>(LEVELS), "Invalid {} page table depth {}",
        Trait::NAME, depth
    );
    if (range.empty()) {
        return PteRange<Trait>(this, range.start, 0, depth, KERNEL_TABLE_ATTR);
    }
    const uint64_t page_size = Trait::LEVEL[depth - 1].page_size();
    const uint64_t last = range.start + (range.size - 1);
    BOOTMM_ASSERT(
        last >= range.start, "{} range 0x{:x} + 0x{:x} wraps around", Trait::NAME, range.start,
        range.size
    );
    const uint64_t first = align_down(range.start, page_size);
    const uint64_t count = (align_down(last, page_size) - first) / page_size + 1;
    return PteRange<Trait>(this, first, count, depth, KERNEL_TABLE_ATTR);
}

template <typename Trait>
PteSlot<Trait> SV_pagetable<Trait>::walk(vaddr_t vaddr, size_t depth, TableAttribute table_attr) {
    BOOTMM_ASSERT(m_root.valid(), "{} pagetable used after destroy", Trait::NAME);
    BOOTMM_ASSERT(
        depth >= 1 && depth <= static_cast<size_t>(LEVELS), "Invalid {} page table depth {}",
        Trait::NAME, depth
    );
    BOOTMM_ASSERT(
        is_canonical<Trait>(vaddr), "Non-canonical {} address 0x{:x}", Trait::NAME, vaddr
    );
    BOOTMM_ASSERT(
        table_attr.contains(TableFlag::PRESENT), "Table descriptors must be present"
    );

    paddr_t ptaddr = addr();
    for (size_t i = 0; i + 1 < depth; i++) {
        const PageTableLevel &level = Trait::LEVEL[i];
        PteSlot<Trait> slot(*m_pmem, ptaddr + level.index_of(vaddr) * sizeof(pte_t));
        auto [pfn, attr] = slot.get();
        if (!attr.as_table_attr().contains(TableFlag::PRESENT)) {
            // need to create new 4kB pagetable
            std::optional<Page> page = Page::try_alloc_in(m_alloc);
            BOOTMM_ASSERT(
                page.has_value(), "Failed to allocate {} pagetable for vaddr 0x{:x}", Trait::NAME,
                vaddr
            );
            BOOTMM_ASSERT(
                m_pmem->fill(page->start(), 0, PAGESIZE) == 0,
                "Failed to reset newly allocated pagetable at PMEM 0x{:x}", page->start()
            );
            pfn = page->pfn();
            // owned by this table from now on, released in destroy()
            page->into_raw();
            slot.set(pfn, RawAttribute::from_table_attr(table_attr));
            m_table_pages++;
            SPDLOG_LOGGER_DEBUG(
                m_logger, "{} level {} table for 0x{:x} at PFN 0x{:x}", Trait::NAME, i + 1, vaddr,
                pfn
            );
        }
        ptaddr = PhysicalMemoryInterface::addr_of(pfn);
    }
    const PageTableLevel &leaf = Trait::LEVEL[depth - 1];
    return PteSlot<Trait>(*m_pmem, ptaddr + leaf.index_of(vaddr) * sizeof(pte_t));
}

template <typename Trait> void SV_pagetable<Trait>::destroy_one_level(paddr_t ptaddr, int level) {
    const PageTableLevel &desc = Trait::LEVEL[level];
    for (uint32_t index = 0; index < desc.entries(); index++) {
        PteSlot<Trait> slot(*m_pmem, ptaddr + index * sizeof(pte_t));
        auto [pfn, attr] = slot.get();
        DecodedAttribute decoded = attr.decode();
        if (!std::holds_alternative<TableAttribute>(decoded)) {
            continue; // non-valid pte or leaf, nothing owned
        }
        BOOTMM_ASSERT(
            level + 1 < LEVELS, "{} PTE at 0x{:x} points to a non-exist next level pagetable",
            Trait::NAME, slot.addr()
        );
        destroy_one_level(PhysicalMemoryInterface::addr_of(pfn), level + 1);
        slot.set(0, RawAttribute::null());
        // dropping the page returns it to the allocator
        Page table = Page::from_raw(m_alloc, m_alloc->from_pfn(pfn));
        BOOTMM_ASSERT(m_table_pages > 0, "{} pagetable page count underflow", Trait::NAME);
        m_table_pages--;
    }
}

template <typename Trait> void SV_pagetable<Trait>::destroy() {
    BOOTMM_ASSERT(m_root.valid(), "{} pagetable destroyed twice", Trait::NAME);
    destroy_one_level(addr(), 0);
    Page root = std::move(m_root);
}

template class PteIterator<SV39_Trait>;
template class PteIterator<SV48_Trait>;
template class SV_pagetable<SV39_Trait>;
template class SV_pagetable<SV48_Trait>;
