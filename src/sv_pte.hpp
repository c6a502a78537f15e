#pragma once

#include "page_attr.hpp"
#include "panic.hpp"
#include "physical_mem.hpp"
#include <cstdint>
#include <utility>
#include <variant>

// 位操作工具函数
// 从data中提取给定位域range范围的值
constexpr uint64_t bits_extract(uint64_t data, std::pair<uint8_t, uint8_t> range) {
    const uint8_t width = range.first - range.second + 1;
    const uint64_t mask = (width == 64) ? ~0ull : (1ull << width) - 1;
    return (data >> range.second) & mask;
}
// 将data_raw中给定位域range范围的值设置为value
constexpr uint64_t bits_set(uint64_t value, std::pair<uint8_t, uint8_t> range, uint64_t data = 0ull) {
    const uint8_t width = range.first - range.second + 1;
    const uint64_t mask = (width == 64) ? ~0ull : (1ull << width) - 1;
    return (data & ~(mask << range.second)) | ((value & mask) << range.second);
}

/**
 * @brief 页表的一级：虚拟地址中索引字段的起始位与位数
 */
struct PageTableLevel {
    uint8_t shift;
    uint8_t bits;

    // 本级一个页表项覆盖的字节数
    constexpr uint64_t page_size() const { return uint64_t(1) << shift; }
    constexpr uint32_t entries() const { return uint32_t(1) << bits; }
    constexpr uint32_t index_of(uint64_t vaddr) const {
        return static_cast<uint32_t>((vaddr >> shift) & (entries() - 1));
    }
};

// 各级按根到叶排列、首尾相接，且与页内偏移一起恰好覆盖VA_BITS
template <typename Trait> constexpr bool levels_well_formed() {
    unsigned covered = 12;
    for (int i = 0; i < Trait::LEVELS; i++) {
        covered += Trait::LEVEL[i].bits;
        if (i + 1 < Trait::LEVELS &&
            Trait::LEVEL[i].shift != Trait::LEVEL[i + 1].shift + Trait::LEVEL[i + 1].bits) {
            return false;
        }
    }
    return covered == Trait::VA_BITS && Trait::LEVEL[Trait::LEVELS - 1].shift == 12;
}

struct NotPresent {
    bool operator==(const NotPresent &) const { return true; }
};

// 解码结果：无效项、指向下一级页表的项、叶子项
using DecodedAttribute = std::variant<NotPresent, TableAttribute, PageAttribute>;

/**
 * @brief 页表项低10位的属性字段（V/R/W/X/U/G/A/D 与两位RSW）
 */
class RawAttribute {
public:
    using raw_t = uint64_t;
    static constexpr raw_t PA_V = 1u << 0;
    static constexpr raw_t PA_R = 1u << 1;
    static constexpr raw_t PA_W = 1u << 2;
    static constexpr raw_t PA_X = 1u << 3;
    static constexpr raw_t PA_U = 1u << 4;
    static constexpr raw_t PA_G = 1u << 5;
    static constexpr raw_t PA_A = 1u << 6;
    static constexpr raw_t PA_D = 1u << 7;
    static constexpr raw_t PA_COW = 1u << 8;  // RSW[0]
    static constexpr raw_t PA_MMAP = 1u << 9; // RSW[1]
    static constexpr raw_t PA_RWX = PA_R | PA_W | PA_X;
    static constexpr raw_t MASK = 0x3ff;

    constexpr RawAttribute() : m_raw(0) {}
    explicit constexpr RawAttribute(raw_t raw) : m_raw(raw) {}
    static constexpr RawAttribute null() { return RawAttribute(); }

    constexpr raw_t raw() const { return m_raw; }
    constexpr bool is_valid() const { return (m_raw & PA_V) != 0; }
    constexpr bool is_leaf() const { return (m_raw & PA_RWX) != 0; }

    /**
     * @brief 按指向下一级页表的项解释
     * @note 含R/W/X任一位时panic
     */
    TableAttribute as_table_attr() const;

    /**
     * @brief 按叶子项解释
     * @note R/W/X全为0时panic
     */
    PageAttribute as_page_attr() const;

    // 根据R/W/X与V位区分三种页表项
    DecodedAttribute decode() const;

    static RawAttribute from_table_attr(TableAttribute attr);
    // attr中R/W/X全为0时panic
    static RawAttribute from_page_attr(PageAttribute attr);

    constexpr bool operator==(RawAttribute other) const { return m_raw == other.m_raw; }
    constexpr bool operator!=(RawAttribute other) const { return m_raw != other.m_raw; }

private:
    raw_t m_raw;
};

/**
 * @brief 一个页表项（硬件字），PPN位于属性字段之上
 */
template <typename Trait> class PageTableEntry {
public:
    using pte_t = typename Trait::pte_t;
    using pfn_t = PhysicalMemoryInterface::pfn_t;
    using PTE = typename Trait::BITRANGE::PTE;

    constexpr PageTableEntry() : m_raw(0) {}
    explicit constexpr PageTableEntry(pte_t raw) : m_raw(raw) {}

    void set(pfn_t pfn, RawAttribute attr) {
        constexpr unsigned ppn_width = PTE::PPNFULL.first - PTE::PPNFULL.second + 1;
        BOOTMM_ASSERT(
            (pfn >> ppn_width) == 0, "PFN 0x{:x} does not fit in a {} PTE", pfn, Trait::NAME
        );
        m_raw = bits_set(pfn, PTE::PPNFULL) | (attr.raw() & RawAttribute::MASK);
    }

    std::pair<pfn_t, RawAttribute> get() const {
        return {bits_extract(m_raw, PTE::PPNFULL), RawAttribute(m_raw & RawAttribute::MASK)};
    }

    constexpr pte_t raw() const { return m_raw; }

private:
    pte_t m_raw;
};

/**
 * @brief 指向物理内存中某个页表项的可写引用
 */
template <typename Trait> class PteSlot {
public:
    using pte_t = typename Trait::pte_t;
    using paddr_t = PhysicalMemoryInterface::paddr_t;
    using pfn_t = PhysicalMemoryInterface::pfn_t;

    PteSlot(PhysicalMemoryInterface &pmem, paddr_t addr) : m_pmem(&pmem), m_addr(addr) {}

    paddr_t addr() const { return m_addr; }

    PageTableEntry<Trait> load() const {
        pte_t raw = 0;
        BOOTMM_ASSERT(
            m_pmem->read(m_addr, &raw, sizeof(pte_t)) == 0, "Failed to read {} PTE at 0x{:x}",
            Trait::NAME, m_addr
        );
        return PageTableEntry<Trait>(raw);
    }

    void store(PageTableEntry<Trait> entry) {
        pte_t raw = entry.raw();
        BOOTMM_ASSERT(
            m_pmem->write(m_addr, &raw, sizeof(pte_t)) == 0, "Failed to write {} PTE at 0x{:x}",
            Trait::NAME, m_addr
        );
    }

    void set(pfn_t pfn, RawAttribute attr) {
        PageTableEntry<Trait> entry;
        entry.set(pfn, attr);
        store(entry);
    }

    std::pair<pfn_t, RawAttribute> get() const { return load().get(); }

private:
    PhysicalMemoryInterface *m_pmem;
    paddr_t m_addr;
};

// 虚拟地址的高位必须与第VA_BITS-1位相同
template <typename Trait> constexpr bool is_canonical(uint64_t vaddr) {
    const uint64_t upper = vaddr >> (Trait::VA_BITS - 1);
    return upper == 0 || upper == (~0ull >> (Trait::VA_BITS - 1));
}
