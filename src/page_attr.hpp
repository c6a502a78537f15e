#pragma once

#include <cstdint>

/**
 * @brief 与架构无关的属性位集合
 */
template <typename Flag> class FlagSet {
public:
    using bits_t = uint32_t;

    constexpr FlagSet() : m_bits(0) {}
    constexpr FlagSet(Flag flag) : m_bits(static_cast<bits_t>(flag)) {}

    static constexpr FlagSet from_bits(bits_t bits) {
        FlagSet set;
        set.m_bits = bits;
        return set;
    }

    constexpr bits_t bits() const { return m_bits; }
    constexpr bool empty() const { return m_bits == 0; }
    constexpr bool contains(FlagSet other) const { return (m_bits & other.m_bits) == other.m_bits; }
    constexpr bool intersects(FlagSet other) const { return (m_bits & other.m_bits) != 0; }

    constexpr FlagSet operator|(FlagSet other) const { return from_bits(m_bits | other.m_bits); }
    constexpr FlagSet operator&(FlagSet other) const { return from_bits(m_bits & other.m_bits); }
    constexpr FlagSet operator-(FlagSet other) const { return from_bits(m_bits & ~other.m_bits); }
    FlagSet &operator|=(FlagSet other) {
        m_bits |= other.m_bits;
        return *this;
    }
    FlagSet &operator&=(FlagSet other) {
        m_bits &= other.m_bits;
        return *this;
    }

    constexpr bool operator==(FlagSet other) const { return m_bits == other.m_bits; }
    constexpr bool operator!=(FlagSet other) const { return m_bits != other.m_bits; }

private:
    bits_t m_bits;
};

enum class PageFlag : uint32_t {
    PRESENT = 1u << 0,
    READ = 1u << 1,
    WRITE = 1u << 2,
    EXECUTE = 1u << 3,
    USER = 1u << 4,
    GLOBAL = 1u << 5,
    ACCESSED = 1u << 6,
    DIRTY = 1u << 7,
    COPY_ON_WRITE = 1u << 8,
    MAPPED = 1u << 9,
};

// 页表项指向下一级页表时可以携带的属性
enum class TableFlag : uint32_t {
    PRESENT = 1u << 0,
    USER = 1u << 1,
    GLOBAL = 1u << 2,
    ACCESSED = 1u << 3,
};

using PageAttribute = FlagSet<PageFlag>;
using TableAttribute = FlagSet<TableFlag>;

constexpr PageAttribute operator|(PageFlag a, PageFlag b) { return PageAttribute(a) | b; }
constexpr TableAttribute operator|(TableFlag a, TableFlag b) { return TableAttribute(a) | b; }

constexpr PageAttribute PAGE_ATTR_RWX = PageFlag::READ | PageFlag::WRITE | PageFlag::EXECUTE;
