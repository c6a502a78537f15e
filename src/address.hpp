#pragma once

#include <cstdint>

constexpr uint64_t align_down(uint64_t addr, uint64_t align) { return addr & ~(align - 1); }
constexpr uint64_t align_up(uint64_t addr, uint64_t align) {
    return (addr + align - 1) & ~(align - 1);
}

/**
 * @brief 虚拟地址区间[start, start + size)，用长度表示以便覆盖到地址空间顶端
 */
struct VRange {
    uint64_t start = 0;
    uint64_t size = 0;

    static constexpr VRange from(uint64_t start) { return VRange{start, 0}; }
    constexpr VRange grow(uint64_t count) const { return VRange{start, size + count}; }
    constexpr bool empty() const { return size == 0; }
};
