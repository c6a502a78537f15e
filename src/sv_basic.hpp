#pragma once
#include "physical_mem.hpp"
#include "sv_pte.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <spdlog/logger.h>

/**
 * @brief SVxx基本页表翻译（不修改页表），作为对硬件MMU的行为模拟
 */
template <typename Trait> class SV_basic {
public:
    using paddr_t = typename PhysicalMemoryInterface::paddr_t;
    using pfn_t = typename PhysicalMemoryInterface::pfn_t;
    using vaddr_t = typename Trait::vaddr_t;
    using pte_t = typename Trait::pte_t;
    using pagetable_t = paddr_t;
    using BITRANGE = typename Trait::BITRANGE;
    static constexpr int LEVELS = Trait::LEVELS;
    static constexpr size_t PAGESIZE = 4096;

    SV_basic(
        std::shared_ptr<PhysicalMemoryInterface> pmem,
        std::shared_ptr<spdlog::logger> logger = nullptr
    );

    /**
     * @brief 根据SV页表机制，将虚拟地址转换为物理地址
     * @param pagetable_root 根页表的物理地址
     * @param vaddr 要转换的虚拟地址
     * @return 转换后的物理地址(非0)，若转换失败（相当于硬件的page fault）则返回0
     * @note 支持大页，大页的低位PPN不为0时视为失败
     */
    paddr_t translate(pagetable_t pagetable_root, vaddr_t vaddr) const;

protected:
    std::shared_ptr<PhysicalMemoryInterface> pmem;
    std::shared_ptr<spdlog::logger> logger = nullptr;
};
