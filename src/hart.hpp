#pragma once

#include "physical_mem.hpp"
#include "sv39.hpp"
#include "sv48.hpp"
#include <cstdint>
#include <memory>
#include <spdlog/logger.h>
#include <unordered_map>
#include <utility>

/**
 * @brief 硬件地址翻译控制：satp写入与TLB刷新
 */
class TranslationControl {
public:
    virtual ~TranslationControl() = default;

    /**
     * @brief 写satp寄存器
     * @param mode 分页模式（0=Bare，8=Sv39，9=Sv48）
     * @param asid 地址空间标识
     * @param root_pfn 根页表的页框号
     */
    virtual void set_satp(uint64_t mode, uint16_t asid, uint64_t root_pfn) = 0;

    // sfence.vma zero, zero
    virtual void sfence_vma() = 0;
};

/**
 * @brief 模拟的RV64 hart：satp寄存器、TLB与基于当前satp的访存
 */
class SimHart : public TranslationControl {
public:
    using paddr_t = PhysicalMemoryInterface::paddr_t;
    using vaddr_t = uint64_t;
    static constexpr size_t PAGESIZE = PhysicalMemoryInterface::PAGESIZE;
    static constexpr uint64_t SATP_MODE_BARE = 0;

    struct SATP {
        static constexpr std::pair<uint8_t, uint8_t> MODE = {63, 60};
        static constexpr std::pair<uint8_t, uint8_t> ASID = {59, 44};
        static constexpr std::pair<uint8_t, uint8_t> PPN = {43, 0};
    };

    SimHart(
        unsigned hartid, std::shared_ptr<PhysicalMemoryInterface> pmem,
        std::shared_ptr<spdlog::logger> logger = nullptr
    );

    void set_satp(uint64_t mode, uint16_t asid, uint64_t root_pfn) override;
    void sfence_vma() override;

    unsigned hartid() const { return m_hartid; }
    uint64_t satp() const { return m_satp; }
    uint64_t mode() const;
    uint64_t root_pfn() const;
    size_t tlb_entries() const { return m_tlb.size(); }

    /**
     * @brief 按当前satp翻译虚拟地址，Bare模式下为恒等映射
     * @return 物理地址，翻译失败（page fault）时返回0
     * @note 翻译结果按4KiB页缓存在TLB中，直到sfence_vma()
     */
    paddr_t translate(vaddr_t vaddr);

    /**
     * @brief 以当前satp向虚拟地址写入数据
     * @return 成功返回0，失败返回-1
     */
    int write(vaddr_t dst, const void *src, size_t size);

    /**
     * @brief 以当前satp从虚拟地址读出数据
     * @return 成功返回0，失败返回-1
     */
    int read(vaddr_t src, void *dst, size_t size);

private:
    const unsigned m_hartid;
    std::shared_ptr<PhysicalMemoryInterface> m_pmem;
    std::shared_ptr<spdlog::logger> m_logger;
    SV39_basic m_sv39;
    SV48_basic m_sv48;
    uint64_t m_satp = 0;
    // vpn -> physical page base
    std::unordered_map<uint64_t, paddr_t> m_tlb;

    paddr_t walk(vaddr_t vaddr) const;
};
