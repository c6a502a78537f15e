#include "hart.hpp"
#include "panic.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

SimHart::SimHart(
    unsigned hartid, std::shared_ptr<PhysicalMemoryInterface> pmem,
    std::shared_ptr<spdlog::logger> logger
)
    : m_hartid(hartid), m_pmem(pmem), m_logger(logger ? logger : spdlog::default_logger()),
      m_sv39(pmem, m_logger), m_sv48(pmem, m_logger) {}

void SimHart::set_satp(uint64_t mode, uint16_t asid, uint64_t root_pfn) {
    BOOTMM_ASSERT(
        mode == SATP_MODE_BARE || mode == SV39_Trait::SATP_MODE || mode == SV48_Trait::SATP_MODE,
        "Unsupported satp mode {}", mode
    );
    BOOTMM_ASSERT(
        bits_extract(root_pfn, SATP::PPN) == root_pfn, "Root PFN 0x{:x} too wide", root_pfn
    );
    uint64_t satp = bits_set(mode, SATP::MODE);
    satp = bits_set(asid, SATP::ASID, satp);
    satp = bits_set(root_pfn, SATP::PPN, satp);
    m_satp = satp;
    m_logger->info(
        "hart {}: satp <- 0x{:x} (mode {}, root PFN 0x{:x})", m_hartid, m_satp, mode, root_pfn
    );
}

void SimHart::sfence_vma() {
    SPDLOG_LOGGER_DEBUG(
        m_logger, "hart {}: sfence.vma, {} TLB entries dropped", m_hartid, m_tlb.size()
    );
    m_tlb.clear();
}

uint64_t SimHart::mode() const { return bits_extract(m_satp, SATP::MODE); }

uint64_t SimHart::root_pfn() const { return bits_extract(m_satp, SATP::PPN); }

SimHart::paddr_t SimHart::walk(vaddr_t vaddr) const {
    const paddr_t root = PhysicalMemoryInterface::addr_of(root_pfn());
    switch (mode()) {
    case SATP_MODE_BARE:
        return vaddr;
    case SV39_Trait::SATP_MODE:
        return m_sv39.translate(root, vaddr);
    case SV48_Trait::SATP_MODE:
        return m_sv48.translate(root, vaddr);
    default:
        return 0;
    }
}

SimHart::paddr_t SimHart::translate(vaddr_t vaddr) {
    if (mode() == SATP_MODE_BARE) {
        return vaddr;
    }
    const uint64_t vpn = vaddr / PAGESIZE;
    auto it = m_tlb.find(vpn);
    if (it != m_tlb.end()) {
        return it->second + vaddr % PAGESIZE;
    }
    paddr_t paddr = walk(vaddr);
    if (paddr == 0) {
        return 0;
    }
    m_tlb[vpn] = paddr - paddr % PAGESIZE;
    return paddr;
}

int SimHart::write(vaddr_t dst, const void *src_, size_t size) {
    const uint8_t *src = static_cast<const uint8_t *>(src_);
    size_t offset = 0;
    while (offset < size) {
        vaddr_t cur_vaddr = dst + offset;
        size_t chunk =
            std::min(size - offset, static_cast<size_t>(PAGESIZE - cur_vaddr % PAGESIZE));
        paddr_t cur_paddr = translate(cur_vaddr);
        if (cur_paddr == 0) {
            m_logger->error("hart {}: store page fault at 0x{:x}", m_hartid, cur_vaddr);
            return -1;
        }
        if (m_pmem->write(cur_paddr, src + offset, chunk)) {
            return -1;
        }
        offset += chunk;
    }
    return 0;
}

int SimHart::read(vaddr_t src, void *dst_, size_t size) {
    uint8_t *dst = static_cast<uint8_t *>(dst_);
    size_t offset = 0;
    while (offset < size) {
        vaddr_t cur_vaddr = src + offset;
        size_t chunk =
            std::min(size - offset, static_cast<size_t>(PAGESIZE - cur_vaddr % PAGESIZE));
        paddr_t cur_paddr = translate(cur_vaddr);
        if (cur_paddr == 0) {
            m_logger->error("hart {}: load page fault at 0x{:x}", m_hartid, cur_vaddr);
            return -1;
        }
        if (m_pmem->read(cur_paddr, dst + offset, chunk)) {
            return -1;
        }
        offset += chunk;
    }
    return 0;
}
