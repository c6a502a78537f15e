#include "sv_basic.hpp"
#include "sv39.hpp"
#include "sv48.hpp"
#include <spdlog/spdlog.h>

template <typename Trait>
SV_basic<Trait>::SV_basic(
    std::shared_ptr<PhysicalMemoryInterface> pmem_, std::shared_ptr<spdlog::logger> logger_
)
    : pmem(pmem_), logger(logger_ ? logger_ : spdlog::default_logger()) {}

template <typename Trait>
typename SV_basic<Trait>::paddr_t SV_basic<Trait>::translate(
    const paddr_t ptroot, const vaddr_t vaddr
) const {
    using PTE = typename BITRANGE::PTE;
    using VA = typename BITRANGE::VA;
    using PA = typename BITRANGE::PA;
    if (ptroot % PAGESIZE != 0) {
        logger->error("{} root pagetable 0x{:x} is not page aligned", Trait::NAME, ptroot);
        return 0;
    }
    if (!is_canonical<Trait>(vaddr)) {
        // If this is hardware MMU, we should raise PAGE-FAULT exception here
        return 0;
    }
    paddr_t ptaddr = ptroot; // the selected-level pagetable base addr
    for (int level = LEVELS - 1; level >= 0; level--) {
        paddr_t pte_addr = ptaddr + bits_extract(vaddr, VA::VPN[level]) * sizeof(pte_t);
        pte_t pte;
        if (pmem->read(pte_addr, &pte, sizeof(pte_t))) {
            logger->error(
                "{} failed to get PTE from PMEM 0x{:x}, ptroot=0x{:x}, vaddr=0x{:x}", Trait::NAME,
                pte_addr, ptroot, vaddr
            );
            return 0;
        }
        if (bits_extract(pte, PTE::V) == 0) {
            // no paddr assigned to this vaddr
            return 0;
        }
        if (bits_extract(pte, PTE::R) == 0 && bits_extract(pte, PTE::W) == 1) {
            logger->error(
                "{} PTE error: R=0 && W=1 PAGE-FAULT, ptroot=0x{:x}, vaddr=0x{:x}", Trait::NAME,
                ptroot, vaddr
            );
            return 0;
        }
        // Already known pte.v == 1
        if (bits_extract(pte, PTE::R) || bits_extract(pte, PTE::X)) {
            // Leaf PTE found, maybe a super-page (level != 0)
            paddr_t paddr = bits_set(bits_extract(vaddr, VA::PAGEOFFSET), PA::PAGEOFFSET, 0ull);
            for (int i = 0; i < level; i++) {
                // lower-level PTE.PPN should be 0
                if (bits_extract(pte, PTE::PPN[i]) != 0ull) {
                    logger->error(
                        "{} PTE error: misaligned superpage PTE.PPN[{}]!=0 PAGE-FAULT, "
                        "ptroot=0x{:x}, vaddr=0x{:x}",
                        Trait::NAME, i, ptroot, vaddr
                    );
                    return 0;
                }
                // lower-level PA.PPN[i] = VA.VPN[i]
                paddr = bits_set(bits_extract(vaddr, VA::VPN[i]), PA::PPN[i], paddr);
            }
            for (int i = LEVELS - 1; i >= level; i--) {
                paddr = bits_set(bits_extract(pte, PTE::PPN[i]), PA::PPN[i], paddr);
            }
            return paddr;
        }
        // Next level PTE found
        if (level == 0) { // already reach final level, next level does not exist
            logger->error(
                "{} PTE error: point to non-exist next level pagetable PAGE-FAULT, "
                "ptroot=0x{:x}, vaddr=0x{:x}",
                Trait::NAME, ptroot, vaddr
            );
            return 0;
        }
        ptaddr = bits_set(bits_extract(pte, PTE::PPNFULL), PA::PPNFULL);
    }
    return 0;
}

template class SV_basic<SV39_Trait>;
template class SV_basic<SV48_Trait>;
