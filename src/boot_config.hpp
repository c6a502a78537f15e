#pragma once

#include "physical_mem.hpp"
#include "sv39.hpp"
#include "sv48.hpp"
#include <cstddef>
#include <cstdint>

/**
 * @brief 启动时的内存布局（QEMU virt平台）
 */
struct BootConfig {
    using paddr_t = PhysicalMemoryInterface::paddr_t;
    using vaddr_t = uint64_t;

    // simulated RAM
    paddr_t ram_base = 0x80000000;
    uint64_t ram_size = 32ull << 20;

    // frames handed to the buddy allocator
    paddr_t window_start = 0x80400000;
    paddr_t window_end = 0x80700000;

    // kernel image, identity mapped with 2MiB pages
    paddr_t kimage_phys_base = 0x80200000;
    uint64_t kimage_identity_size = 0x1000000;

    // kernel image at its link address, 4KiB pages
    vaddr_t kimage_virt_base = 0xffffffffffc00000;
    uint64_t kimage_virt_size = 0x200000;

    // direct map of physical memory from address 0, 1GiB pages
    vaddr_t phys_map_virt = 0xffffffc000000000;
    uint64_t phys_map_size = 64ull << 30;

    // UART
    paddr_t mmio_base = 0x10000000;
    uint64_t mmio_size = 0x1000;

    // address of the code running across the satp switch
    paddr_t boot_pc = 0x80200000;

    // 0 means no device tree: a single hart
    paddr_t dtb_addr = 0;

    size_t line_buffer_size = 4096;

    template <typename Trait> static BootConfig defaults();
};

template <> inline BootConfig BootConfig::defaults<SV39_Trait>() { return BootConfig{}; }

template <> inline BootConfig BootConfig::defaults<SV48_Trait>() {
    BootConfig config;
    config.phys_map_virt = 0xffffff0000000000;
    config.phys_map_size = 512ull << 30;
    return config;
}
