#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <new>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

/**
 * @brief 物理内存接口，地址空间为[m_base, m_base + m_size)
 */
class PhysicalMemoryInterface {
public:
    using paddr_t = uint64_t;
    using pfn_t = uint64_t;
    static constexpr size_t PAGESIZE = 4096;
    static constexpr unsigned PAGE_SHIFT = 12;
    const paddr_t m_base;
    const uint64_t m_size;
    PhysicalMemoryInterface(paddr_t base, uint64_t size) : m_base(base), m_size(size) {}
    virtual ~PhysicalMemoryInterface() = default;

    virtual int write(paddr_t addr, const void *src, size_t size) = 0;
    virtual int fill(paddr_t addr, uint8_t value, size_t size) = 0;
    virtual int read(paddr_t addr, void *dst, size_t size) = 0;

    bool contains(paddr_t addr, size_t size = 0) const {
        return addr >= m_base && addr - m_base <= m_size && size <= m_size - (addr - m_base);
    }

    static constexpr pfn_t pfn_of(paddr_t addr) { return addr >> PAGE_SHIFT; }
    static constexpr paddr_t addr_of(pfn_t pfn) { return pfn << PAGE_SHIFT; }
};

/**
 * @brief 用主机内存模拟的RAM，RISC-V virt平台上RAM从0x80000000开始
 */
class PhysicalMemoryBasicSim : public PhysicalMemoryInterface {
public:
    PhysicalMemoryBasicSim(
        paddr_t base = 0x80000000, uint64_t size = (32ull << 20),
        std::shared_ptr<spdlog::logger> logger = nullptr
    )
        : PhysicalMemoryInterface(base, size),
          m_logger(logger ? logger : spdlog::default_logger()) {
        m_mem = new (std::align_val_t(PAGESIZE)) uint8_t[m_size];
        memset(m_mem, 0, m_size);
    }
    ~PhysicalMemoryBasicSim() { operator delete[](m_mem, std::align_val_t(PAGESIZE)); }
    PhysicalMemoryBasicSim(const PhysicalMemoryBasicSim &) = delete;
    PhysicalMemoryBasicSim &operator=(const PhysicalMemoryBasicSim &) = delete;

    int write(paddr_t addr, const void *src, size_t size) override {
        if (addr_check(addr, size)) {
            return -1;
        }
        memcpy(m_mem + (addr - m_base), src, size);
        return 0;
    }
    int fill(paddr_t addr, uint8_t value, size_t size) override {
        if (addr_check(addr, size) != 0) {
            return -1;
        }
        memset(m_mem + (addr - m_base), value, size);
        return 0;
    }
    int read(paddr_t addr, void *dst, size_t size) override {
        if (addr_check(addr, size) != 0) {
            return -1;
        }
        memcpy(dst, m_mem + (addr - m_base), size);
        return 0;
    }

private:
    uint8_t *m_mem;
    std::shared_ptr<spdlog::logger> m_logger;
    int addr_check(paddr_t addr, size_t size = 0) {
        if (!contains(addr, size)) {
            if (size == 0)
                m_logger->error("PMEM addr out of range: 0x{:x}", addr);
            else
                m_logger->error("PMEM addr out of range: 0x{:x} + {}", addr, size);
            return -1;
        }
        return 0;
    }
};
