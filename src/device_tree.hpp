#pragma once

#include "physical_mem.hpp"
#include <cstddef>
#include <memory>
#include <spdlog/logger.h>

/**
 * @brief 设备树查询，启动流程只需要CPU个数
 */
class DeviceTreeQuery {
public:
    using paddr_t = PhysicalMemoryInterface::paddr_t;
    virtual ~DeviceTreeQuery() = default;

    /**
     * @brief 统计设备树中/cpus下device_type为"cpu"的节点数
     * @param dtb_addr 设备树blob的物理地址
     * @note blob格式错误时panic
     */
    virtual size_t count_cpus(paddr_t dtb_addr) = 0;
};

/**
 * @brief 用libfdt解析位于模拟物理内存中的设备树
 */
class FdtDeviceTree : public DeviceTreeQuery {
public:
    explicit FdtDeviceTree(
        std::shared_ptr<PhysicalMemoryInterface> pmem,
        std::shared_ptr<spdlog::logger> logger = nullptr
    );

    size_t count_cpus(paddr_t dtb_addr) override;

private:
    std::shared_ptr<PhysicalMemoryInterface> m_pmem;
    std::shared_ptr<spdlog::logger> m_logger;
};
