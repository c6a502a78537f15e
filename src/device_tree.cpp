#include "device_tree.hpp"
#include "panic.hpp"
#include <cstring>
#include <libfdt.h>
#include <spdlog/spdlog.h>
#include <vector>

FdtDeviceTree::FdtDeviceTree(
    std::shared_ptr<PhysicalMemoryInterface> pmem, std::shared_ptr<spdlog::logger> logger
)
    : m_pmem(pmem), m_logger(logger ? logger : spdlog::default_logger()) {}

size_t FdtDeviceTree::count_cpus(paddr_t dtb_addr) {
    struct fdt_header header;
    BOOTMM_ASSERT(
        m_pmem->read(dtb_addr, &header, sizeof(header)) == 0,
        "Failed to parse device tree from dtb_addr 0x{:x}", dtb_addr
    );
    int err = fdt_check_header(&header);
    BOOTMM_ASSERT(
        err == 0, "Failed to parse device tree from dtb_addr 0x{:x}: {}", dtb_addr,
        fdt_strerror(err)
    );

    std::vector<uint8_t> blob(fdt_totalsize(&header));
    BOOTMM_ASSERT(
        m_pmem->read(dtb_addr, blob.data(), blob.size()) == 0,
        "Device tree at 0x{:x} ({} bytes) exceeds physical memory", dtb_addr, blob.size()
    );
    const void *fdt = blob.data();

    int cpus = fdt_path_offset(fdt, "/cpus");
    BOOTMM_ASSERT(cpus >= 0, "Device tree has no /cpus node: {}", fdt_strerror(cpus));

    size_t num_harts = 0;
    int node;
    fdt_for_each_subnode(node, fdt, cpus) {
        int len = 0;
        const char *type = static_cast<const char *>(fdt_getprop(fdt, node, "device_type", &len));
        if (type != nullptr && len > 0 && strncmp(type, "cpu", static_cast<size_t>(len)) == 0) {
            num_harts++;
        }
    }
    BOOTMM_ASSERT(
        node == -FDT_ERR_NOTFOUND, "Malformed /cpus node in device tree: {}", fdt_strerror(node)
    );
    m_logger->info("device tree at 0x{:x}: {} harts", dtb_addr, num_harts);
    return num_harts;
}
